// =================================================================
// include/Switchboard/DifficultyMapping.hpp
// =================================================================
// Replaceable mapping from query features to a difficulty vector.

#pragma once

#include "Switchboard/FeatureExtractor.hpp"
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Maps query features onto the ability space
 *
 * The returned vector must have dimension() entries and is compared
 * element-wise against a model's ability vector.
 */
class DifficultyMapping {
public:
    virtual ~DifficultyMapping() = default;

    virtual std::vector<double> map(const QueryFeatures& features) const = 0;

    virtual size_t dimension() const = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief difficulty[i] = scale[i] * feature[i] + offset[i]
 *
 * Features are the normalized QueryFeatures::toVector() entries. With the
 * default unit scale and zero offset the difficulty equals the features.
 */
class LinearDifficultyMapping : public DifficultyMapping {
public:
    /**
     * @param scale Per-dimension scale, empty for all ones
     * @param offset Per-dimension offset, empty for all zeros
     * @throws ConfigError if a non-empty vector has the wrong size
     */
    explicit LinearDifficultyMapping(std::vector<double> scale = {}, std::vector<double> offset = {});

    std::vector<double> map(const QueryFeatures& features) const override;
    size_t dimension() const override;
    std::string getName() const override;

    const std::vector<double>& getScale() const { return m_scale; }
    const std::vector<double>& getOffset() const { return m_offset; }

private:
    std::vector<double> m_scale;
    std::vector<double> m_offset;
};

} // namespace Switchboard
