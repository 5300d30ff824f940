// =================================================================
// src/Switchboard/DifficultyMapping.cpp
// =================================================================
// Implementation of the linear difficulty mapping.

#include "Switchboard/DifficultyMapping.hpp"
#include "Switchboard/Errors.hpp"
#include <cmath>

namespace Switchboard {

LinearDifficultyMapping::LinearDifficultyMapping(std::vector<double> scale, std::vector<double> offset)
    : m_scale(std::move(scale)), m_offset(std::move(offset)) {
    const size_t dim = QueryFeatures::kDimension;

    if (m_scale.empty()) {
        m_scale.assign(dim, 1.0);
    }
    if (m_offset.empty()) {
        m_offset.assign(dim, 0.0);
    }
    if (m_scale.size() != dim || m_offset.size() != dim) {
        throw ConfigError("Difficulty scale and offset must have " + std::to_string(dim) + " entries");
    }
    for (size_t i = 0; i < dim; ++i) {
        if (!std::isfinite(m_scale[i]) || !std::isfinite(m_offset[i])) {
            throw ConfigError("Difficulty scale and offset must be finite");
        }
    }
}

std::vector<double> LinearDifficultyMapping::map(const QueryFeatures& features) const {
    std::vector<double> values = features.toVector();
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = m_scale[i] * values[i] + m_offset[i];
    }
    return values;
}

size_t LinearDifficultyMapping::dimension() const {
    return QueryFeatures::kDimension;
}

std::string LinearDifficultyMapping::getName() const {
    return "linear";
}

} // namespace Switchboard
