// =================================================================
// include/Switchboard/AbilityStore.hpp
// =================================================================
// Versioned per-model ability checkpoints and their atomic swap.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Switchboard {

/**
 * @brief Read-only ability parameters loaded from a checkpoint file
 *
 * JSON layout: {"version": ..., "dimension": N, "weights": [N numbers],
 * "abilities": {"<model id>": [N numbers], ...}}
 */
struct AbilityCheckpoint {
    std::string version;
    size_t dimension = 0;
    std::vector<double> weights;
    std::unordered_map<std::string, std::vector<double>> abilities;
    std::string source_path;   ///< Empty for built-in checkpoints

    /**
     * @brief Ability vector for a model
     * @return Pointer into this checkpoint, or nullptr if the model has none
     */
    const std::vector<double>* findAbility(const std::string& model_id) const;

    /**
     * @brief Parse and validate a checkpoint document
     * @throws CheckpointError on malformed JSON, wrong sizes or non-finite values
     */
    static AbilityCheckpoint fromJson(const std::string& text);

    /**
     * @brief Read and parse a checkpoint file
     * @throws CheckpointError if the file cannot be read or parsed
     */
    static AbilityCheckpoint loadFile(const std::string& path);

    /**
     * @brief Checkpoint with unit weights and no model abilities
     */
    static AbilityCheckpoint uniform(size_t dimension);
};

/**
 * @brief Holder for the current checkpoint
 *
 * Scoring reads the current pointer without locking; reload() validates the
 * new checkpoint completely before swapping it in.
 */
class AbilityStore {
public:
    /**
     * @param expected_dimension Dimension every checkpoint must have
     * @param initial Starting checkpoint, or null for a uniform one
     */
    explicit AbilityStore(size_t expected_dimension,
                          std::shared_ptr<const AbilityCheckpoint> initial = nullptr);

    std::shared_ptr<const AbilityCheckpoint> current() const;

    /**
     * @brief Swap in a checkpoint
     * @throws CheckpointError if its dimension does not match
     */
    void replace(std::shared_ptr<const AbilityCheckpoint> checkpoint);

    /**
     * @brief Load a checkpoint file and swap it in
     * @throws CheckpointError on failure; the current checkpoint is kept
     */
    void load(const std::string& path);

    /**
     * @brief Like load(), but reports failure instead of throwing
     * @return True if the new checkpoint is now current
     */
    bool reload(const std::string& path);

    size_t getExpectedDimension() const { return m_expected_dimension; }

    std::string describe() const;

private:
    size_t m_expected_dimension;
    std::shared_ptr<const AbilityCheckpoint> m_current;
};

} // namespace Switchboard
