// =================================================================
// include/Switchboard/ScoringEngine.hpp
// =================================================================
// Cost-quality scoring and ranking of live candidates.

#pragma once

#include "Switchboard/AbilityStore.hpp"
#include "Switchboard/DifficultyMapping.hpp"
#include "Switchboard/FeatureExtractor.hpp"
#include "Switchboard/ModelCapabilities.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Scoring parameters
 */
struct ScoringConfig {
    double missing_ability_penalty = 1.0;   ///< Subtracted from the logit when a model has no ability vector
    double cost_weight = 0.1;               ///< Weight of cost per million tokens in the denominator
    double fixed_overhead = 1.0;            ///< Constant added to the weighted cost
    double cost_epsilon = 1e-6;             ///< Floor of the denominator
    double probability_floor = 1e-9;        ///< Keeps p strictly inside (0, 1)
};

/**
 * @brief A live model to be scored
 */
struct ScoringCandidate {
    ModelInfo model;
    size_t declared_rank = 0;   ///< Position in the matched policy list
};

/**
 * @brief Score of one candidate
 */
struct CandidateScore {
    std::string model_id;
    std::string executor_id;
    double logit = 0.0;
    double success_probability = 0.0;    ///< In (0, 1)
    double weighted_score = 0.0;         ///< p divided by the cost term
    double cost_per_million_tokens = 0.0;
    size_t declared_rank = 0;
    bool ability_missing = false;        ///< Scored with a zero vector and the penalty
    std::string explanation;
};

/**
 * @brief Ranks candidates by predicted success per unit cost
 *
 * logit = sum_i w_i * (ability_i - difficulty_i) - penalty_if_missing
 * p = sigmoid(logit)
 * weighted = p / max(epsilon, fixed_overhead + cost_weight * cost)
 *
 * Order: weighted score descending, then declared rank, then model id,
 * then executor id.
 */
class ScoringEngine {
public:
    /**
     * @param abilities Checkpoint holder, must match the mapping dimension
     * @param mapping Difficulty mapping, null for LinearDifficultyMapping
     * @throws ConfigError on mismatched dimensions, a negative penalty, cost
     *         weight or overhead, or an out-of-range epsilon or probability floor
     */
    ScoringEngine(std::shared_ptr<AbilityStore> abilities,
                  std::shared_ptr<const DifficultyMapping> mapping = nullptr,
                  const ScoringConfig& config = ScoringConfig());

    /**
     * @brief Score and rank candidates
     *
     * Every candidate is scored; models without an ability vector are
     * penalized rather than dropped. Explanations cite the classification
     * and compare each candidate with its neighbour in the ranking.
     * @throws ConfigError if the mapping output or an ability vector does not
     *         have the checkpoint's dimension
     */
    std::vector<CandidateScore> score(const std::vector<ScoringCandidate>& candidates,
                                      const QueryFeatures& features,
                                      const Classification& classification) const;

    /**
     * @brief Strict ranking order used by score()
     */
    static bool ranksBefore(const CandidateScore& a, const CandidateScore& b);

    const ScoringConfig& getConfig() const { return m_config; }
    const DifficultyMapping& getMapping() const { return *m_mapping; }
    std::shared_ptr<AbilityStore> getAbilityStore() const { return m_abilities; }

private:
    std::shared_ptr<AbilityStore> m_abilities;
    std::shared_ptr<const DifficultyMapping> m_mapping;
    ScoringConfig m_config;

    double sigmoid(double logit) const;
};

} // namespace Switchboard
