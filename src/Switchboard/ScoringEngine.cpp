// =================================================================
// src/Switchboard/ScoringEngine.cpp
// =================================================================
// Implementation of candidate scoring and ranking.

#include "Switchboard/ScoringEngine.hpp"
#include "Switchboard/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace Switchboard {

ScoringEngine::ScoringEngine(std::shared_ptr<AbilityStore> abilities,
                             std::shared_ptr<const DifficultyMapping> mapping,
                             const ScoringConfig& config)
    : m_abilities(std::move(abilities)), m_mapping(std::move(mapping)), m_config(config) {
    if (!m_abilities) {
        throw ConfigError("ScoringEngine requires an ability store");
    }
    if (!m_mapping) {
        m_mapping = std::make_shared<LinearDifficultyMapping>();
    }
    if (m_mapping->dimension() != m_abilities->getExpectedDimension()) {
        throw ConfigError("Difficulty mapping dimension " + std::to_string(m_mapping->dimension()) +
                          " does not match ability dimension " +
                          std::to_string(m_abilities->getExpectedDimension()));
    }
    if (m_config.missing_ability_penalty < 0.0 || m_config.cost_weight < 0.0 ||
        m_config.fixed_overhead < 0.0) {
        throw ConfigError("Scoring penalty, cost weight and overhead must be non-negative");
    }
    if (m_config.cost_epsilon <= 0.0) {
        throw ConfigError("Scoring cost epsilon must be positive");
    }
    if (m_config.probability_floor <= 0.0 || m_config.probability_floor >= 0.5) {
        throw ConfigError("Scoring probability floor must be in (0, 0.5)");
    }
}

double ScoringEngine::sigmoid(double logit) const {
    double p = 1.0 / (1.0 + std::exp(-logit));
    if (std::isnan(p)) {
        p = 0.5;
    }
    return std::max(m_config.probability_floor, std::min(1.0 - m_config.probability_floor, p));
}

bool ScoringEngine::ranksBefore(const CandidateScore& a, const CandidateScore& b) {
    if (a.weighted_score != b.weighted_score) {
        return a.weighted_score > b.weighted_score;
    }
    if (a.declared_rank != b.declared_rank) {
        return a.declared_rank < b.declared_rank;
    }
    if (a.model_id != b.model_id) {
        return a.model_id < b.model_id;
    }
    return a.executor_id < b.executor_id;
}

std::vector<CandidateScore> ScoringEngine::score(const std::vector<ScoringCandidate>& candidates,
                                                 const QueryFeatures& features,
                                                 const Classification& classification) const {
    auto checkpoint = m_abilities->current();
    std::vector<double> difficulty = m_mapping->map(features);
    if (difficulty.size() != checkpoint->weights.size()) {
        throw ConfigError("Difficulty mapping " + m_mapping->getName() + " returned " +
                          std::to_string(difficulty.size()) + " entries, checkpoint " + checkpoint->version +
                          " expects " + std::to_string(checkpoint->weights.size()));
    }
    const std::vector<double> zero_ability(difficulty.size(), 0.0);

    std::vector<CandidateScore> scores;
    scores.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        CandidateScore result;
        result.model_id = candidate.model.id;
        result.executor_id = candidate.model.executor_id;
        result.declared_rank = candidate.declared_rank;
        result.cost_per_million_tokens = std::max(0.0, candidate.model.cost_per_million_tokens);

        const std::vector<double>* ability = checkpoint->findAbility(candidate.model.id);
        if (!ability) {
            result.ability_missing = true;
            ability = &zero_ability;
        } else if (ability->size() != difficulty.size()) {
            throw ConfigError("Ability vector of " + candidate.model.id + " has " +
                              std::to_string(ability->size()) + " entries, expected " +
                              std::to_string(difficulty.size()));
        }

        double logit = 0.0;
        for (size_t i = 0; i < difficulty.size(); ++i) {
            logit += checkpoint->weights[i] * ((*ability)[i] - difficulty[i]);
        }
        if (result.ability_missing) {
            logit -= m_config.missing_ability_penalty;
        }
        result.logit = logit;
        result.success_probability = sigmoid(logit);

        double denominator = std::max(m_config.cost_epsilon,
            m_config.fixed_overhead + m_config.cost_weight * result.cost_per_million_tokens);
        result.weighted_score = result.success_probability / denominator;

        scores.push_back(result);
    }

    std::sort(scores.begin(), scores.end(), ranksBefore);

    for (size_t i = 0; i < scores.size(); ++i) {
        CandidateScore& current = scores[i];
        std::stringstream ss;
        ss << std::fixed << std::setprecision(4);
        ss << current.model_id << " for " << classification.domain << "/" << classification.action;
        if (classification.is_fallback) {
            ss << " (fallback classification)";
        }
        ss << ": p=" << current.success_probability
           << " cost=" << std::setprecision(2) << current.cost_per_million_tokens << "/Mtok"
           << std::setprecision(4) << " weighted=" << current.weighted_score;
        if (current.ability_missing) {
            ss << " [no ability vector, penalty " << m_config.missing_ability_penalty << "]";
        }

        ss << "; rank " << (i + 1) << " of " << scores.size();
        if (scores.size() == 1) {
            ss << ", only candidate";
        } else if (i == 0) {
            const CandidateScore& next = scores[1];
            ss << ", ahead of " << next.model_id << " (weighted " << next.weighted_score
               << ", p=" << next.success_probability << ")";
        } else {
            const CandidateScore& previous = scores[i - 1];
            ss << ", behind " << previous.model_id << " (weighted " << previous.weighted_score
               << ", p=" << previous.success_probability << ")";
        }
        if (i > 0 && current.weighted_score == scores[i - 1].weighted_score) {
            ss << ", tie broken by policy order then model id";
        }
        current.explanation = ss.str();
    }

    return scores;
}

} // namespace Switchboard
