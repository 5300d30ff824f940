// =================================================================
// src/Switchboard/Router.cpp
// =================================================================
// Implementation of the routing pipeline and fallback selection.

#include "Switchboard/Router.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace Switchboard {

namespace {

std::string generateRequestId() {
    // Same uniqueness scheme as decision ids, distinguishable by prefix
    return "req-" + DecisionLog::generateDecisionId().substr(4);
}

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

std::string describeClassification(const Classification& classification) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (classification.is_fallback) {
        ss << "Fallback classification " << classification.domain << "/" << classification.action;
    } else {
        ss << "Classified as " << classification.domain << "/" << classification.action
           << " (confidence " << classification.confidence << ", " << classification.source << ")";
    }
    return ss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// RoutingSession

std::set<std::string> RoutingSession::getExcluded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_excluded;
}

size_t RoutingSession::getAttemptCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attempts;
}

DecisionRecord RoutingSession::buildRecord() const {
    DecisionRecord record;
    record.decision_id = DecisionLog::generateDecisionId();
    record.request_id = m_request_id;
    record.prompt = m_prompt;
    record.context_turns = m_context_turns;
    record.classification = m_classification;
    record.features = m_features;
    record.policy_candidates = m_policy_candidates;
    record.policy_match = m_policy_match;
    record.policy_stale = m_policy_stale;
    record.scores = m_ranked;
    record.created_at = std::chrono::system_clock::now();
    return record;
}

void RoutingSession::writeRecord(DecisionRecord record) const {
    if (!m_decision_log) {
        return;
    }
    std::string decision_id = record.decision_id;
    if (!m_decision_log->append(std::move(record))) {
        Logger::getInstance().warning("Router", "Decision log full, dropped record " + decision_id);
    }
}

RoutingDecision RoutingSession::select(const std::set<std::string>& excluded) {
    auto start_time = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(m_mutex);

    m_excluded.insert(excluded.begin(), excluded.end());
    m_attempts++;

    std::vector<CandidateScore> remaining;
    for (const auto& candidate : m_ranked) {
        if (m_excluded.count(candidate.model_id) == 0) {
            remaining.push_back(candidate);
        }
    }

    // The first attempt carries the cost of the whole pipeline
    auto latency = elapsedSince(start_time);
    if (m_attempts == 1) {
        latency += m_pipeline_latency;
    }

    DecisionRecord record = buildRecord();
    record.attempt = m_attempts;
    record.excluded_model_ids.assign(m_excluded.begin(), m_excluded.end());
    record.latency = latency;

    if (remaining.empty()) {
        record.error = errorCodeToString(ErrorCode::NO_ELIGIBLE_CANDIDATES);
        writeRecord(std::move(record));
        Logger::getInstance().logRoutingDecision("", 0, m_classification.domain, m_classification.action,
                                                 static_cast<long>(latency.count()), m_classification.is_fallback);
        throw NoEligibleCandidates("All " + std::to_string(m_ranked.size()) +
                                   " ranked candidates for request " + m_request_id + " have been excluded");
    }

    const CandidateScore& winner = remaining.front();

    RoutingDecision decision;
    decision.decision_id = record.decision_id;
    decision.request_id = m_request_id;
    decision.attempt = m_attempts;
    decision.selected_model = winner.model_id;
    decision.selected_executor = winner.executor_id;
    decision.candidates = remaining;
    decision.classification = m_classification;
    decision.features = m_features;
    decision.policy_match = m_policy_match;
    decision.policy_stale = m_policy_stale;
    decision.latency = latency;
    decision.confidence = winner.success_probability;

    std::stringstream reasoning;
    reasoning << describeClassification(m_classification) << "; " << m_merge_summary;
    if (m_attempts > 1) {
        reasoning << "; attempt " << m_attempts << " after excluding " << m_excluded.size() << " model(s)";
    }
    reasoning << "; " << winner.explanation;
    decision.reasoning = reasoning.str();

    record.selected_model_id = winner.model_id;
    record.selected_executor_id = winner.executor_id;
    writeRecord(std::move(record));

    Logger::getInstance().logRoutingDecision(winner.model_id, remaining.size(), m_classification.domain,
                                             m_classification.action, static_cast<long>(latency.count()),
                                             m_classification.is_fallback);
    return decision;
}

// ---------------------------------------------------------------------------
// Router

Router::Router(std::shared_ptr<ExecutorRegistry> registry,
               std::shared_ptr<PolicyStore> policies,
               std::shared_ptr<TaskClassifier> classifier,
               std::shared_ptr<ScoringEngine> scoring,
               std::shared_ptr<FeatureExtractor> features,
               std::shared_ptr<DecisionLog> decision_log)
    : m_registry(std::move(registry)),
      m_policies(std::move(policies)),
      m_classifier(std::move(classifier)),
      m_scoring(std::move(scoring)),
      m_features(std::move(features)),
      m_decision_log(std::move(decision_log)) {
    if (!m_registry || !m_policies || !m_classifier || !m_scoring || !m_features) {
        throw ConfigError("Router requires a registry, policy store, classifier, scoring engine "
                          "and feature extractor");
    }
}

Classification Router::classifyOrFallback(const RouteRequest& request, const CancellationToken* token) const {
    try {
        return m_classifier->classify(request.prompt, request.context, token);
    } catch (const ClassificationTimeout& e) {
        Logger::getInstance().warning("Router", "Classifier timed out, using fallback classification", e.what());
        return m_classifier->fallback("timeout");
    } catch (const ClassificationFailed& e) {
        Logger::getInstance().warning("Router", "Classifier failed, using fallback classification", e.what());
        return m_classifier->fallback(std::string("failure: ") + e.what());
    }
}

void Router::recordFailure(const RoutingSession& session, const std::string& error,
                           std::chrono::milliseconds latency) const {
    DecisionRecord record = session.buildRecord();
    record.excluded_model_ids.assign(session.m_excluded.begin(), session.m_excluded.end());
    record.error = error;
    record.latency = latency;
    session.writeRecord(std::move(record));

    Logger::getInstance().logRoutingDecision("", 0, session.m_classification.domain,
                                             session.m_classification.action,
                                             static_cast<long>(latency.count()),
                                             session.m_classification.is_fallback);
}

std::unique_ptr<RoutingSession> Router::beginSession(const RouteRequest& request) const {
    auto start_time = std::chrono::steady_clock::now();
    const CancellationToken* token = request.cancellation.get();

    if (token) {
        token->throwIfCancelled("routing");
    }

    auto session = std::make_unique<RoutingSession>(RoutingSession::ConstructionKey());
    session->m_decision_log = m_decision_log;
    session->m_request_id = generateRequestId();
    session->m_prompt = request.prompt;
    session->m_context_turns = request.context.size();
    session->m_excluded = request.excluded_model_ids;

    // Classify
    session->m_features = m_features->extract(request.prompt, request.context);
    session->m_classification = classifyOrFallback(request, token);

    // LookupPolicy
    PolicyLookup lookup;
    try {
        lookup = m_policies->getCandidates(session->m_classification.domain,
                                           session->m_classification.action, token);
    } catch (const PolicyUnavailable& e) {
        session->m_policy_match = policyMatchToString(PolicyMatch::NONE);
        recordFailure(*session, errorCodeToString(ErrorCode::POLICY_UNAVAILABLE), elapsedSince(start_time));
        throw NoEligibleCandidates(std::string("No candidates: ") + e.what());
    }
    session->m_policy_candidates = lookup.model_ids;
    session->m_policy_match = policyMatchToString(lookup.match);
    session->m_policy_stale = lookup.stale;

    // Merge with the live registry view
    auto snapshot = m_registry->snapshot();
    std::vector<ScoringCandidate> pool;
    std::set<std::string> seen;
    size_t not_live = 0;
    size_t excluded = 0;
    for (size_t rank = 0; rank < lookup.model_ids.size(); ++rank) {
        const std::string& model_id = lookup.model_ids[rank];
        if (!seen.insert(model_id).second) {
            continue;
        }
        if (session->m_excluded.count(model_id) > 0) {
            excluded++;
            continue;
        }
        const ModelInfo* model = snapshot->findHealthyModel(model_id);
        if (!model) {
            not_live++;
            continue;
        }
        ScoringCandidate candidate;
        candidate.model = *model;
        candidate.declared_rank = rank;
        pool.push_back(candidate);
    }

    std::stringstream merge_summary;
    merge_summary << "policy " << session->m_policy_match << (lookup.stale ? " (stale)" : "")
                  << " listed " << seen.size() << ", " << pool.size() << " live";
    if (not_live > 0) {
        merge_summary << ", " << not_live << " not live";
    }
    if (excluded > 0) {
        merge_summary << ", " << excluded << " excluded";
    }
    session->m_merge_summary = merge_summary.str();

    if (pool.empty()) {
        recordFailure(*session, errorCodeToString(ErrorCode::NO_ELIGIBLE_CANDIDATES), elapsedSince(start_time));
        throw NoEligibleCandidates("No live candidates for " + session->m_classification.domain + "/" +
                                   session->m_classification.action + ": " + session->m_merge_summary);
    }

    if (token) {
        token->throwIfCancelled("scoring");
    }

    // Score
    session->m_ranked = m_scoring->score(pool, session->m_features, session->m_classification);
    session->m_pipeline_latency = elapsedSince(start_time);

    Logger::getInstance().debug("Router",
        "Request " + session->m_request_id + ": " + session->m_merge_summary + ", top candidate " +
        session->m_ranked.front().model_id);

    return session;
}

RoutingDecision Router::route(const RouteRequest& request) const {
    auto session = beginSession(request);
    return session->select();
}

} // namespace Switchboard
