// =================================================================
// src/Switchboard/PolicyStore.cpp
// =================================================================
// Implementation of the cached policy store.

#include "Switchboard/PolicyStore.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"

namespace Switchboard {

std::string policyMatchToString(PolicyMatch match) {
    switch (match) {
        case PolicyMatch::EXACT: return "exact";
        case PolicyMatch::DOMAIN_WILDCARD: return "domain-wildcard";
        case PolicyMatch::GLOBAL_DEFAULT: return "global-default";
        case PolicyMatch::CONFIG_DEFAULT: return "config-default";
        case PolicyMatch::NONE: return "none";
        default: return "none";
    }
}

PolicyStore::PolicyStore(std::shared_ptr<PolicySource> source, const PolicyStoreConfig& config)
    : m_source(std::move(source)), m_config(config) {
    if (!m_source) {
        throw ConfigError("PolicyStore requires a policy source");
    }
    if (m_config.fetch_timeout.count() <= 0) {
        throw ConfigError("Policy fetch timeout must be positive");
    }
}

std::string PolicyStore::getSourceName() const {
    return m_source->getName();
}

bool PolicyStore::hasCachedTable() const {
    return std::atomic_load(&m_table) != nullptr;
}

void PolicyStore::invalidate() {
    m_invalidation_epoch++;
    Logger::getInstance().debug("PolicyStore", "Policy cache invalidated");
}

bool PolicyStore::isFresh(const std::shared_ptr<const PolicyTable>& table) const {
    if (!table || table->epoch != m_invalidation_epoch.load()) {
        return false;
    }
    return std::chrono::steady_clock::now() - table->loaded_at < m_config.cache_ttl;
}

std::shared_ptr<const PolicyStore::PolicyTable> PolicyStore::buildTable(const std::vector<Policy>& policies,
                                                                        uint64_t epoch) {
    auto table = std::make_shared<PolicyTable>();
    table->loaded_at = std::chrono::steady_clock::now();
    table->version = ++m_table_version;
    table->epoch = epoch;

    for (const auto& policy : policies) {
        try {
            validatePolicy(policy);
        } catch (const ConfigError& e) {
            Logger::getInstance().warning("PolicyStore", "Skipping invalid policy: " + std::string(e.what()));
            continue;
        }

        Policy normalized = policy;
        normalized.domain = normalizeTaskLabel(policy.domain);
        normalized.action = normalizeTaskLabel(policy.action);

        PolicyKey key{normalized.domain, normalized.action};
        auto existing = table->policies.find(key);
        if (existing == table->policies.end() || normalized.priority > existing->second.priority) {
            table->policies[key] = std::move(normalized);
        }
    }

    return table;
}

std::shared_ptr<const PolicyStore::PolicyTable> PolicyStore::currentTable(const CancellationToken* token,
                                                                          bool& stale) {
    stale = false;
    auto table = std::atomic_load(&m_table);
    if (isFresh(table)) {
        return table;
    }

    std::unique_lock<std::mutex> refresh_lock(m_refresh_mutex, std::try_to_lock);
    if (!refresh_lock.owns_lock()) {
        if (table) {
            // Another caller is refreshing
            stale = true;
            return table;
        }
        refresh_lock.lock();
    }

    table = std::atomic_load(&m_table);
    if (isFresh(table)) {
        return table;
    }

    if (token) {
        token->throwIfCancelled("policy lookup");
    }

    auto source = m_source;
    uint64_t epoch = m_invalidation_epoch.load();
    try {
        auto policies = runWithDeadline<std::vector<Policy>>(
            [source]() { return source->fetchAll(); },
            m_config.fetch_timeout, token, "Policy fetch from " + source->getName());

        auto fresh_table = buildTable(policies, epoch);
        std::atomic_store(&m_table, fresh_table);
        m_refresh_count++;

        Logger::getInstance().debug("PolicyStore",
            "Loaded " + std::to_string(fresh_table->policies.size()) + " policies from " + source->getName());
        return fresh_table;
    } catch (const Cancelled&) {
        throw;
    } catch (const std::exception& e) {
        m_fetch_failures++;
        if (table) {
            Logger::getInstance().warning("PolicyStore",
                "Policy fetch failed, serving cached table", e.what());
            stale = true;
            return table;
        }
        throw PolicyUnavailable("Policy store " + source->getName() + " unavailable and nothing cached: " +
                                e.what());
    }
}

PolicyLookup PolicyStore::resolve(const PolicyTable& table, const std::string& domain,
                                  const std::string& action) const {
    PolicyLookup lookup;
    lookup.table_version = table.version;

    auto exact = table.policies.find(PolicyKey{domain, action});
    if (exact != table.policies.end()) {
        lookup.model_ids = exact->second.model_ids;
        lookup.match = PolicyMatch::EXACT;
        return lookup;
    }

    auto domain_wildcard = table.policies.find(PolicyKey{domain, kPolicyWildcard});
    if (domain_wildcard != table.policies.end()) {
        lookup.model_ids = domain_wildcard->second.model_ids;
        lookup.match = PolicyMatch::DOMAIN_WILDCARD;
        return lookup;
    }

    auto global = table.policies.find(PolicyKey{kPolicyWildcard, kPolicyWildcard});
    if (global != table.policies.end()) {
        lookup.model_ids = global->second.model_ids;
        lookup.match = PolicyMatch::GLOBAL_DEFAULT;
        return lookup;
    }

    if (!m_config.default_models.empty()) {
        lookup.model_ids = m_config.default_models;
        lookup.match = PolicyMatch::CONFIG_DEFAULT;
        return lookup;
    }

    lookup.match = PolicyMatch::NONE;
    return lookup;
}

PolicyLookup PolicyStore::getCandidates(const std::string& domain, const std::string& action,
                                        const CancellationToken* token) {
    bool stale = false;
    auto table = currentTable(token, stale);

    PolicyLookup lookup = resolve(*table, normalizeTaskLabel(domain), normalizeTaskLabel(action));
    lookup.stale = stale;
    return lookup;
}

std::vector<Policy> PolicyStore::listPolicies(const CancellationToken* token) {
    bool stale = false;
    auto table = currentTable(token, stale);

    std::vector<Policy> policies;
    policies.reserve(table->policies.size());
    for (const auto& [key, policy] : table->policies) {
        policies.push_back(policy);
    }
    return policies;
}

void PolicyStore::upsertPolicy(const Policy& policy) {
    Policy normalized = policy;
    normalized.domain = normalizeTaskLabel(policy.domain);
    normalized.action = normalizeTaskLabel(policy.action);

    validatePolicy(normalized);
    m_source->upsert(normalized);
    invalidate();
    Logger::getInstance().info("PolicyStore", "Upserted policy " + normalized.domain + "/" + normalized.action);
}

bool PolicyStore::removePolicy(const std::string& domain, const std::string& action) {
    const std::string key_domain = normalizeTaskLabel(domain);
    const std::string key_action = normalizeTaskLabel(action);

    bool removed = m_source->remove(key_domain, key_action);
    if (removed) {
        invalidate();
        Logger::getInstance().info("PolicyStore", "Removed policy " + key_domain + "/" + key_action);
    }
    return removed;
}

} // namespace Switchboard
