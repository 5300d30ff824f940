// =================================================================
// include/Switchboard/PolicyStore.hpp
// =================================================================
// TTL-cached policy lookups with most-specific-match resolution.

#pragma once

#include "Switchboard/Cancellation.hpp"
#include "Switchboard/PolicySource.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace Switchboard {

/**
 * @brief Which resolution level produced a candidate list
 */
enum class PolicyMatch {
    EXACT,            ///< (domain, action)
    DOMAIN_WILDCARD,  ///< (domain, *)
    GLOBAL_DEFAULT,   ///< (*, *)
    CONFIG_DEFAULT,   ///< Default list from the service configuration
    NONE              ///< Nothing matched
};

std::string policyMatchToString(PolicyMatch match);

/**
 * @brief Result of a candidate lookup
 */
struct PolicyLookup {
    std::vector<std::string> model_ids;   ///< Ordered, most preferred first
    PolicyMatch match = PolicyMatch::NONE;
    bool stale = false;                   ///< Served from an expired table
    uint64_t table_version = 0;
};

/**
 * @brief Cache settings
 */
struct PolicyStoreConfig {
    std::chrono::milliseconds cache_ttl{30000};     ///< Table lifetime before refetch
    std::chrono::milliseconds fetch_timeout{500};   ///< Bound on each source fetch
    std::vector<std::string> default_models;        ///< Used when no (*, *) policy exists
};

/**
 * @brief Read-mostly policy cache in front of a PolicySource
 *
 * The table is an immutable object behind an atomically swapped pointer.
 * One caller refreshes an expired table while the others keep reading the
 * previous one; a failed refresh keeps serving the last good table.
 */
class PolicyStore {
public:
    explicit PolicyStore(std::shared_ptr<PolicySource> source,
                         const PolicyStoreConfig& config = PolicyStoreConfig());

    /**
     * @brief Resolve the candidate list for a label
     *
     * Order: exact, then (domain, *), then (*, *), then the configured
     * default list, then empty.
     *
     * @throws PolicyUnavailable if the source fails and no table was ever loaded
     * @throws Cancelled if the token fires while a fetch is pending
     */
    PolicyLookup getCandidates(const std::string& domain,
                               const std::string& action,
                               const CancellationToken* token = nullptr);

    /**
     * @brief Force the next lookup to refetch
     */
    void invalidate();

    /**
     * @brief All policies in the current table, sorted by (domain, action)
     */
    std::vector<Policy> listPolicies(const CancellationToken* token = nullptr);

    /**
     * @brief Create or replace a policy in the source and invalidate the cache
     * @throws ConfigError if the policy is malformed
     */
    void upsertPolicy(const Policy& policy);

    /**
     * @brief Delete a policy from the source and invalidate the cache
     * @return True if a policy was removed
     */
    bool removePolicy(const std::string& domain, const std::string& action);

    bool hasCachedTable() const;
    size_t getRefreshCount() const { return m_refresh_count.load(); }
    size_t getFetchFailureCount() const { return m_fetch_failures.load(); }

    const PolicyStoreConfig& getConfig() const { return m_config; }
    std::string getSourceName() const;

private:
    using PolicyKey = std::pair<std::string, std::string>;

    struct PolicyTable {
        std::map<PolicyKey, Policy> policies;
        std::chrono::steady_clock::time_point loaded_at;
        uint64_t version = 0;
        uint64_t epoch = 0;   ///< Invalidation epoch the fetch started in
    };

    std::shared_ptr<PolicySource> m_source;
    PolicyStoreConfig m_config;

    std::shared_ptr<const PolicyTable> m_table;
    std::atomic<uint64_t> m_invalidation_epoch{0};
    std::atomic<uint64_t> m_table_version{0};
    std::atomic<size_t> m_refresh_count{0};
    std::atomic<size_t> m_fetch_failures{0};
    std::mutex m_refresh_mutex;

    std::shared_ptr<const PolicyTable> currentTable(const CancellationToken* token, bool& stale);
    bool isFresh(const std::shared_ptr<const PolicyTable>& table) const;
    std::shared_ptr<const PolicyTable> buildTable(const std::vector<Policy>& policies, uint64_t epoch);
    PolicyLookup resolve(const PolicyTable& table, const std::string& domain, const std::string& action) const;
};

} // namespace Switchboard
