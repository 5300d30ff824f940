// =================================================================
// include/Switchboard/PolicySource.hpp
// =================================================================
// Routing policies and the backing stores they are loaded from.

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Wildcard used for "any action" and "any domain"
 */
inline const std::string kPolicyWildcard = "*";

/**
 * @brief Operator-managed routing policy
 *
 * Unique per (domain, action). Model ids need not be live; liveness is
 * checked when candidates are merged with the registry snapshot.
 */
struct Policy {
    std::string domain;                  ///< Task domain or "*"
    std::string action;                  ///< Task action or "*"
    std::vector<std::string> model_ids;  ///< Preferred models, most preferred first
    int priority = 0;                    ///< Wins over lower priorities for the same key
};

/**
 * @brief Canonical form of a domain or action label
 *
 * Trimmed, lowercase, with '_' and ' ' turned into '-'. The wildcard "*"
 * is returned unchanged.
 */
std::string normalizeTaskLabel(const std::string& label);

/**
 * @brief Check a policy for structural problems
 * @throws ConfigError on empty domain/action, empty model list or duplicate ids
 */
void validatePolicy(const Policy& policy);

/**
 * @brief Remote or file-backed policy store
 *
 * fetchAll() is the read path used to fill the router's cache; the
 * remaining methods are the operator CRUD surface and are never called
 * while routing.
 */
class PolicySource {
public:
    virtual ~PolicySource() = default;

    /**
     * @brief Load the complete policy table
     * @throws std::exception when the store is unavailable
     */
    virtual std::vector<Policy> fetchAll() = 0;

    /**
     * @brief Create or replace the policy for (domain, action)
     */
    virtual void upsert(const Policy& policy) = 0;

    /**
     * @brief Delete the policy for (domain, action)
     * @return True if a policy was removed
     */
    virtual bool remove(const std::string& domain, const std::string& action) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Policy table kept in a YAML file
 *
 * The file is re-read on every fetch and rewritten on every change.
 */
class YamlPolicySource : public PolicySource {
public:
    explicit YamlPolicySource(const std::string& file_path);

    std::vector<Policy> fetchAll() override;
    void upsert(const Policy& policy) override;
    bool remove(const std::string& domain, const std::string& action) override;
    std::string getName() const override;

private:
    std::string m_file_path;
    std::mutex m_write_mutex;

    void save(const std::vector<Policy>& policies);
};

/**
 * @brief Policy table served by a remote HTTP store
 *
 * GET /policies returns {"policies":[...]}; PUT and DELETE address
 * /policies/{domain}/{action}.
 */
class HttpPolicySource : public PolicySource {
public:
    HttpPolicySource(const std::string& base_url,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(500));

    std::vector<Policy> fetchAll() override;
    void upsert(const Policy& policy) override;
    bool remove(const std::string& domain, const std::string& action) override;
    std::string getName() const override;

    /**
     * @brief Parse a {"policies":[...]} body
     * @throws std::runtime_error on malformed bodies
     */
    static std::vector<Policy> parsePolicies(const std::string& body);

    /**
     * @brief Serialize one policy as a JSON object
     */
    static std::string serializePolicy(const Policy& policy);

private:
    std::string m_base_url;
    std::chrono::milliseconds m_timeout;

    std::string policyPath(const std::string& domain, const std::string& action) const;
};

} // namespace Switchboard
