#pragma once

/**
 * CredentialCache.hpp
 *
 * Time-bounded cache of credential reads, keyed by storage location.
 * Entries carrying an error expire after the short TTL so a locked store is
 * retried soon without hammering the helper.
 */

#include "Credentials.hpp"
#include "../Clock.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace keyrotor::core::auth {

class CredentialCache {
public:
    CredentialCache(const Clock& clock,
                    std::chrono::seconds successTtl = std::chrono::seconds(300),
                    std::chrono::seconds errorTtl = std::chrono::seconds(10));

    /**
     * @return Cached value if present and younger than its TTL
     */
    std::optional<FullOAuthCredentials> get(const std::string& key) const;

    void put(const std::string& key, const FullOAuthCredentials& credentials);

    void erase(const std::string& key);
    void clear();

    size_t size() const;

private:
    struct Entry {
        FullOAuthCredentials credentials;
        TimePoint timestamp;
    };

    const Clock& m_clock;
    std::chrono::seconds m_successTtl;
    std::chrono::seconds m_errorTtl;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace keyrotor::core::auth
