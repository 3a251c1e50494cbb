/**
 * CredentialCache.cpp
 */

#include "CredentialCache.hpp"

namespace keyrotor::core::auth {

CredentialCache::CredentialCache(const Clock& clock,
                                 std::chrono::seconds successTtl,
                                 std::chrono::seconds errorTtl)
    : m_clock(clock)
    , m_successTtl(successTtl)
    , m_errorTtl(errorTtl) {
}

std::optional<FullOAuthCredentials> CredentialCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }

    auto ttl = it->second.credentials.hasError() ? m_errorTtl : m_successTtl;
    if (m_clock.now() - it->second.timestamp >= ttl) {
        return std::nullopt;
    }
    return it->second.credentials;
}

void CredentialCache::put(const std::string& key, const FullOAuthCredentials& credentials) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[key] = Entry{credentials, m_clock.now()};
}

void CredentialCache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(key);
}

void CredentialCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

size_t CredentialCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace keyrotor::core::auth
