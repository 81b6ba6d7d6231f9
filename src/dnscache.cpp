#include "dnscache.hpp"

#include <mutex>

DnsCache::DnsCache(std::chrono::seconds ttl, NowFunc now)
    : m_ttl(ttl)
    , m_now(now)
{
}

std::optional<std::vector<std::string>> DnsCache::get(const std::string& hostname) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(hostname);
    if (it == m_entries.end() || it->second.isExpired(m_now(), m_ttl)) {
        return std::nullopt;
    }
    return it->second.addresses;
}

void DnsCache::put(const std::string& hostname, const std::vector<std::string>& addresses)
{
    auto now = m_now();
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_entries[hostname] = { addresses, now };
}

void DnsCache::clear()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_entries.clear();
}

size_t DnsCache::purgeExpired()
{
    auto now = m_now();
    size_t purged = 0;
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.isExpired(now, m_ttl)) {
            it = m_entries.erase(it);
            purged++;
        } else {
            it++;
        }
    }
    return purged;
}

size_t DnsCache::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}
