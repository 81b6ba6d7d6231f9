/**
 * @file dnscache.hpp
 * @brief Thread-safe cache of resolved hostnames.
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * @class DnsCache
 * @brief Maps hostnames to the addresses they last resolved to.
 *
 * Entries live for a fixed time-to-live. A new resolution replaces the entry
 * rather than merging with it. Lookups take a shared lock and copy the entry
 * out, updates take an exclusive lock, so readers never see a partial entry.
 */
class DnsCache {
    public:
        typedef std::chrono::steady_clock Clock;
        typedef std::function<Clock::time_point()> NowFunc;

        /**
         * @struct Entry
         * @brief Cached result of one successful resolution.
         */
        struct Entry {
            std::vector<std::string> addresses; ///< Addresses in the order they were resolved.
            Clock::time_point timestamp;        ///< When the resolution completed.

            /**
             * @brief Checks whether the entry is too old to be used.
             * @return True when more than ttl elapsed since timestamp.
             */
            bool isExpired(Clock::time_point now, std::chrono::seconds ttl) const {
                return (now - timestamp) > ttl;
            }
        };

    private:
        std::map<std::string, Entry> m_entries;
        mutable std::shared_mutex m_mutex;
        std::chrono::seconds m_ttl;
        NowFunc m_now;

    public:
        /**
         * @brief Constructs an empty cache.
         *
         * @param ttl How long entries stay valid.
         * @param now Time source, tests pass a fake one.
         */
        explicit DnsCache(std::chrono::seconds ttl = std::chrono::seconds(300), NowFunc now = Clock::now);

        /**
         * @brief Returns addresses for the hostname if a valid entry exists.
         *
         * Expired entries are treated as missing, they stay in memory until
         * replaced or removed by purgeExpired().
         */
        std::optional<std::vector<std::string>> get(const std::string& hostname) const;

        /**
         * @brief Stores the addresses for the hostname, replacing any previous entry.
         */
        void put(const std::string& hostname, const std::vector<std::string>& addresses);

        /**
         * @brief Drops all entries.
         */
        void clear();

        /**
         * @brief Removes expired entries.
         * @return Number of entries removed.
         */
        size_t purgeExpired();

        /**
         * @brief Number of stored entries, including expired ones not yet purged.
         */
        size_t size() const;

        std::chrono::seconds getTtl() const { return m_ttl; }
};
