/**
 * @file resolver.hpp
 * @brief DNS-over-HTTPS resolver with caching and fallbacks.
 */

#pragma once

#include "dnscache.hpp"
#include "httpclient.hpp"
#include "provider.hpp"
#include "strategy.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @class Resolver
 * @brief Abstract hostname resolver, the seam between the listener and DoH.
 */
class Resolver {
    public:
        virtual ~Resolver() = default;

        /**
         * @brief Resolves hostname into a list of addresses.
         *
         * Never throws. An empty list means resolution failed.
         */
        virtual std::vector<std::string> resolve(const std::string& hostname) = 0;
};

/**
 * @class DohResolver
 * @brief Resolves hostnames through the active DoH provider.
 *
 * Resolution order is cache, provider's JSON API, provider's wire format API
 * and finally the system resolver. The first strategy returning addresses
 * wins and its result is cached.
 *
 * Switching provider swaps the whole strategy list at once. Resolutions in
 * progress keep using the list they started with, but their results are not
 * cached once the provider has changed.
 */
class DohResolver : public Resolver {
    public:
        typedef std::vector<std::shared_ptr<ResolutionStrategy>> Strategies;

        /**
         * @struct Options
         * @brief Tunables of the resolver.
         */
        struct Options {
            std::chrono::seconds cacheTtl{300};         ///< Lifetime of cached resolutions.
            std::chrono::milliseconds deadline{0};      ///< Overall limit per resolve(), 0 disables it.
            bool systemFallback = true;                 ///< Use the platform resolver as last resort.
            SystemStrategy::LookupFunc systemLookup = SystemStrategy::getAddrInfo;
            DnsCache::NowFunc now = DnsCache::Clock::now;
        };

    private:
        struct State {
            Provider provider;
            Strategies strategies;
            uint64_t generation;
        };

        std::shared_ptr<HttpClient> m_http;
        Options m_options;
        DnsCache m_cache;
        mutable std::mutex m_stateMutex;            // guards m_state and orders cache updates with provider switches
        std::shared_ptr<const State> m_state;
        std::atomic<uint64_t> m_upstreamQueries{0};

        std::shared_ptr<const State> getState() const;
        std::shared_ptr<const State> buildState(Provider provider, uint64_t generation) const;

    public:
        /**
         * @brief Constructs the resolver.
         *
         * @param http Transport for DoH queries, shared by all strategies.
         * @param provider Initially active provider.
         * @param options Resolver tunables.
         */
        DohResolver(const std::shared_ptr<HttpClient>& http, Provider provider, const Options& options);

        std::vector<std::string> resolve(const std::string& hostname) override;

        /**
         * @brief Switches to another provider and clears the cache.
         *
         * Cache is cleared even if the provider doesn't change.
         */
        void setProvider(Provider provider);

        /**
         * @brief Returns currently active provider.
         */
        Provider getProvider() const;

        /**
         * @brief Drops all cached resolutions.
         */
        void clearCache();

        /**
         * @brief Removes expired cache entries.
         * @return Number of entries removed.
         */
        size_t purgeCache();

        size_t getCacheSize() const { return m_cache.size(); }

        /**
         * @brief Number of strategy attempts made so far (cache hits excluded).
         */
        uint64_t getUpstreamQueries() const { return m_upstreamQueries; }

        /**
         * @brief Builds the ordered strategy list for a provider.
         */
        static Strategies buildStrategies(Provider provider, const std::shared_ptr<HttpClient>& http, const Options& options);
};
