/**
 * @file strategy.hpp
 * @brief Interchangeable ways of resolving a hostname.
 */

#pragma once

#include "httpclient.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @class ResolutionStrategy
 * @brief Abstract single method of turning a hostname into addresses.
 *
 * The resolver tries its strategies in order and stops at the first one
 * returning a non-empty list. Implementations must be callable from several
 * threads at once and must not throw.
 */
class ResolutionStrategy {
    public:
        typedef std::chrono::steady_clock Clock;

        /**
         * @brief Point in time after which the attempt should give up, nothing means no limit.
         */
        typedef std::optional<Clock::time_point> Deadline;

        typedef std::optional<std::vector<std::string>> Result;

        virtual ~ResolutionStrategy() = default;

        /**
         * @brief Short name used in log messages.
         */
        virtual const char* name() const = 0;

        /**
         * @brief Attempts to resolve the hostname.
         *
         * @param hostname Name to resolve.
         * @param deadline Optional limit for the attempt.
         * @return Non-empty list of addresses, or nothing on failure.
         */
        virtual Result attempt(const std::string& hostname, const Deadline& deadline) = 0;

    protected:
        /**
         * @brief Time left until the deadline, 0 means no limit.
         *
         * Returns at least 1ms while the deadline is in the future.
         */
        static std::chrono::milliseconds remaining(const Deadline& deadline);
};

/**
 * @class JsonStrategy
 * @brief Queries the provider's JSON API with an HTTPS GET.
 *
 * Takes A and AAAA answers whose data looks like an IP literal. CNAME
 * records are not chased.
 */
class JsonStrategy : public ResolutionStrategy {
    private:
        std::shared_ptr<HttpClient> m_http;
        std::string m_url;

    public:
        JsonStrategy(const std::shared_ptr<HttpClient>& http, const std::string& url);
        const char* name() const override { return "JSON"; }
        Result attempt(const std::string& hostname, const Deadline& deadline) override;

        /**
         * @brief Extracts addresses from a JSON API response body.
         * @return Addresses, empty when the body is not valid or has no usable answers.
         */
        static std::vector<std::string> parseBody(const std::vector<unsigned char>& body);
};

/**
 * @class WireStrategy
 * @brief POSTs an RFC 1035 query to the provider's RFC 8484 endpoint.
 */
class WireStrategy : public ResolutionStrategy {
    private:
        std::shared_ptr<HttpClient> m_http;
        std::string m_url;

    public:
        WireStrategy(const std::shared_ptr<HttpClient>& http, const std::string& url);
        const char* name() const override { return "wire"; }
        Result attempt(const std::string& hostname, const Deadline& deadline) override;
};

/**
 * @class SystemStrategy
 * @brief Falls back to the platform resolver (getaddrinfo).
 *
 * Blocks the calling thread, so it must only run on resolver worker threads.
 */
class SystemStrategy : public ResolutionStrategy {
    public:
        /**
         * @brief Function performing the actual lookup, returns numeric addresses.
         */
        typedef std::function<std::vector<std::string>(const std::string& hostname)> LookupFunc;

    private:
        LookupFunc m_lookup;

    public:
        /**
         * @param lookup Lookup implementation, defaults to getaddrinfo().
         */
        explicit SystemStrategy(LookupFunc lookup = getAddrInfo);
        const char* name() const override { return "system"; }
        Result attempt(const std::string& hostname, const Deadline& deadline) override;

        /**
         * @brief Resolves using getaddrinfo(), duplicates removed, order kept.
         */
        static std::vector<std::string> getAddrInfo(const std::string& hostname);
};
