/**
 * @file config.hpp
 * @brief Application configuration.
 */

#pragma once

#include "logging.hpp"
#include "provider.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @class ConfigException
 * @brief Thrown when the configuration file can't be read.
 */
class ConfigException : public std::runtime_error {
    public:
        explicit ConfigException(const std::string& message)
            : std::runtime_error(message) {};
};

/**
 * @class Config
 * @brief Application configuration container.
 *
 * Stores all runtime configuration settings parsed from the config file,
 * including logging preferences, listen address and resolver tunables.
 * Members hold defaults until parseFile() overrides them.
 */
class Config {
    public:
        /**
         * @typedef Address
         * @brief Represents a network address as (IP String, Port).
         */
        typedef std::pair<std::string, uint16_t> Address;

        Log::Level              log_level = Log::Level::Error; ///< Logging verbosity level.
        std::string             syslog_facility;     ///< Syslog facility name. If empty, logs to stdout.
        std::string             syslog_id = "dohproxy"; ///< Identity tag used in syslog messages.

        Address                 listen_address = {"127.0.0.1", 5353}; ///< Local DNS service address, loopback only.
        Provider                provider = Provider::Cloudflare; ///< Upstream DoH provider.

        unsigned cache_ttl = 300;               ///< Seconds a resolution is served from cache.
        unsigned http_request_timeout = 5;      ///< Seconds to connect or with a stalled transfer.
        unsigned http_resource_timeout = 10;    ///< Seconds for a complete HTTP request.
        unsigned resolve_deadline = 0;          ///< Seconds for a complete resolution, 0 means no limit.
        unsigned worker_threads = 4;            ///< Threads resolving queries.
        unsigned client_idle_timeout = 30;      ///< Seconds before an idle client handle is dropped.
        bool     system_fallback = true;        ///< Fall back to system resolver when DoH fails.

        /**
         * @brief Parses configuration from a file.
         *
         * Reads the specified configuration file and populates the members of this class.
         * Invalid values are reported on stderr and leave the default in place.
         *
         * @param path The filesystem path to the configuration file.
         * @throws ConfigException when the file can't be opened.
         */
        void parseFile(const std::string &path);
};
