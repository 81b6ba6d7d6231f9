/**
 * @file dispatcher.hpp
 * @brief Central coordinator of the resolver and the local DNS listener.
 */

#pragma once

#include "config.hpp"
#include "connmgr.hpp"
#include "listener.hpp"
#include "resolver.hpp"
#include "workerpool.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @class Dispatcher
 * @brief Main application controller.
 *
 * The Dispatcher wires together the HTTP transport, the DoH resolver, the
 * worker threads and the local DNS listener. It owns the event loop and
 * performs periodic maintenance:
 * 1. Listener receives a query and hands the hostname to the worker pool.
 * 2. Worker resolves it through the DohResolver (cache, DoH, system).
 * 3. Event loop sends the synthesized response back to the client.
 * 4. Expired cache entries are purged every CACHE_TTL seconds.
 */
class Dispatcher {
    private:
        const Config& m_config;
        ConnectionsManager m_connections;
        std::shared_ptr<HttpClient> m_http;
        std::shared_ptr<DohResolver> m_resolver;
        std::shared_ptr<WorkerPool> m_pool;
        std::shared_ptr<Listener> m_listener;
        std::chrono::steady_clock::time_point m_lastPurge;
        std::chrono::steady_clock::time_point m_lastStatus;

        /**
         * @brief Logs cache and listener counters.
         */
        void logStatus();

    public:
        /**
         * @brief Constructs the Dispatcher.
         *
         * Initializes all components based on provided configuration. The
         * listener is created stopped, see startListener().
         *
         * @param config Reference to the loaded configuration.
         * @param http Transport for DoH requests, curl based one when empty.
         */
        explicit Dispatcher(const Config& config, const std::shared_ptr<HttpClient>& http = nullptr);

        ~Dispatcher();

        /**
         * @brief Switches the upstream DoH provider, clearing the cache.
         */
        void setProvider(Provider provider);

        Provider getProvider() const { return m_resolver->getProvider(); }

        /**
         * @brief Binds the local DNS listener and registers it with the event loop.
         * @throws SocketException when the address can't be bound.
         */
        void startListener();

        /**
         * @brief Stops the local DNS listener. Does nothing when it's not running.
         */
        void stopListener();

        bool isListenerRunning() const { return m_listener->isRunning(); }

        /**
         * @brief Returns address and port of the running listener, port is 0 when stopped.
         */
        std::pair<std::string, uint16_t> getProxyEndpoint() const;

        /**
         * @brief Resolves a hostname directly, bypassing the listener.
         *
         * Blocks the caller until resolution completes.
         */
        std::vector<std::string> resolve(const std::string& hostname);

        /**
         * @brief Drops all cached resolutions.
         */
        void clearCache();

        const Listener::Stats& getStats() const { return m_listener->getStats(); }

        /**
         * @brief Main processing step.
         *
         * Drives the ConnectionsManager loop and performs periodic maintenance tasks
         * (like purging expired cache entries).
         *
         * @param timeout Max wait time for the IO loop step.
         */
        void run(double timeout = 0.1);
};
