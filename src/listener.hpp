/**
 * @file listener.hpp
 * @brief Local UDP DNS service answering from the DoH resolver.
 */

#pragma once

#include "connection.hpp"
#include "dnscodec.hpp"
#include "resolver.hpp"
#include "workerpool.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @class Listener
 * @brief UDP listener for DNS queries from local clients.
 *
 * Binds to a loopback address and receives DNS queries. Each query's hostname
 * is resolved on the worker pool; the response is handed back to the event
 * loop thread which sends it to the client. Queries that can't be decoded or
 * resolved are answered with SERVFAIL.
 *
 * Every remote endpoint gets a client handle when its first datagram
 * arrives. Handles are dropped after being idle for the configured timeout,
 * after a failed send, or when the listener stops.
 *
 * All methods except the worker tasks must be called from the thread running
 * the ConnectionsManager loop.
 */
class Listener : public Connection {
    public:
        /**
         * @enum State
         * @brief Lifecycle of the listener.
         */
        enum class State {
            Stopped,
            Starting,
            Running,
            Stopping,
        };

        /**
         * @struct Options
         * @brief Listener settings.
         */
        struct Options {
            std::string ip = "127.0.0.1";                   ///< Local address, must be a loopback address.
            uint16_t port = 5353;                           ///< Local UDP port, 0 picks a free port.
            std::chrono::seconds clientIdleTimeout{30};     ///< Drop clients silent for this long.
        };

        /**
         * @struct Stats
         * @brief Counters since the listener was constructed.
         */
        struct Stats {
            uint64_t queries = 0;       ///< Datagrams accepted for processing.
            uint64_t answered = 0;      ///< Responses with at least one address.
            uint64_t servfails = 0;     ///< SERVFAIL responses sent.
            uint64_t dropped = 0;       ///< Datagrams or responses that were not answered/delivered.
        };

    private:
        /**
         * @struct Client
         * @brief Handle for one remote endpoint.
         */
        struct Client {
            struct sockaddr_in addr;
            std::chrono::steady_clock::time_point lastActivity;
            unsigned pending = 0;       ///< Queries being resolved.
        };

        /**
         * @struct Response
         * @brief Resolved response waiting to be sent.
         */
        struct Response {
            std::string clientKey;
            DnsCodec::Bytes data;
            bool answered = false;
        };

        /**
         * @struct Outbox
         * @brief Responses posted by workers for the event loop to send.
         *
         * Every start() creates a new outbox and stop() closes it, so results
         * of queries from a previous run are discarded.
         */
        struct Outbox {
            std::mutex mutex;
            std::vector<Response> responses;
            bool open = true;

            bool post(Response&& response);
            bool isOpen();
            std::vector<Response> drain();
            void close();
        };

        Options m_options;
        std::shared_ptr<Resolver> m_resolver;
        std::shared_ptr<WorkerPool> m_pool;
        State m_state = State::Stopped;
        uint16_t m_boundPort = 0;
        std::map<std::string, Client> m_clients;
        std::shared_ptr<Outbox> m_outbox;
        Stats m_stats;

        void handleQuery(const std::string& clientKey, Client& client, DnsCodec::Bytes&& query);
        bool sendResponse(const std::string& clientKey, const DnsCodec::Bytes& response);
        void expireClients();

        /**
         * @brief Resolves the hostname and builds the response, runs on a worker thread.
         */
        static Response resolveQuery(Resolver& resolver, const std::string& clientKey, const DnsCodec::Bytes& query, const std::string& hostname);

    public:
        /**
         * @brief Constructs a stopped Listener.
         *
         * @param options Listen address and timeouts.
         * @param resolver Resolver used for every query.
         * @param pool Worker threads to run resolutions on.
         */
        Listener(const Options& options, const std::shared_ptr<Resolver>& resolver, const std::shared_ptr<WorkerPool>& pool);

        ~Listener();

        /**
         * @brief Binds the socket and starts accepting queries.
         *
         * Does nothing if already running. On failure the socket is closed,
         * the listener stays stopped and SocketException is thrown.
         */
        void start();

        /**
         * @brief Closes the socket and drops all clients.
         *
         * Resolutions in progress run to completion but their results are
         * discarded. Calling stop() on a stopped listener does nothing.
         */
        void stop();

        State getState() const { return m_state; }
        bool isRunning() const { return m_state == State::Running; }

        /**
         * @brief Number of registered client handles.
         */
        size_t getActiveConnections() const { return m_clients.size(); }

        const Stats& getStats() const { return m_stats; }

        /**
         * @brief Port the socket is bound to, 0 when not running.
         */
        uint16_t getPort() const { return m_boundPort; }

        const std::string& getAddress() const { return m_options.ip; }

        /**
         * @brief Reads pending datagrams and dispatches queries.
         */
        void processIncoming() override;

        /**
         * @brief Sends resolved responses and expires idle clients.
         */
        void processOutgoing() override;
};

/**
 * @brief Returns human readable name of the listener state.
 */
const char* toString(Listener::State state);
