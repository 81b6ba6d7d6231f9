/**
 * @file connmgr.hpp
 * @brief poll() based reactor for network connections.
 */

#pragma once

#include "connection.hpp"

#include <memory>
#include <vector>

/**
 * @class ConnectionsManager
 * @brief Manages the IO processing of multiple Connection objects.
 *
 * This class acts as a reactor. It maintains a list of registered connections
 * and uses `poll` to wait for incoming data, invoking their processing methods
 * when ready. All callbacks run on the thread calling run().
 */
class ConnectionsManager {
    private:
        std::vector<std::shared_ptr<Connection>> m_connections;

    public:
        /**
         * @brief Registers a connection with the manager.
         *
         * Adding an already registered connection has no effect.
         *
         * @param connection Shared pointer to the connection instance.
         */
        void add(const std::shared_ptr<Connection>& connection);

        /**
         * @brief Unregisters a connection.
         * @param connection Shared pointer to the connection instance to remove.
         */
        void remove(const std::shared_ptr<Connection>& connection);

        /**
         * @brief Number of registered connections.
         */
        size_t size() const { return m_connections.size(); }

        /**
         * @brief Runs the main IO loop for a single iteration/slice.
         *
         * Polls all sockets for read readiness, processes incoming data,
         * then gives every connection a chance to send pending data and
         * drops the ones that got disconnected.
         *
         * @param timeout Maximum time to wait for IO events in seconds (default 0.1s).
         */
        void run(double timeout = 0.1);
};
