#include "connmgr.hpp"

#include <algorithm>
#include <cerrno>
#include <poll.h>

void ConnectionsManager::add(const std::shared_ptr<Connection>& connection)
{
    if (std::find(m_connections.begin(), m_connections.end(), connection) == m_connections.end()) {
        m_connections.emplace_back(connection);
    }
}

void ConnectionsManager::remove(const std::shared_ptr<Connection>& connection)
{
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        if (*it == connection) {
            it = m_connections.erase(it);
        } else {
            it++;
        }
    }
}

void ConnectionsManager::run(double timeout) {
    // Callbacks may add or remove connections, work on a snapshot
    auto connections = m_connections;

    std::vector<pollfd> fds(connections.size());
    for (size_t i = 0; i < connections.size(); i++) {
        fds[i].fd = connections[i]->getSocket();
        fds[i].events = POLLIN;
        fds[i].revents = 0;
    }

    if (timeout <= 0) {
        timeout = 0.0;
    } else if (timeout < 0.001) {
        timeout = 0.001;
    }

    // poll() ignores negative descriptors, closed connections are harmless here
    if (::poll(fds.data(), fds.size(), static_cast<int>(timeout*1000)) > 0) {
        for (size_t i = 0; i < fds.size(); i++) {
            if (fds[i].revents & (POLLIN | POLLERR)) {
                connections[i]->processIncoming();
            }
        }
    }

    // Trigger each connection to send out any packets
    for (auto& connection: connections) {
        connection->processOutgoing();
    }

    // And drop closed connections
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        if ((*it)->isConnected() == false) {
            it = m_connections.erase(it);
        } else {
            it++;
        }
    }
}
