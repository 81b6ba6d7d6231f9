/**
 * @file connection.hpp
 * @brief Base connection and exception classes for network communication.
 */

#pragma once

#include <arpa/inet.h>

#include <stdexcept>
#include <string>

/**
 * @class SocketException
 * @brief Exception thrown when socket operations fail.
 *
 * Provides a standard way to report socket errors, optionally including
 * the system errno.
 */
class SocketException : public std::runtime_error {
    private:
        std::string m_msg;

    public:
        /**
         * @brief Constructs a SocketException.
         * @param message Descriptive error message.
         * @param err Optional system error code (errno), 0 picks up current errno.
         */
        explicit SocketException(const std::string &message, int err = 0);

        /**
         * @brief Constructs a SocketException from a C-string.
         * @param message Descriptive error message.
         * @param err Optional system error code (errno).
         */
        explicit SocketException(const char *message, int err = 0)
            : SocketException(std::string(message), err) {};

        virtual ~SocketException() noexcept {};

        /**
         * @brief Returns the error description.
         * @return const char* The error message.
         */
        virtual const char *what() const noexcept { return m_msg.c_str(); }
};

/**
 * @class Connection
 * @brief Abstract base class representing a socket driven by the ConnectionsManager.
 *
 * Owns the underlying socket file descriptor and closes it on destruction.
 */
class Connection {
    protected:
        int m_sock = -1;            ///< The underlying socket file descriptor.
        struct sockaddr_in m_addr;  ///< Local address the socket is bound to.

        /**
         * @brief Closes the socket if open.
         */
        void closeSocket();

    public:
        Connection();
        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;

        /**
         * @brief Virtual destructor, closes the socket.
         */
        virtual ~Connection() = 0;

        /**
         * @brief Gets the socket file descriptor.
         * @return int The socket FD, or -1 if invalid.
         */
        int getSocket() const { return m_sock; };

        /**
         * @brief Checks if the socket is open.
         *
         * ConnectionsManager drops connections reporting false after each loop step.
         */
        virtual bool isConnected() const { return (m_sock != -1); };

        /**
         * @brief Called when the socket is readable or has a pending error.
         */
        virtual void processIncoming() {};

        /**
         * @brief Called once per loop step, whether or not the socket was readable.
         */
        virtual void processOutgoing() {};
};
