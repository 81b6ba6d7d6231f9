#include "connection.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

SocketException::SocketException(const std::string &message, int err)
    : std::runtime_error(message)
    , m_msg(message)
{
    if (err == 0) {
        err = errno;
    }
    if (err != 0) {
        m_msg += " - ";
        m_msg += strerror(err);
    }
}

Connection::Connection()
    : m_addr{}
{
}

Connection::~Connection()
{
    closeSocket();
}

void Connection::closeSocket()
{
    if (m_sock != -1) {
        ::close(m_sock);
        m_sock = -1;
    }
}
