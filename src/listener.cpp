#include "listener.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>

static bool isLoopback(const struct in_addr& addr)
{
    return ((::ntohl(addr.s_addr) >> 24) == IN_LOOPBACKNET);
}

static std::string addrToString(const struct sockaddr_in& addr)
{
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(::ntohs(addr.sin_port));
}

const char* toString(Listener::State state)
{
    switch (state) {
        case Listener::State::Starting: return "starting";
        case Listener::State::Running:  return "running";
        case Listener::State::Stopping: return "stopping";
        default:                        return "stopped";
    }
}

bool Listener::Outbox::post(Response&& response)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (open == false) {
        return false;
    }
    responses.emplace_back(std::move(response));
    return true;
}

bool Listener::Outbox::isOpen()
{
    std::lock_guard<std::mutex> lock(mutex);
    return open;
}

std::vector<Listener::Response> Listener::Outbox::drain()
{
    std::vector<Response> out;
    std::lock_guard<std::mutex> lock(mutex);
    out.swap(responses);
    return out;
}

void Listener::Outbox::close()
{
    std::lock_guard<std::mutex> lock(mutex);
    open = false;
    responses.clear();
}

Listener::Listener(const Options& options, const std::shared_ptr<Resolver>& resolver, const std::shared_ptr<WorkerPool>& pool)
    : m_options(options)
    , m_resolver(resolver)
    , m_pool(pool)
{
}

Listener::~Listener()
{
    stop();
}

void Listener::start()
{
    if (m_state == State::Running) {
        LOG_VERBOSE("DNS listener already running on ", m_options.ip, ":", m_boundPort);
        return;
    }
    m_state = State::Starting;

    try {
        m_addr = {};
        m_addr.sin_family = AF_INET;
        m_addr.sin_port = ::htons(m_options.port);
        if (::inet_pton(AF_INET, m_options.ip.c_str(), &m_addr.sin_addr) != 1) {
            throw SocketException("invalid listen address " + m_options.ip, EINVAL);
        }
        // Only local processes may use this resolver
        if (isLoopback(m_addr.sin_addr) == false) {
            throw SocketException("listen address " + m_options.ip + " is not a loopback address", EADDRNOTAVAIL);
        }

        m_sock = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (m_sock < 0) {
            throw SocketException("failed to create socket", errno);
        }

        int enable = 1;
        if (::setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) != 0) {
            throw SocketException("can't set reuse address option", errno);
        }

        if (::fcntl(m_sock, F_SETFL, ::fcntl(m_sock, F_GETFL, 0) | O_NONBLOCK) == -1) {
            throw SocketException("failed to set socket non-blocking", errno);
        }

        if (::bind(m_sock, reinterpret_cast<sockaddr *>(&m_addr), sizeof(m_addr)) < 0) {
            throw SocketException("failed to bind to " + addrToString(m_addr), errno);
        }

        struct sockaddr_in bound = {};
        socklen_t boundLen = sizeof(bound);
        if (::getsockname(m_sock, reinterpret_cast<sockaddr *>(&bound), &boundLen) != 0) {
            throw SocketException("failed to get bound address", errno);
        }
        m_boundPort = ::ntohs(bound.sin_port);
    } catch (SocketException&) {
        closeSocket();
        m_boundPort = 0;
        m_state = State::Stopped;
        throw;
    }

    m_outbox = std::make_shared<Outbox>();
    m_state = State::Running;
    LOG_INFO("DNS listener running on ", m_options.ip, ":", m_boundPort);
}

void Listener::stop()
{
    if (m_state == State::Stopped) {
        return;
    }
    m_state = State::Stopping;

    if (m_outbox) {
        m_outbox->close();
        m_outbox.reset();
    }
    closeSocket();
    if (m_clients.empty() == false) {
        LOG_VERBOSE("Dropping ", m_clients.size(), " DNS client(s)");
    }
    m_clients.clear();

    LOG_INFO("DNS listener on ", m_options.ip, ":", m_boundPort, " stopped");
    m_boundPort = 0;
    m_state = State::Stopped;
}

void Listener::processIncoming()
{
    if (m_state != State::Running) {
        return;
    }

    unsigned char buffer[DnsCodec::MAX_UDP_SIZE];
    while (true) {
        struct sockaddr_in remoteAddr;
        socklen_t remoteAddrLen = sizeof(remoteAddr);
        // MSG_TRUNC reports the real length of datagrams that didn't fit
        auto recvd = ::recvfrom(m_sock, buffer, sizeof(buffer), MSG_TRUNC, reinterpret_cast<sockaddr *>(&remoteAddr), &remoteAddrLen);
        if (recvd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                // ICMP errors from earlier sends show up here, not fatal for the listener
                LOG_DEBUG("DNS listener receive error: ", strerror(errno));
            }
            break;
        }

        if (remoteAddr.sin_family != AF_INET || isLoopback(remoteAddr.sin_addr) == false) {
            LOG_VERBOSE("Rejected DNS packet from non-local client ", addrToString(remoteAddr));
            m_stats.dropped++;
            continue;
        }

        auto clientKey = addrToString(remoteAddr);
        auto it = m_clients.find(clientKey);
        if (it == m_clients.end()) {
            Client client;
            client.addr = remoteAddr;
            it = m_clients.emplace(clientKey, client).first;
            LOG_DEBUG("New DNS client ", clientKey, ", ", m_clients.size(), " active");
        }
        it->second.lastActivity = std::chrono::steady_clock::now();

        if (recvd == 0) {
            LOG_DEBUG("Ignoring empty datagram from ", clientKey);
            m_stats.dropped++;
            continue;
        }

        if (static_cast<size_t>(recvd) > sizeof(buffer)) {
            LOG_VERBOSE("DNS query from ", clientKey, " is ", recvd, " bytes, larger than ", sizeof(buffer));
            m_stats.queries++;
            // Only the header is known to be intact
            DnsCodec::Bytes header(buffer, buffer + DnsCodec::HEADER_SIZE);
            std::fill(header.begin() + 4, header.end(), 0);
            if (sendResponse(clientKey, DnsCodec::synthesizeServfail(header))) {
                m_stats.servfails++;
            }
            continue;
        }

        LOG_DEBUG("Received UDP packet (", recvd, " bytes) from ", clientKey);
        handleQuery(clientKey, it->second, DnsCodec::Bytes(buffer, buffer + recvd));
    }
}

void Listener::handleQuery(const std::string& clientKey, Client& client, DnsCodec::Bytes&& query)
{
    m_stats.queries++;

    auto hostname = DnsCodec::extractHostname(query);
    if (!hostname) {
        LOG_VERBOSE("Failed to extract hostname from DNS query from ", clientKey);
        auto response = DnsCodec::synthesizeServfail(query);
        if (response.empty()) {
            // Not even a header to answer to
            m_stats.dropped++;
        } else if (sendResponse(clientKey, response)) {
            m_stats.servfails++;
        }
        return;
    }

    LOG_VERBOSE(clientKey, " resolving ", *hostname);

    auto resolver = m_resolver;
    auto outbox = m_outbox;
    auto name = *hostname;
    auto submitted = m_pool->submit([resolver, outbox, clientKey, query, name]() {
        // Listener was stopped while the query waited in the queue
        if (outbox->isOpen() == false) {
            LOG_DEBUG("Skipping resolution of ", name, ", listener stopped");
            return;
        }
        outbox->post(resolveQuery(*resolver, clientKey, query, name));
    });

    if (submitted) {
        client.pending++;
    } else {
        LOG_ERROR("Can't schedule resolution of ", *hostname, ", resolver shutting down");
        if (sendResponse(clientKey, DnsCodec::synthesizeServfail(query))) {
            m_stats.servfails++;
        }
    }
}

Listener::Response Listener::resolveQuery(Resolver& resolver, const std::string& clientKey, const DnsCodec::Bytes& query, const std::string& hostname)
{
    Response response;
    response.clientKey = clientKey;

    // Only A records can be synthesized
    std::vector<std::string> ipv4;
    for (auto& address: resolver.resolve(hostname)) {
        unsigned char ip[4];
        if (DnsCodec::parseIPv4(address, ip)) {
            ipv4.emplace_back(address);
        }
    }

    if (ipv4.empty()) {
        response.data = DnsCodec::synthesizeServfail(query);
        response.answered = false;
    } else {
        response.data = DnsCodec::synthesizeResponse(query, hostname, ipv4);
        response.answered = true;
    }
    return response;
}

bool Listener::sendResponse(const std::string& clientKey, const DnsCodec::Bytes& response)
{
    auto it = m_clients.find(clientKey);
    if (it == m_clients.end()) {
        LOG_DEBUG("DNS client ", clientKey, " gone, discarding response");
        m_stats.dropped++;
        return false;
    }

    auto sent = ::sendto(m_sock, response.data(), response.size(), 0, reinterpret_cast<const sockaddr *>(&it->second.addr), sizeof(it->second.addr));
    if (sent < 0) {
        LOG_INFO("Failed to send DNS response to ", clientKey, ": ", strerror(errno), ", dropping client");
        m_clients.erase(it);
        m_stats.dropped++;
        return false;
    }
    return true;
}

void Listener::processOutgoing()
{
    if (m_state != State::Running) {
        return;
    }

    for (auto& response: m_outbox->drain()) {
        auto it = m_clients.find(response.clientKey);
        if (it != m_clients.end() && it->second.pending > 0) {
            it->second.pending--;
        }

        if (sendResponse(response.clientKey, response.data)) {
            if (response.answered) {
                m_stats.answered++;
                LOG_DEBUG("Sent DNS response to ", response.clientKey);
            } else {
                m_stats.servfails++;
                LOG_DEBUG("Sent SERVFAIL to ", response.clientKey);
            }
        }
    }

    expireClients();
}

void Listener::expireClients()
{
    auto now = std::chrono::steady_clock::now();
    for (auto it = m_clients.begin(); it != m_clients.end();) {
        if (it->second.pending == 0 && (now - it->second.lastActivity) > m_options.clientIdleTimeout) {
            LOG_DEBUG("DNS client ", it->first, " idle, removing");
            it = m_clients.erase(it);
        } else {
            it++;
        }
    }
}
