#include <catch2/catch.hpp>

#include "connmgr.hpp"
#include "dnscodec.hpp"
#include "listener.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <mutex>
#include <set>
#include <thread>

using DnsCodec::Bytes;

class FakeResolver : public Resolver {
    private:
        std::mutex m_mutex;
        std::vector<std::string> m_hostnames;
        std::vector<std::string> m_result;

    public:
        explicit FakeResolver(const std::vector<std::string>& result)
            : m_result(result)
        {}

        std::vector<std::string> resolve(const std::string& hostname) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hostnames.push_back(hostname);
            return m_result;
        }

        std::vector<std::string> getHostnames()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_hostnames;
        }
};

/**
 * Plain UDP socket on loopback acting as a DNS client.
 */
class UdpClient {
    private:
        int m_sock;

    public:
        UdpClient()
        {
            m_sock = ::socket(AF_INET, SOCK_DGRAM, 0);
            REQUIRE(m_sock >= 0);
            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            REQUIRE(::bind(m_sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        }

        ~UdpClient()
        {
            ::close(m_sock);
        }

        uint16_t getPort() const
        {
            struct sockaddr_in addr = {};
            socklen_t len = sizeof(addr);
            ::getsockname(m_sock, reinterpret_cast<sockaddr*>(&addr), &len);
            return ntohs(addr.sin_port);
        }

        void send(uint16_t port, const Bytes& data)
        {
            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = htons(port);
            auto sent = ::sendto(m_sock, data.data(), data.size(), 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
            REQUIRE(sent == static_cast<ssize_t>(data.size()));
        }

        bool receive(Bytes& data)
        {
            unsigned char buffer[1024];
            auto recvd = ::recv(m_sock, buffer, sizeof(buffer), MSG_DONTWAIT);
            if (recvd < 0) {
                return false;
            }
            data.assign(buffer, buffer + recvd);
            return true;
        }
};

/**
 * Listener on a free loopback port driven by its own reactor.
 */
struct ListenerFixture {
    std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>(std::vector<std::string>{"93.184.216.34", "2606:2800:220:1::"});
    std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>(2);
    Listener::Options options;
    ConnectionsManager connections;

    ListenerFixture()
    {
        options.port = 0;
    }

    std::shared_ptr<Listener> startListener()
    {
        auto listener = std::make_shared<Listener>(options, resolver, pool);
        listener->start();
        connections.add(listener);
        return listener;
    }

    bool receive(UdpClient& client, Bytes& data, int iterations = 100)
    {
        for (int i = 0; i < iterations; i++) {
            connections.run(0.02);
            if (client.receive(data)) {
                return true;
            }
        }
        return false;
    }
};

static Bytes query(const std::string& hostname, uint16_t id)
{
    auto data = DnsCodec::encodeQuery(hostname);
    REQUIRE(data);
    (*data)[0] = static_cast<unsigned char>(id >> 8);
    (*data)[1] = static_cast<unsigned char>(id & 0xFF);
    return *data;
}

TEST_CASE_METHOD(ListenerFixture, "Listener lifecycle") {
    Listener listener(options, resolver, pool);
    REQUIRE(listener.getState() == Listener::State::Stopped);
    REQUIRE(listener.isConnected() == false);
    REQUIRE(listener.getPort() == 0);

    listener.start();
    REQUIRE(listener.getState() == Listener::State::Running);
    REQUIRE(listener.isConnected());
    auto port = listener.getPort();
    REQUIRE(port != 0);

    // Second start is a no-op
    listener.start();
    REQUIRE(listener.isRunning());
    REQUIRE(listener.getPort() == port);

    listener.stop();
    REQUIRE(listener.getState() == Listener::State::Stopped);
    REQUIRE(listener.getSocket() == -1);
    REQUIRE(listener.getPort() == 0);
    listener.stop();
    REQUIRE(listener.getState() == Listener::State::Stopped);

    listener.start();
    REQUIRE(listener.isRunning());
    REQUIRE(std::string(toString(listener.getState())) == "running");
}

TEST_CASE_METHOD(ListenerFixture, "Bind failure leaves listener stopped") {
    // Port taken by a socket without SO_REUSEADDR can't be shared
    int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    REQUIRE(sock >= 0);
    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

    options.port = ntohs(addr.sin_port);
    Listener listener(options, resolver, pool);
    REQUIRE_THROWS_AS(listener.start(), SocketException);
    REQUIRE(listener.getState() == Listener::State::Stopped);
    REQUIRE(listener.getSocket() == -1);

    ::close(sock);
}

TEST_CASE_METHOD(ListenerFixture, "Only loopback addresses can be used") {
    SECTION("wildcard") {
        options.ip = "0.0.0.0";
    }
    SECTION("not an address") {
        options.ip = "localhost";
    }
    Listener listener(options, resolver, pool);
    REQUIRE_THROWS_AS(listener.start(), SocketException);
    REQUIRE(listener.getState() == Listener::State::Stopped);
}

TEST_CASE_METHOD(ListenerFixture, "Query is answered with A records") {
    auto listener = startListener();
    UdpClient client;

    client.send(listener->getPort(), query("example.com", 0xABCD));

    Bytes response;
    REQUIRE(receive(client, response));
    REQUIRE(DnsCodec::getId(response) == 0xABCD);
    REQUIRE((response[2] & 0x80) == 0x80);
    REQUIRE((response[3] & 0x0F) == 0);

    auto parsed = DnsCodec::parseResponse(response);
    REQUIRE(parsed.complete);
    REQUIRE(parsed.addresses == std::vector<std::string>{"93.184.216.34"});

    REQUIRE(resolver->getHostnames() == std::vector<std::string>{"example.com"});
    REQUIRE(listener->getActiveConnections() == 1);
    REQUIRE(listener->getStats().queries == 1);
    REQUIRE(listener->getStats().answered == 1);

    listener->stop();
    REQUIRE(listener->getActiveConnections() == 0);
}

TEST_CASE_METHOD(ListenerFixture, "Failed resolution is answered with SERVFAIL") {
    SECTION("nothing resolved") {
        resolver = std::make_shared<FakeResolver>(std::vector<std::string>());
    }
    SECTION("only IPv6 resolved") {
        resolver = std::make_shared<FakeResolver>(std::vector<std::string>{"::1"});
    }
    auto listener = startListener();
    UdpClient client;

    auto request = query("nonexistent.invalid", 0x0102);
    client.send(listener->getPort(), request);

    Bytes response;
    REQUIRE(receive(client, response));
    REQUIRE(response.size() == request.size());
    REQUIRE(DnsCodec::getId(response) == 0x0102);
    REQUIRE((response[2] & 0x80) == 0x80);
    REQUIRE((response[3] & 0x0F) == DnsCodec::RCODE_SERVFAIL);
    REQUIRE(listener->getStats().servfails == 1);
}

TEST_CASE_METHOD(ListenerFixture, "Undecodable query is answered with SERVFAIL") {
    auto listener = startListener();
    UdpClient client;

    Bytes header = { 0x55, 0x66, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
    client.send(listener->getPort(), header);

    Bytes response;
    REQUIRE(receive(client, response));
    REQUIRE(DnsCodec::getId(response) == 0x5566);
    REQUIRE((response[3] & 0x0F) == DnsCodec::RCODE_SERVFAIL);
    REQUIRE(resolver->getHostnames().empty());
}

TEST_CASE_METHOD(ListenerFixture, "Tiny datagrams are dropped") {
    auto listener = startListener();
    UdpClient client;

    client.send(listener->getPort(), Bytes());
    client.send(listener->getPort(), Bytes{0x01});

    Bytes response;
    REQUIRE_FALSE(receive(client, response, 10));
    REQUIRE(listener->isRunning());
    REQUIRE(listener->getStats().dropped == 2);
    REQUIRE(resolver->getHostnames().empty());

    // Listener keeps serving afterwards
    client.send(listener->getPort(), query("example.com", 7));
    REQUIRE(receive(client, response));
    REQUIRE(DnsCodec::getId(response) == 7);
}

TEST_CASE_METHOD(ListenerFixture, "Oversized query is answered with SERVFAIL") {
    auto listener = startListener();
    UdpClient client;

    auto request = query("example.com", 0x3344);
    request.resize(DnsCodec::MAX_UDP_SIZE + 88, 0);
    client.send(listener->getPort(), request);

    Bytes response;
    REQUIRE(receive(client, response));
    REQUIRE(response.size() == DnsCodec::HEADER_SIZE);
    REQUIRE(DnsCodec::getId(response) == 0x3344);
    REQUIRE((response[2] & 0x80) == 0x80);
    REQUIRE((response[3] & 0x0F) == DnsCodec::RCODE_SERVFAIL);
    REQUIRE(response[5] == 0);  // no question echoed
    REQUIRE(resolver->getHostnames().empty());
    REQUIRE(listener->getStats().servfails == 1);
}

TEST_CASE_METHOD(ListenerFixture, "Queued resolutions are skipped after stop") {
    pool = std::make_shared<WorkerPool>(1);
    auto listener = startListener();
    UdpClient client;

    // Keep the only worker busy so the query stays queued
    std::atomic<bool> release{false};
    pool->submit([&release]() {
        while (release == false) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    client.send(listener->getPort(), query("example.com", 11));
    for (int i = 0; i < 100 && listener->getStats().queries == 0; i++) {
        connections.run(0.02);
    }
    REQUIRE(listener->getStats().queries == 1);

    listener->stop();
    release = true;
    pool->shutdown();

    REQUIRE(resolver->getHostnames().empty());
}

TEST_CASE_METHOD(ListenerFixture, "Every client gets its own responses") {
    auto listener = startListener();
    UdpClient client1;
    UdpClient client2;
    REQUIRE(client1.getPort() != client2.getPort());

    for (uint16_t id = 1; id <= 5; id++) {
        client1.send(listener->getPort(), query("one.example", id));
        client2.send(listener->getPort(), query("two.example", 100 + id));
    }

    std::set<uint16_t> ids1;
    std::set<uint16_t> ids2;
    Bytes response;
    for (int i = 0; i < 200 && (ids1.size() < 5 || ids2.size() < 5); i++) {
        connections.run(0.02);
        while (client1.receive(response)) {
            ids1.insert(DnsCodec::getId(response));
        }
        while (client2.receive(response)) {
            ids2.insert(DnsCodec::getId(response));
        }
    }

    REQUIRE(ids1 == std::set<uint16_t>{1, 2, 3, 4, 5});
    REQUIRE(ids2 == std::set<uint16_t>{101, 102, 103, 104, 105});
    REQUIRE(listener->getActiveConnections() == 2);
    REQUIRE(listener->getStats().answered == 10);
}

TEST_CASE_METHOD(ListenerFixture, "Idle clients are removed") {
    options.clientIdleTimeout = std::chrono::seconds(0);
    auto listener = startListener();
    UdpClient client;

    client.send(listener->getPort(), query("example.com", 9));
    Bytes response;
    REQUIRE(receive(client, response));

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    connections.run(0);
    REQUIRE(listener->getActiveConnections() == 0);
}

TEST_CASE_METHOD(ListenerFixture, "Stopped listener is dropped by the reactor") {
    auto listener = startListener();
    REQUIRE(connections.size() == 1);
    listener->stop();
    connections.run(0);
    REQUIRE(connections.size() == 0);
}
