#include "strategy.hpp"
#include "dnscodec.hpp"
#include "logging.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <algorithm>

#include <nlohmann/json.hpp>

std::chrono::milliseconds ResolutionStrategy::remaining(const Deadline& deadline)
{
    if (!deadline) {
        return std::chrono::milliseconds(0);
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(1));
}

JsonStrategy::JsonStrategy(const std::shared_ptr<HttpClient>& http, const std::string& url)
    : m_http(http)
    , m_url(url)
{
}

std::vector<std::string> JsonStrategy::parseBody(const std::vector<unsigned char>& body)
{
    std::vector<std::string> addresses;

    auto json = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (json.is_discarded() || json.is_object() == false) {
        return addresses;
    }

    auto answers = json.find("Answer");
    if (answers == json.end() || answers->is_array() == false) {
        return addresses;
    }

    for (auto& answer: *answers) {
        if (answer.is_object() == false) {
            continue;
        }
        auto type = answer.find("type");
        auto data = answer.find("data");
        if (type == answer.end() || type->is_number_integer() == false ||
            data == answer.end() || data->is_string() == false) {
            continue;
        }

        auto rrtype = type->get<int>();
        if (rrtype != DnsCodec::TYPE_A && rrtype != DnsCodec::TYPE_AAAA) {
            continue;
        }

        // CNAME targets also end up here for some providers, keep only IP literals
        auto value = data->get<std::string>();
        if (DnsCodec::isIPv4Literal(value) || DnsCodec::isIPv6Literal(value)) {
            addresses.emplace_back(std::move(value));
        }
    }

    return addresses;
}

ResolutionStrategy::Result JsonStrategy::attempt(const std::string& hostname, const Deadline& deadline)
{
    HttpRequest request;
    request.method = "GET";
    request.url = m_url + "?name=" + HttpClient::urlEncode(hostname) + "&type=A&do=false&cd=false";
    request.headers.emplace_back("Accept", "application/dns-json");
    request.timeout = remaining(deadline);

    auto response = m_http->perform(request);
    if (response.status != 200) {
        if (response.status == 0) {
            LOG_VERBOSE("JSON query for ", hostname, " failed: ", response.error);
        } else {
            LOG_VERBOSE("JSON query for ", hostname, " returned HTTP ", response.status);
        }
        return std::nullopt;
    }

    auto addresses = parseBody(response.body);
    if (addresses.empty()) {
        LOG_VERBOSE("JSON query for ", hostname, " returned no usable answers");
        return std::nullopt;
    }
    return addresses;
}

WireStrategy::WireStrategy(const std::shared_ptr<HttpClient>& http, const std::string& url)
    : m_http(http)
    , m_url(url)
{
}

ResolutionStrategy::Result WireStrategy::attempt(const std::string& hostname, const Deadline& deadline)
{
    auto query = DnsCodec::encodeQuery(hostname);
    if (!query) {
        LOG_VERBOSE("Can't encode ", hostname, " into DNS query");
        return std::nullopt;
    }

    HttpRequest request;
    request.method = "POST";
    request.url = m_url;
    request.headers.emplace_back("Content-Type", "application/dns-message");
    request.headers.emplace_back("Accept", "application/dns-message");
    request.body = std::move(*query);
    request.timeout = remaining(deadline);

    auto response = m_http->perform(request);
    if (response.status != 200) {
        if (response.status == 0) {
            LOG_VERBOSE("Wire query for ", hostname, " failed: ", response.error);
        } else {
            LOG_VERBOSE("Wire query for ", hostname, " returned HTTP ", response.status);
        }
        return std::nullopt;
    }

    auto parsed = DnsCodec::parseResponse(response.body);
    if (parsed.complete == false) {
        LOG_DEBUG("Wire response for ", hostname, " truncated, using ", parsed.addresses.size(), " parsed answer(s)");
    }
    if (parsed.addresses.empty()) {
        return std::nullopt;
    }
    return parsed.addresses;
}

SystemStrategy::SystemStrategy(LookupFunc lookup)
    : m_lookup(lookup)
{
}

ResolutionStrategy::Result SystemStrategy::attempt(const std::string& hostname, const Deadline& /*deadline*/)
{
    // getaddrinfo() can't be interrupted, the deadline is only checked between strategies
    auto addresses = m_lookup(hostname);
    if (addresses.empty()) {
        return std::nullopt;
    }
    return addresses;
}

std::vector<std::string> SystemStrategy::getAddrInfo(const std::string& hostname)
{
    std::vector<std::string> addresses;

    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    auto res = ::getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (res != 0) {
        LOG_VERBOSE("System lookup of ", hostname, " failed: ", gai_strerror(res));
        return addresses;
    }
    std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> guard(result, ::freeaddrinfo);

    for (auto ai = result; ai != nullptr; ai = ai->ai_next) {
        char host[NI_MAXHOST] = {0};
        if (::getnameinfo(ai->ai_addr, ai->ai_addrlen, host, sizeof(host), nullptr, 0, NI_NUMERICHOST) != 0) {
            continue;
        }
        std::string address(host);
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.emplace_back(std::move(address));
        }
    }

    return addresses;
}
