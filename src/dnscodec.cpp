#include "dnscodec.hpp"

#include <arpa/inet.h>

#include <cctype>
#include <random>

namespace DnsCodec {

    static const uint8_t FLAG_QR      = 0x80; // in byte 2
    static const uint8_t FLAG_TC      = 0x02; // in byte 2
    static const size_t  A_RECORD_LEN = 16;
    static const uint8_t POINTER_MASK = 0xC0;

    static inline uint16_t read16(const Bytes& buffer, size_t offset)
    {
        return static_cast<uint16_t>((buffer[offset] << 8) | buffer[offset + 1]);
    }

    static inline void write16(Bytes& buffer, size_t offset, uint16_t value)
    {
        buffer[offset]     = static_cast<unsigned char>(value >> 8);
        buffer[offset + 1] = static_cast<unsigned char>(value & 0xFF);
    }

    static inline void append16(Bytes& buffer, uint16_t value)
    {
        buffer.push_back(static_cast<unsigned char>(value >> 8));
        buffer.push_back(static_cast<unsigned char>(value & 0xFF));
    }

    static uint16_t randomId()
    {
        static thread_local std::mt19937 generator{std::random_device{}()};
        std::uniform_int_distribution<unsigned> distribution(1, 0xFFFF);
        return static_cast<uint16_t>(distribution(generator));
    }

    /**
     * Steps over a name at the offset, a compression pointer ends the name.
     * Returns false when the name runs past the end of the buffer or uses
     * reserved label types.
     */
    static bool skipName(const Bytes& buffer, size_t& offset)
    {
        while (true) {
            if (offset >= buffer.size()) {
                return false;
            }
            auto len = buffer[offset++];
            if (len == 0) {
                return true;
            }
            if ((len & POINTER_MASK) == POINTER_MASK) {
                if (offset >= buffer.size()) {
                    return false;
                }
                offset++;
                return true;
            }
            if ((len & POINTER_MASK) != 0) {
                return false;
            }
            offset += len;
        }
    }

    std::optional<Bytes> encodeQuery(const std::string& hostname)
    {
        Bytes query;
        query.reserve(HEADER_SIZE + hostname.length() + 6);

        append16(query, randomId());
        append16(query, 0x0100);    // standard query, recursion desired
        append16(query, 1);         // QDCOUNT
        append16(query, 0);         // ANCOUNT
        append16(query, 0);         // NSCOUNT
        append16(query, 0);         // ARCOUNT

        size_t start = 0;
        while (start <= hostname.length()) {
            auto end = hostname.find('.', start);
            if (end == std::string::npos) {
                end = hostname.length();
            }
            auto len = end - start;
            if (len > MAX_LABEL_LEN) {
                return std::nullopt;
            }
            if (len > 0) {
                query.push_back(static_cast<unsigned char>(len));
                for (size_t i = start; i < end; i++) {
                    auto c = static_cast<unsigned char>(hostname[i]);
                    if (c > 0x7F) {
                        return std::nullopt;
                    }
                    query.push_back(c);
                }
            }
            start = end + 1;
        }
        query.push_back(0);

        append16(query, TYPE_A);
        append16(query, CLASS_IN);
        return query;
    }

    std::optional<std::string> extractHostname(const Bytes& query)
    {
        if (query.size() < HEADER_SIZE) {
            return std::nullopt;
        }

        std::string hostname;
        size_t offset = HEADER_SIZE;
        while (true) {
            if (offset >= query.size()) {
                // Name not terminated
                return std::nullopt;
            }
            size_t len = query[offset++];
            if (len == 0) {
                break;
            }
            if (len > MAX_LABEL_LEN || offset + len > query.size()) {
                return std::nullopt;
            }
            if (hostname.empty() == false) {
                hostname += '.';
            }
            hostname.append(reinterpret_cast<const char*>(query.data() + offset), len);
            offset += len;
        }

        if (hostname.empty()) {
            return std::nullopt;
        }
        return hostname;
    }

    ParseResult parseResponse(const Bytes& response)
    {
        ParseResult result;
        if (response.size() < HEADER_SIZE) {
            result.complete = false;
            return result;
        }

        auto qdCount = read16(response, 4);
        auto anCount = read16(response, 6);
        size_t offset = HEADER_SIZE;

        for (uint16_t i = 0; i < qdCount; i++) {
            if (skipName(response, offset) == false || offset + 4 > response.size()) {
                result.complete = false;
                return result;
            }
            offset += 4; // QTYPE + QCLASS
        }

        for (uint16_t i = 0; i < anCount; i++) {
            // TYPE, CLASS, TTL and RDLENGTH take 10 bytes
            if (skipName(response, offset) == false || offset + 10 > response.size()) {
                result.complete = false;
                return result;
            }
            auto type = read16(response, offset);
            offset += 4; // TYPE + CLASS
            offset += 4; // TTL
            size_t rdLength = read16(response, offset);
            offset += 2;

            if (offset + rdLength > response.size()) {
                result.complete = false;
                return result;
            }

            if (type == TYPE_A && rdLength == 4) {
                std::string ip = std::to_string(response[offset])     + "." +
                                 std::to_string(response[offset + 1]) + "." +
                                 std::to_string(response[offset + 2]) + "." +
                                 std::to_string(response[offset + 3]);
                result.addresses.emplace_back(std::move(ip));
            }
            offset += rdLength;
        }

        return result;
    }

    Bytes synthesizeResponse(const Bytes& query, const std::string& /*hostname*/, const std::vector<std::string>& addresses)
    {
        if (query.size() < HEADER_SIZE) {
            return Bytes();
        }

        // Question ends after the terminating zero label and QTYPE/QCLASS
        size_t questionEnd = HEADER_SIZE;
        while (questionEnd < query.size() && query[questionEnd] != 0) {
            if ((query[questionEnd] & POINTER_MASK) != 0) {
                return synthesizeServfail(query);
            }
            questionEnd += query[questionEnd] + 1;
        }
        questionEnd += 5;
        if (questionEnd > query.size()) {
            return synthesizeServfail(query);
        }

        Bytes response(query.begin(), query.begin() + questionEnd);
        response[2] |= FLAG_QR;
        write16(response, 4, 1);    // QDCOUNT, only the first question is echoed
        write16(response, 8, 0);    // NSCOUNT
        write16(response, 10, 0);   // ARCOUNT, EDNS records are not echoed

        uint16_t answers = 0;
        for (auto& address: addresses) {
            unsigned char ip[4];
            if (parseIPv4(address, ip) == false) {
                continue;
            }
            if (response.size() + A_RECORD_LEN > MAX_UDP_SIZE) {
                response[2] |= FLAG_TC;
                break;
            }
            append16(response, 0xC00C);     // pointer to the question name
            append16(response, TYPE_A);
            append16(response, CLASS_IN);
            append16(response, static_cast<uint16_t>(ANSWER_TTL >> 16));
            append16(response, static_cast<uint16_t>(ANSWER_TTL & 0xFFFF));
            append16(response, 4);
            response.insert(response.end(), ip, ip + 4);
            answers++;
        }
        write16(response, 6, answers);

        return response;
    }

    Bytes synthesizeServfail(const Bytes& query)
    {
        if (query.size() < HEADER_SIZE) {
            return Bytes();
        }
        Bytes response(query);
        response[2] |= FLAG_QR;
        response[3] = static_cast<unsigned char>((response[3] & 0xF0) | RCODE_SERVFAIL);
        return response;
    }

    uint16_t getId(const Bytes& message)
    {
        if (message.size() < 2) {
            return 0;
        }
        return read16(message, 0);
    }

    bool isIPv4Literal(const std::string& text)
    {
        if (text.find('.') == std::string::npos) {
            return false;
        }
        for (auto c: text) {
            if (std::isalpha(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }

    bool isIPv6Literal(const std::string& text)
    {
        return (text.find(':') != std::string::npos);
    }

    bool parseIPv4(const std::string& text, unsigned char (&out)[4])
    {
        struct in_addr addr;
        if (::inet_pton(AF_INET, text.c_str(), &addr) != 1) {
            return false;
        }
        auto bytes = reinterpret_cast<const unsigned char*>(&addr.s_addr);
        for (int i = 0; i < 4; i++) {
            out[i] = bytes[i];
        }
        return true;
    }
};
