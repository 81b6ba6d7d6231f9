/**
 * @file dnscodec.hpp
 * @brief RFC 1035 wire format encoding and decoding.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @namespace DnsCodec
 * @brief Stateless functions converting between DNS messages and their binary form.
 *
 * Only a small subset of RFC 1035 is supported: a single question for an A
 * record and A record answers. All parsers tolerate truncated or malicious
 * input and never throw.
 */
namespace DnsCodec {
    /**
     * @brief Type alias for a raw byte buffer.
     */
    typedef std::vector<unsigned char> Bytes;

    static const size_t   HEADER_SIZE    = 12;   ///< Fixed size of the DNS header.
    static const size_t   MAX_LABEL_LEN  = 63;   ///< Longest label allowed in a name.
    static const size_t   MAX_UDP_SIZE   = 512;  ///< Largest classic UDP DNS message.
    static const uint16_t TYPE_A         = 1;
    static const uint16_t TYPE_AAAA      = 28;
    static const uint16_t CLASS_IN       = 1;
    static const uint8_t  RCODE_SERVFAIL = 2;
    static const uint32_t ANSWER_TTL     = 300;  ///< TTL put in synthesized answers.

    /**
     * @struct ParseResult
     * @brief Outcome of parsing a response message.
     *
     * When the message is truncated or malformed, `complete` is false and
     * `addresses` holds the answers parsed before the point of failure.
     */
    struct ParseResult {
        std::vector<std::string> addresses; ///< IPv4 addresses in dotted-decimal notation.
        bool complete = true;               ///< False if parsing stopped early.
    };

    /**
     * @brief Builds a recursive A query for the hostname.
     *
     * The header gets a random transaction ID, flags 0x0100 and QDCOUNT=1.
     * Empty labels (leading, trailing or doubled dots) are skipped.
     *
     * @param hostname Domain name to query.
     * @return Query message, or nothing when a label is longer than 63 bytes
     *         or contains non-ASCII characters.
     */
    std::optional<Bytes> encodeQuery(const std::string& hostname);

    /**
     * @brief Extracts the queried name from the first question of a query.
     *
     * @param query Raw query message.
     * @return Dot separated hostname, or nothing if the message is too short,
     *         a label is invalid or the name has no labels.
     */
    std::optional<std::string> extractHostname(const Bytes& query);

    /**
     * @brief Collects IPv4 addresses from the answer section of a response.
     *
     * Questions are skipped, compression pointers are not followed but only
     * stepped over. Non-A answers are ignored.
     */
    ParseResult parseResponse(const Bytes& response);

    /**
     * @brief Builds a response to the query with one A record per address.
     *
     * Header and question are copied from the query, QR bit is set and ANCOUNT
     * is the number of records written. Answers use a compression pointer to
     * the question name. Addresses that are not IPv4 literals are skipped.
     * Records that would grow the message past MAX_UDP_SIZE are left out and
     * the TC bit is set.
     *
     * @param query Original query message.
     * @param hostname The name that was resolved.
     * @param addresses Resolved addresses.
     * @return Response message, empty if the query is shorter than a header.
     */
    Bytes synthesizeResponse(const Bytes& query, const std::string& hostname, const std::vector<std::string>& addresses);

    /**
     * @brief Turns the query into a SERVFAIL response.
     * @return Response message, empty if the query is shorter than a header.
     */
    Bytes synthesizeServfail(const Bytes& query);

    /**
     * @brief Returns transaction ID of the message, 0 for messages shorter than 2 bytes.
     */
    uint16_t getId(const Bytes& message);

    /** @brief True if the text looks like an IPv4 literal: has dots and no letters. */
    bool isIPv4Literal(const std::string& text);

    /** @brief True if the text looks like an IPv6 literal: has a colon. */
    bool isIPv6Literal(const std::string& text);

    /**
     * @brief Strictly parses dotted-decimal IPv4 address into 4 bytes.
     * @return False if the text is not a valid IPv4 address.
     */
    bool parseIPv4(const std::string& text, unsigned char (&out)[4]);
};
