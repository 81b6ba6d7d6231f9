#include <catch2/catch.hpp>

#include "dnscodec.hpp"

using DnsCodec::Bytes;

static Bytes exampleQuery(uint16_t id = 0x1234)
{
    Bytes query = {
        static_cast<unsigned char>(id >> 8), static_cast<unsigned char>(id & 0xFF),
        0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x07, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0x03, 'c', 'o', 'm', 0x00,
        0x00, 0x01, 0x00, 0x01,
    };
    return query;
}

/// Response to exampleQuery() with given A records, the name of each answer is a pointer to the question.
static Bytes exampleResponse(const std::vector<std::vector<unsigned char>>& records)
{
    auto response = exampleQuery();
    response[2] = 0x81;
    response[3] = 0x80;
    response[7] = static_cast<unsigned char>(records.size());
    for (auto& rdata: records) {
        Bytes answer = { 0xC0, 0x0C, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x0E, 0x10, 0x00, static_cast<unsigned char>(rdata.size()) };
        response.insert(response.end(), answer.begin(), answer.end());
        response.insert(response.end(), rdata.begin(), rdata.end());
    }
    return response;
}

TEST_CASE("encodeQuery() builds a recursive A query") {
    auto query = DnsCodec::encodeQuery("example.com");
    REQUIRE(query);

    Bytes expected = {
        0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x07, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0x03, 'c', 'o', 'm', 0x00,
        0x00, 0x01, 0x00, 0x01,
    };
    REQUIRE(query->size() == expected.size() + 2);
    REQUIRE(Bytes(query->begin() + 2, query->end()) == expected);
    REQUIRE(DnsCodec::getId(*query) != 0);

    auto hostname = DnsCodec::extractHostname(*query);
    REQUIRE(hostname);
    REQUIRE(*hostname == "example.com");
}

TEST_CASE("encodeQuery() label handling") {
    SECTION("empty labels are skipped") {
        auto query = DnsCodec::encodeQuery(".example..com.");
        REQUIRE(query);
        REQUIRE(DnsCodec::extractHostname(*query) == std::string("example.com"));
    }

    SECTION("63 byte label is accepted") {
        auto query = DnsCodec::encodeQuery(std::string(63, 'a') + ".com");
        REQUIRE(query);
        REQUIRE((*query)[DnsCodec::HEADER_SIZE] == 63);
    }

    SECTION("64 byte label is rejected") {
        REQUIRE_FALSE(DnsCodec::encodeQuery(std::string(64, 'a') + ".com"));
    }

    SECTION("non-ASCII label is rejected") {
        REQUIRE_FALSE(DnsCodec::encodeQuery("b\xC3\xBC" "cher.de"));
    }
}

TEST_CASE("extractHostname() rejects malformed queries") {
    SECTION("shorter than header") {
        REQUIRE_FALSE(DnsCodec::extractHostname(Bytes(11, 0)));
        REQUIRE_FALSE(DnsCodec::extractHostname(Bytes()));
    }

    SECTION("header only") {
        REQUIRE_FALSE(DnsCodec::extractHostname(Bytes(12, 0)));
    }

    SECTION("root name has no labels") {
        Bytes query(12, 0);
        query.push_back(0);
        REQUIRE_FALSE(DnsCodec::extractHostname(query));
    }

    SECTION("label runs past the end") {
        auto query = exampleQuery();
        query.resize(16);
        REQUIRE_FALSE(DnsCodec::extractHostname(query));
    }

    SECTION("label longer than 63 bytes") {
        auto query = exampleQuery();
        query[12] = 64;
        REQUIRE_FALSE(DnsCodec::extractHostname(query));
    }

    SECTION("compression pointer") {
        auto query = exampleQuery();
        query[12] = 0xC0;
        REQUIRE_FALSE(DnsCodec::extractHostname(query));
    }

    SECTION("missing terminating label") {
        auto query = exampleQuery();
        query.resize(24);
        REQUIRE_FALSE(DnsCodec::extractHostname(query));
    }
}

TEST_CASE("parseResponse() collects A records") {
    auto result = DnsCodec::parseResponse(exampleResponse({{93, 184, 216, 34}}));
    REQUIRE(result.complete);
    REQUIRE(result.addresses == std::vector<std::string>{"93.184.216.34"});

    SECTION("multiple answers keep their order") {
        result = DnsCodec::parseResponse(exampleResponse({{10, 0, 0, 1}, {10, 0, 0, 2}}));
        REQUIRE(result.addresses == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
    }

    SECTION("non-A answers are skipped") {
        auto response = exampleResponse({{0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1}, {1, 2, 3, 4}});
        response[DnsCodec::HEADER_SIZE + 17 + 3] = 28; // first answer is AAAA
        result = DnsCodec::parseResponse(response);
        REQUIRE(result.complete);
        REQUIRE(result.addresses == std::vector<std::string>{"1.2.3.4"});
    }

    SECTION("uncompressed answer name") {
        auto response = exampleQuery();
        response[7] = 1;
        Bytes answer = { 0x03, 'c', 'o', 'm', 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x3C, 0x00, 0x04, 8, 8, 4, 4 };
        response.insert(response.end(), answer.begin(), answer.end());
        result = DnsCodec::parseResponse(response);
        REQUIRE(result.complete);
        REQUIRE(result.addresses == std::vector<std::string>{"8.8.4.4"});
    }

    SECTION("no answers") {
        result = DnsCodec::parseResponse(exampleResponse({}));
        REQUIRE(result.complete);
        REQUIRE(result.addresses.empty());
    }
}

TEST_CASE("parseResponse() tolerates truncated input") {
    auto full = exampleResponse({{10, 0, 0, 1}, {10, 0, 0, 2}});

    SECTION("shorter than header") {
        auto result = DnsCodec::parseResponse(Bytes(full.begin(), full.begin() + 5));
        REQUIRE_FALSE(result.complete);
        REQUIRE(result.addresses.empty());
    }

    SECTION("cut inside question") {
        auto result = DnsCodec::parseResponse(Bytes(full.begin(), full.begin() + 20));
        REQUIRE_FALSE(result.complete);
        REQUIRE(result.addresses.empty());
    }

    SECTION("cut inside second answer keeps the first one") {
        auto result = DnsCodec::parseResponse(Bytes(full.begin(), full.end() - 2));
        REQUIRE_FALSE(result.complete);
        REQUIRE(result.addresses == std::vector<std::string>{"10.0.0.1"});
    }

    SECTION("declared answer count larger than present") {
        auto response = full;
        response[7] = 5;
        auto result = DnsCodec::parseResponse(response);
        REQUIRE_FALSE(result.complete);
        REQUIRE(result.addresses.size() == 2);
    }

    SECTION("reserved label type") {
        auto response = full;
        response[DnsCodec::HEADER_SIZE] = 0x40;
        auto result = DnsCodec::parseResponse(response);
        REQUIRE_FALSE(result.complete);
    }
}

TEST_CASE("synthesizeResponse() answers the query") {
    auto query = exampleQuery(0xBEEF);
    auto response = DnsCodec::synthesizeResponse(query, "example.com", {"93.184.216.34", "1.1.1.1"});

    REQUIRE(DnsCodec::getId(response) == 0xBEEF);
    REQUIRE((response[2] & 0x80) == 0x80);    // QR
    REQUIRE((response[2] & 0x01) == 0x01);    // RD kept
    REQUIRE((response[3] & 0x0F) == 0);       // NOERROR
    REQUIRE(response[6] == 0);
    REQUIRE(response[7] == 2);
    REQUIRE(Bytes(response.begin() + 12, response.begin() + query.size()) == Bytes(query.begin() + 12, query.end()));
    REQUIRE(response.size() == query.size() + 2 * 16);

    // First answer record
    Bytes answer(response.begin() + query.size(), response.begin() + query.size() + 16);
    Bytes expected = { 0xC0, 0x0C, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x01, 0x2C, 0x00, 0x04, 93, 184, 216, 34 };
    REQUIRE(answer == expected);

    auto parsed = DnsCodec::parseResponse(response);
    REQUIRE(parsed.complete);
    REQUIRE(parsed.addresses == std::vector<std::string>{"93.184.216.34", "1.1.1.1"});
}

TEST_CASE("synthesizeResponse() skips IPv6 addresses") {
    auto query = exampleQuery();
    auto response = DnsCodec::synthesizeResponse(query, "example.com", {"2606:2800:220:1::", "10.1.2.3", "not-an-ip"});
    REQUIRE(response[7] == 1);
    REQUIRE(DnsCodec::parseResponse(response).addresses == std::vector<std::string>{"10.1.2.3"});
}

TEST_CASE("synthesizeResponse() fits into a UDP message") {
    auto query = exampleQuery();
    std::vector<std::string> addresses;
    for (int i = 1; i <= 40; i++) {
        addresses.push_back("10.0.0." + std::to_string(i));
    }

    auto response = DnsCodec::synthesizeResponse(query, "example.com", addresses);
    REQUIRE(response.size() <= DnsCodec::MAX_UDP_SIZE);
    REQUIRE((response[2] & 0x02) == 0x02);    // TC

    // 29 bytes of header and question leave room for 30 records
    size_t written = (DnsCodec::MAX_UDP_SIZE - query.size()) / 16;
    REQUIRE(written == 30);
    REQUIRE(response.size() == query.size() + written * 16);
    REQUIRE(response[6] == 0);
    REQUIRE(response[7] == written);

    auto parsed = DnsCodec::parseResponse(response);
    REQUIRE(parsed.complete);
    REQUIRE(parsed.addresses.size() == written);
    REQUIRE(parsed.addresses.front() == "10.0.0.1");

    SECTION("TC stays clear when all records fit") {
        addresses.resize(written);
        response = DnsCodec::synthesizeResponse(query, "example.com", addresses);
        REQUIRE(response.size() == query.size() + written * 16);
        REQUIRE((response[2] & 0x02) == 0);
    }
}

TEST_CASE("synthesizeResponse() drops additional records of the query") {
    auto query = exampleQuery();
    query[11] = 1;
    Bytes opt = { 0x00, 0x00, 0x29, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
    query.insert(query.end(), opt.begin(), opt.end());

    auto response = DnsCodec::synthesizeResponse(query, "example.com", {"10.1.2.3"});
    REQUIRE(response[11] == 0);
    REQUIRE(response.size() == query.size() - opt.size() + 16);
    REQUIRE(DnsCodec::parseResponse(response).addresses == std::vector<std::string>{"10.1.2.3"});
}

TEST_CASE("synthesizeResponse() falls back to SERVFAIL for broken question") {
    auto query = exampleQuery();
    query.resize(26); // QTYPE/QCLASS cut off
    auto response = DnsCodec::synthesizeResponse(query, "example.com", {"10.1.2.3"});
    REQUIRE(response.size() == query.size());
    REQUIRE((response[3] & 0x0F) == DnsCodec::RCODE_SERVFAIL);
}

TEST_CASE("synthesizeServfail() sets QR and RCODE") {
    auto query = exampleQuery(0x4242);
    query[3] = 0x10;    // AD bit set by client
    auto response = DnsCodec::synthesizeServfail(query);

    REQUIRE(response.size() == query.size());
    REQUIRE(DnsCodec::getId(response) == 0x4242);
    REQUIRE((response[2] & 0x80) == 0x80);
    REQUIRE((response[3] & 0x0F) == DnsCodec::RCODE_SERVFAIL);
    REQUIRE((response[3] & 0xF0) == 0x10);
    REQUIRE(Bytes(response.begin() + 4, response.end()) == Bytes(query.begin() + 4, query.end()));

    SECTION("query shorter than header yields nothing") {
        REQUIRE(DnsCodec::synthesizeServfail(Bytes(11, 0)).empty());
        REQUIRE(DnsCodec::synthesizeServfail(Bytes{0x12}).empty());
    }
}

TEST_CASE("IP literal helpers") {
    REQUIRE(DnsCodec::isIPv4Literal("93.184.216.34"));
    REQUIRE_FALSE(DnsCodec::isIPv4Literal("example.com."));
    REQUIRE_FALSE(DnsCodec::isIPv4Literal("::1"));
    REQUIRE(DnsCodec::isIPv6Literal("2606:4700::1111"));
    REQUIRE_FALSE(DnsCodec::isIPv6Literal("1.1.1.1"));

    unsigned char ip[4];
    REQUIRE(DnsCodec::parseIPv4("192.168.1.254", ip));
    REQUIRE(ip[0] == 192);
    REQUIRE(ip[3] == 254);
    REQUIRE_FALSE(DnsCodec::parseIPv4("256.1.1.1", ip));
    REQUIRE_FALSE(DnsCodec::parseIPv4("1.2.3", ip));
}
