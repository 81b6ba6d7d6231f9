#include "config.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <regex>

/// Converts decimal digits, false when the value doesn't fit.
static bool parseNumber(const std::string& text, unsigned long& value)
{
    errno = 0;
    value = std::strtoul(text.c_str(), nullptr, 10);
    return (errno != ERANGE);
}

void Config::parseFile(const std::string& path)
{
    std::regex reLogLevel      ("^[ \t]*LOG_LEVEL[= \t]+([^# \t]*)[ \t]*$");
    std::regex reLogFacility   ("^[ \t]*SYSLOG_FACILITY[= \t]+([^# \t]*)[ \t]*$");
    std::regex reLogId         ("^[ \t]*SYSLOG_ID[= \t]+([^# \t]*)[ \t]*$");
    std::regex reListenAddr    ("^[ \t]*LISTEN_ADDRESS[= \t]+([0-9]{1,3}(\\.[0-9]{1,3}){3})(:([0-9]{1,5}))?[ \t]*$");
    std::regex reProvider      ("^[ \t]*PROVIDER[= \t]+([^# \t]*)[ \t]*$");
    std::regex reNumber        ("^[ \t]*([A-Z_]+)[= \t]+([0-9]+)[ \t]*$");
    std::regex reFallback      ("^[ \t]*SYSTEM_FALLBACK[= \t]+([^# \t]*)[ \t]*$");

    auto toLower = [](const std::string& s) {
        std::string o;
        for (auto c: s) {
            o += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return o;
    };

    std::ifstream file(path);
    if (!file) {
        throw ConfigException("can't open config file " + path);
    }

    std::string line;
    while (std::getline(file, line)) {
        std::smatch tokens;

        // Strip off any comments and trailing whitespace
        auto pos = line.find_first_of('#');
        if (pos != std::string::npos) {
            line = line.erase(pos);
        }
        pos = line.find_last_not_of(" \t\r");
        if (pos == std::string::npos) {
            continue;
        }
        line = line.erase(pos + 1);

        if (std::regex_match(line, tokens, reLogLevel)) {
            if (Log::parseLevel(tokens[1].str(), log_level) == false) {
                fprintf(stderr, "ERROR: Invalid config value LOG_LEVEL=%s\n", tokens[1].str().c_str());
            }

        } else if (std::regex_match(line, tokens, reLogFacility)) {
            int facility;
            if (tokens[1].str().empty() || Log::parseFacility(tokens[1].str(), facility)) {
                syslog_facility = tokens[1].str();
            } else {
                fprintf(stderr, "ERROR: Invalid config value SYSLOG_FACILITY=%s\n", tokens[1].str().c_str());
            }

        } else if (std::regex_match(line, tokens, reLogId)) {
            syslog_id = tokens[1].str();

        } else if (std::regex_match(line, tokens, reListenAddr)) {
            auto addr = tokens[1].str();
            auto port = listen_address.second;
            if (tokens[4].matched) {
                unsigned long tmp;
                if (parseNumber(tokens[4].str(), tmp) && tmp > 0 && tmp <= 65535) {
                    port = static_cast<uint16_t>(tmp);
                } else {
                    fprintf(stderr, "ERROR: Invalid port in config value LISTEN_ADDRESS=%s\n", line.c_str());
                    continue;
                }
            }
            if (addr.compare(0, 4, "127.") != 0) {
                fprintf(stderr, "ERROR: LISTEN_ADDRESS must be a loopback address, ignoring %s\n", addr.c_str());
                continue;
            }
            listen_address = {addr, port};

        } else if (std::regex_match(line, tokens, reProvider)) {
            if (parseProvider(tokens[1].str(), provider) == false) {
                fprintf(stderr, "ERROR: Invalid config value PROVIDER=%s\n", tokens[1].str().c_str());
            }

        } else if (std::regex_match(line, tokens, reFallback)) {
            auto value = toLower(tokens[1].str());
            if      (value == "yes" || value == "true"  || value == "1") { system_fallback = true; }
            else if (value == "no"  || value == "false" || value == "0") { system_fallback = false; }
            else { fprintf(stderr, "ERROR: Invalid config value SYSTEM_FALLBACK=%s\n", tokens[1].str().c_str()); }

        } else if (std::regex_match(line, tokens, reNumber)) {
            auto key = tokens[1].str();
            unsigned long tmp;
            bool valid = parseNumber(tokens[2].str(), tmp);

            // Name, target and whether 0 is acceptable
            struct { const char* name; unsigned* value; bool allowZero; } numbers[] = {
                { "CACHE_TTL",             &cache_ttl,             true  },
                { "HTTP_REQUEST_TIMEOUT",  &http_request_timeout,  false },
                { "HTTP_RESOURCE_TIMEOUT", &http_resource_timeout, false },
                { "RESOLVE_DEADLINE",      &resolve_deadline,      true  },
                { "WORKER_THREADS",        &worker_threads,        false },
                { "CLIENT_IDLE_TIMEOUT",   &client_idle_timeout,   false },
            };

            bool known = false;
            for (auto& number: numbers) {
                if (key == number.name) {
                    known = true;
                    if (valid && (tmp > 0 || number.allowZero) && tmp < 1000000) {
                        *number.value = static_cast<unsigned>(tmp);
                    } else {
                        fprintf(stderr, "ERROR: Invalid config value %s=%s\n", key.c_str(), tokens[2].str().c_str());
                    }
                }
            }
            if (known == false) {
                fprintf(stderr, "ERROR: Unknown config option %s\n", key.c_str());
            }

        } else {
            fprintf(stderr, "ERROR: Invalid config line '%s'\n", line.c_str());
        }
    }
}
