/**
 * @file provider.hpp
 * @brief Upstream DNS-over-HTTPS endpoints.
 */

#pragma once

#include <string>
#include <vector>

/**
 * @enum Provider
 * @brief Upstream DoH service the resolver sends queries to.
 */
enum class Provider {
    Google,
    Cloudflare,
    Quad9,
    ControlD,
};

/**
 * @struct ProviderInfo
 * @brief Static description of a provider's endpoints and capabilities.
 *
 * Every provider supports at least one of the two query APIs.
 */
struct ProviderInfo {
    Provider provider;
    const char* name;           ///< Config name, lowercase.
    const char* displayName;    ///< Human readable name.
    const char* wireUrl;        ///< RFC 8484 endpoint accepting POSTed wire format queries.
    const char* jsonUrl;        ///< Endpoint accepting JSON API GET queries.
    bool supportsJson;
    bool supportsWire;
};

/**
 * @brief Returns description of the provider.
 */
const ProviderInfo& getProviderInfo(Provider provider);

/**
 * @brief Returns descriptions of all known providers.
 */
const std::vector<ProviderInfo>& getProviders();

/**
 * @brief Finds provider by its config name, case-insensitive.
 *
 * @param name Provider name, e.g. "cloudflare".
 * @param provider Receives the provider on success.
 * @return False if the name is unknown.
 */
bool parseProvider(const std::string& name, Provider& provider);
