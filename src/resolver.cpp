#include "resolver.hpp"
#include "logging.hpp"

#include <cctype>
#include <exception>

static std::string join(const std::vector<std::string>& addresses)
{
    std::string out;
    for (auto& address: addresses) {
        if (out.empty() == false) {
            out += ",";
        }
        out += address;
    }
    return out;
}

/// Names differing only in case are the same DNS name.
static std::string cacheKey(const std::string& hostname)
{
    std::string key(hostname);
    for (auto& c: key) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

DohResolver::DohResolver(const std::shared_ptr<HttpClient>& http, Provider provider, const Options& options)
    : m_http(http)
    , m_options(options)
    , m_cache(options.cacheTtl, options.now)
{
    m_state = buildState(provider, 0);
    LOG_INFO("DoH resolver using ", getProviderInfo(provider).displayName);
}

DohResolver::Strategies DohResolver::buildStrategies(Provider provider, const std::shared_ptr<HttpClient>& http, const Options& options)
{
    Strategies strategies;
    auto& info = getProviderInfo(provider);
    if (info.supportsJson) {
        strategies.emplace_back(std::make_shared<JsonStrategy>(http, info.jsonUrl));
    }
    if (info.supportsWire) {
        strategies.emplace_back(std::make_shared<WireStrategy>(http, info.wireUrl));
    }
    if (options.systemFallback) {
        strategies.emplace_back(std::make_shared<SystemStrategy>(options.systemLookup));
    }
    return strategies;
}

std::shared_ptr<const DohResolver::State> DohResolver::buildState(Provider provider, uint64_t generation) const
{
    auto state = std::make_shared<State>();
    state->provider = provider;
    state->strategies = buildStrategies(provider, m_http, m_options);
    state->generation = generation;
    return state;
}

std::shared_ptr<const DohResolver::State> DohResolver::getState() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

std::vector<std::string> DohResolver::resolve(const std::string& hostname)
{
    auto key = cacheKey(hostname);
    auto cached = m_cache.get(key);
    if (cached) {
        LOG_DEBUG("Using cached resolution for ", hostname, ": ", join(*cached));
        return *cached;
    }

    auto state = getState();
    ResolutionStrategy::Deadline deadline;
    if (m_options.deadline.count() > 0) {
        deadline = ResolutionStrategy::Clock::now() + m_options.deadline;
    }

    LOG_VERBOSE("Resolving ", hostname, " via ", getProviderInfo(state->provider).displayName);

    for (auto& strategy: state->strategies) {
        if (deadline && ResolutionStrategy::Clock::now() >= *deadline) {
            LOG_INFO("Resolving ", hostname, " exceeded deadline, giving up before ", strategy->name(), " lookup");
            break;
        }

        m_upstreamQueries++;
        ResolutionStrategy::Result addresses;
        try {
            addresses = strategy->attempt(hostname, deadline);
        } catch (std::exception& e) {
            LOG_ERROR(strategy->name(), " lookup of ", hostname, " failed: ", e.what());
            continue;
        } catch (...) {
            LOG_ERROR(strategy->name(), " lookup of ", hostname, " failed with unknown exception");
            continue;
        }

        if (addresses && addresses->empty() == false) {
            LOG_VERBOSE(strategy->name(), " lookup resolved ", hostname, " to ", join(*addresses));

            // Don't let a result from the previous provider outlive the switch
            {
                std::lock_guard<std::mutex> lock(m_stateMutex);
                if (m_state->generation == state->generation) {
                    m_cache.put(key, *addresses);
                }
            }
            return *addresses;
        }
    }

    LOG_INFO("Failed to resolve ", hostname, " through any method");
    return std::vector<std::string>();
}

void DohResolver::setProvider(Provider provider)
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = buildState(provider, m_state->generation + 1);
        m_cache.clear();
    }
    LOG_INFO("Changed DoH provider to ", getProviderInfo(provider).displayName);
}

Provider DohResolver::getProvider() const
{
    return getState()->provider;
}

void DohResolver::clearCache()
{
    m_cache.clear();
    LOG_VERBOSE("DNS cache cleared");
}

size_t DohResolver::purgeCache()
{
    return m_cache.purgeExpired();
}
