#include "dispatcher.hpp"
#include "logging.hpp"

static constexpr std::chrono::seconds STATUS_INTERVAL{60};

static DohResolver::Options resolverOptions(const Config& config)
{
    DohResolver::Options options;
    options.cacheTtl = std::chrono::seconds(config.cache_ttl);
    options.deadline = std::chrono::seconds(config.resolve_deadline);
    options.systemFallback = config.system_fallback;
    return options;
}

Dispatcher::Dispatcher(const Config& config, const std::shared_ptr<HttpClient>& http)
    : m_config(config)
    , m_http(http)
    , m_lastPurge(std::chrono::steady_clock::now())
    , m_lastStatus(m_lastPurge)
{
    if (!m_http) {
        m_http = std::make_shared<CurlHttpClient>(std::chrono::seconds(config.http_request_timeout),
                                                  std::chrono::seconds(config.http_resource_timeout));
    }
    m_resolver = std::make_shared<DohResolver>(m_http, config.provider, resolverOptions(config));
    m_pool = std::make_shared<WorkerPool>(config.worker_threads);

    Listener::Options listenerOptions;
    listenerOptions.ip = config.listen_address.first;
    listenerOptions.port = config.listen_address.second;
    listenerOptions.clientIdleTimeout = std::chrono::seconds(config.client_idle_timeout);
    m_listener = std::make_shared<Listener>(listenerOptions, m_resolver, m_pool);

    LOG_INFO("Using DoH provider ", getProviderInfo(config.provider).displayName,
             ", cache TTL ", config.cache_ttl, "s, ", config.worker_threads, " worker(s)");
}

Dispatcher::~Dispatcher()
{
    stopListener();
    // Let in-flight resolutions finish before the resolver goes away
    m_pool->shutdown();
}

void Dispatcher::setProvider(Provider provider)
{
    m_resolver->setProvider(provider);
    LOG_INFO("Switched DoH provider to ", getProviderInfo(provider).displayName);
}

void Dispatcher::startListener()
{
    m_listener->start();
    m_connections.add(m_listener);
}

void Dispatcher::stopListener()
{
    m_listener->stop();
    m_connections.remove(m_listener);
}

std::pair<std::string, uint16_t> Dispatcher::getProxyEndpoint() const
{
    return std::make_pair(m_listener->getAddress(), m_listener->getPort());
}

std::vector<std::string> Dispatcher::resolve(const std::string& hostname)
{
    return m_resolver->resolve(hostname);
}

void Dispatcher::clearCache()
{
    m_resolver->clearCache();
    LOG_INFO("DNS cache cleared");
}

void Dispatcher::logStatus()
{
    auto& stats = m_listener->getStats();
    LOG_VERBOSE("Status: listener ", toString(m_listener->getState()),
                ", clients ", m_listener->getActiveConnections(),
                ", queries ", stats.queries,
                ", answered ", stats.answered,
                ", servfails ", stats.servfails,
                ", dropped ", stats.dropped,
                ", cached ", m_resolver->getCacheSize(),
                ", upstream ", m_resolver->getUpstreamQueries(),
                ", pending ", m_pool->pending());
}

void Dispatcher::run(double timeout)
{
    m_connections.run(timeout);

    auto now = std::chrono::steady_clock::now();
    auto purgeDelay = std::chrono::seconds(m_config.cache_ttl > 0 ? m_config.cache_ttl : 1);
    if ((now - m_lastPurge) > purgeDelay) {
        auto purged = m_resolver->purgeCache();
        if (purged > 0) {
            LOG_DEBUG("Purged ", purged, " expired cache entries");
        }
        m_lastPurge = now;
    }

    if ((now - m_lastStatus) > STATUS_INTERVAL) {
        logStatus();
        m_lastStatus = now;
    }
}
