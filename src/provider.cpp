#include "provider.hpp"

#include <cctype>
#include <stdexcept>

static const std::vector<ProviderInfo> g_providers = {
    { Provider::Google,     "google",     "Google DNS",
      "https://dns.google/dns-query",              "https://dns.google/resolve",           true,  false },
    { Provider::Cloudflare, "cloudflare", "Cloudflare DNS",
      "https://cloudflare-dns.com/dns-query",      "https://cloudflare-dns.com/dns-query", true,  true  },
    { Provider::Quad9,      "quad9",      "Quad9 DNS",
      "https://dns.quad9.net/dns-query",           "https://dns.quad9.net/dns-query",      true,  true  },
    { Provider::ControlD,   "controld",   "ControlD DNS",
      "https://freedns.controld.com/p2/dns-query", "",                                     false, true  },
};

const ProviderInfo& getProviderInfo(Provider provider)
{
    for (auto& info: g_providers) {
        if (info.provider == provider) {
            return info;
        }
    }
    throw std::out_of_range("unknown DoH provider");
}

const std::vector<ProviderInfo>& getProviders()
{
    return g_providers;
}

bool parseProvider(const std::string& name, Provider& provider)
{
    std::string lower;
    for (auto c: name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (auto& info: g_providers) {
        if (lower == info.name) {
            provider = info.provider;
            return true;
        }
    }
    return false;
}
