#include "httpclient.hpp"
#include "logging.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace {
    struct CurlDeleter {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    struct Transfer {
        std::vector<unsigned char>* body;
        size_t maxSize;
    };

    std::once_flag g_curlInit;
};

std::string HttpClient::urlEncode(const std::string& value)
{
    static const char hex[] = "0123456789ABCDEF";
    std::string encoded;
    for (auto ch: value) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0xF];
        }
    }
    return encoded;
}

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds requestTimeout, std::chrono::milliseconds resourceTimeout, size_t maxBodySize)
    : m_requestTimeout(requestTimeout)
    , m_resourceTimeout(resourceTimeout)
    , m_maxBodySize(maxBodySize)
{
    // curl_global_init() is not thread-safe, do it before any worker uses the client
    std::call_once(g_curlInit, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

size_t CurlHttpClient::writeCallback(char* data, size_t size, size_t nmemb, void* userdata)
{
    auto transfer = static_cast<Transfer*>(userdata);
    auto len = size * nmemb;
    if (transfer->body->size() + len > transfer->maxSize) {
        // Returning less than len aborts the transfer
        return 0;
    }
    transfer->body->insert(transfer->body->end(), data, data + len);
    return len;
}

HttpResponse CurlHttpClient::perform(const HttpRequest& request)
{
    HttpResponse response;

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        response.error = "failed to initialize curl handle";
        return response;
    }

    auto timeout = m_resourceTimeout;
    if (request.timeout.count() > 0) {
        timeout = std::min(timeout, request.timeout);
    }
    auto connectTimeout = std::min(m_requestTimeout, timeout);

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (auto& header: request.headers) {
        auto line = header.first + ": " + header.second;
        auto list = curl_slist_append(headers.get(), line.c_str());
        if (list == nullptr) {
            response.error = "failed to allocate request headers";
            return response;
        }
        headers.release();
        headers.reset(list);
    }

    Transfer transfer = { &response.body, m_maxBodySize };
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "dohproxy/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    // A transfer making no progress for the request timeout is considered dead
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, std::max(1L, static_cast<long>(m_requestTimeout.count() / 1000)));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &CurlHttpClient::writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    auto res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = (errorBuffer[0] != 0 ? errorBuffer : curl_easy_strerror(res));
        response.body.clear();
        LOG_DEBUG(request.method, " ", request.url, " failed: ", response.error);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    LOG_DEBUG(request.method, " ", request.url, " returned HTTP ", response.status, " (", response.body.size(), " bytes)");
    return response;
}
