/**
 * @file httpclient.hpp
 * @brief Minimal HTTPS client used to reach DoH providers.
 */

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

/**
 * @struct HttpRequest
 * @brief Single HTTP request.
 */
struct HttpRequest {
    std::string method = "GET";                                  ///< GET or POST.
    std::string url;                                             ///< Full URL including the query string.
    std::vector<std::pair<std::string, std::string>> headers;    ///< Extra request headers.
    std::vector<unsigned char> body;                             ///< POST payload.
    std::chrono::milliseconds timeout{0};                        ///< Overall limit, 0 uses the client default.
};

/**
 * @struct HttpResponse
 * @brief Result of a request.
 *
 * Transport failures (DNS, TLS, timeout) leave status at 0 and describe the
 * problem in error.
 */
struct HttpResponse {
    long status = 0;                    ///< HTTP status code, 0 if no response was received.
    std::vector<unsigned char> body;    ///< Response payload.
    std::string error;                  ///< Transport error description.
};

/**
 * @class HttpClient
 * @brief Abstract HTTP transport.
 *
 * Implementations must allow concurrent perform() calls from multiple threads
 * and must not throw for network errors.
 */
class HttpClient {
    public:
        virtual ~HttpClient() = default;

        /**
         * @brief Sends the request and waits for the complete response.
         */
        virtual HttpResponse perform(const HttpRequest& request) = 0;

        /**
         * @brief Percent-encodes a string for use in a URL query component.
         */
        static std::string urlEncode(const std::string& value);
};

/**
 * @class CurlHttpClient
 * @brief HttpClient implementation on top of libcurl easy interface.
 *
 * Every request uses its own easy handle, making the client safe to use from
 * worker threads.
 */
class CurlHttpClient : public HttpClient {
    private:
        std::chrono::milliseconds m_requestTimeout;
        std::chrono::milliseconds m_resourceTimeout;
        size_t m_maxBodySize;

        static size_t writeCallback(char* data, size_t size, size_t nmemb, void* userdata);

    public:
        /**
         * @brief Constructs the client.
         *
         * @param requestTimeout Limit for connecting and for a stalled transfer.
         * @param resourceTimeout Limit for the whole request.
         * @param maxBodySize Responses larger than this are aborted.
         */
        CurlHttpClient(std::chrono::milliseconds requestTimeout, std::chrono::milliseconds resourceTimeout, size_t maxBodySize = 65535);

        HttpResponse perform(const HttpRequest& request) override;
};
