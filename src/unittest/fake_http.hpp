#pragma once

#include "httpclient.hpp"

#include <functional>
#include <mutex>
#include <vector>

/**
 * Records requests and answers them with a test supplied handler.
 */
class FakeHttpClient : public HttpClient {
    public:
        typedef std::function<HttpResponse(const HttpRequest&)> Handler;

    private:
        std::mutex m_mutex;
        std::vector<HttpRequest> m_requests;
        Handler m_handler;

    public:
        explicit FakeHttpClient(Handler handler)
            : m_handler(handler)
        {}

        HttpResponse perform(const HttpRequest& request) override
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_requests.push_back(request);
            }
            return m_handler(request);
        }

        std::vector<HttpRequest> getRequests()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_requests;
        }
};
