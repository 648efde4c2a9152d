#pragma once

#include "network/IHttpClient.h"
#include "execution/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace spotpilot {
namespace network {

struct ApiCredentials {
    std::string api_key;
    std::string api_secret;

    bool empty() const { return api_key.empty() || api_secret.empty(); }
};

class BybitHttpClient : public IHttpClient {
public:
    BybitHttpClient(
        ApiCredentials credentials,
        std::string base_url,
        int timeout_seconds = 20,
        int recv_window_ms = 5000,
        std::shared_ptr<execution::RateLimiter> rate_limiter = nullptr
    );
    ~BybitHttpClient() override;

    BybitHttpClient(const BybitHttpClient&) = delete;
    BybitHttpClient& operator=(const BybitHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {},
        bool authenticated = false
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) override;

    const std::string& baseUrl() const { return base_url_; }

private:
    ApiCredentials credentials_;
    std::string base_url_;
    int timeout_seconds_;
    int recv_window_ms_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;

    std::map<std::string, std::string> signedHeaders(const std::string& payload) const;

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    void afterResponse(const std::string& group, const HttpResponse& response);

    static std::string groupForEndpoint(const std::string& endpoint);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace spotpilot
