#include "network/BybitHttpClient.h"
#include "network/RequestSigner.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "execution/RetryPolicy.h"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <set>

namespace spotpilot {
namespace network {
namespace {
long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// 요청이 소켓에 쓰이기 전에 실패한 경우 (재전송해도 중복 주문 위험 없음)
bool failedBeforeSend(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
            return true;
        default:
            return false;
    }
}

// 호출 스레드에 중단 신호가 오면 전송을 끊는다
int abortOnInterrupt(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return execution::RetryInterrupt::requested() ? 1 : 0;
}

bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "x-bapi-api-key", "x-bapi-sign", "api_key", "apikey", "secret", "signature", "sign"
    };
    return kKeys.find(toLowerCopy(key)) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

std::string sanitizeForLog(const nlohmann::json& body) {
    nlohmann::json copy = body;
    maskSensitiveJson(copy);
    return copy.dump();
}
}

BybitHttpClient::BybitHttpClient(
    ApiCredentials credentials,
    std::string base_url,
    int timeout_seconds,
    int recv_window_ms,
    std::shared_ptr<execution::RateLimiter> rate_limiter
)
    : credentials_(std::move(credentials))
    , base_url_(std::move(base_url))
    , timeout_seconds_(timeout_seconds)
    , recv_window_ms_(recv_window_ms)
    , curl_(nullptr)
    , rate_limiter_(rate_limiter ? std::move(rate_limiter) : std::make_shared<execution::RateLimiter>())
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

BybitHttpClient::~BybitHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

std::string BybitHttpClient::groupForEndpoint(const std::string& endpoint) {
    if (endpoint.rfind("/v5/market/", 0) == 0) return "market";
    if (endpoint.rfind("/v5/account/", 0) == 0) return "account";
    if (endpoint.rfind("/v5/order/", 0) == 0 ||
        endpoint.rfind("/v5/execution/", 0) == 0) return "order";
    return "default";
}

std::map<std::string, std::string> BybitHttpClient::signedHeaders(const std::string& payload) const {
    const long long timestamp = nowMs();
    std::map<std::string, std::string> headers;
    headers["X-BAPI-API-KEY"] = credentials_.api_key;
    headers["X-BAPI-TIMESTAMP"] = std::to_string(timestamp);
    headers["X-BAPI-RECV-WINDOW"] = std::to_string(recv_window_ms_);
    headers["X-BAPI-SIGN"] = RequestSigner::sign(
        credentials_.api_secret, timestamp, credentials_.api_key, recv_window_ms_, payload);
    return headers;
}

HttpResponse BybitHttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params,
    bool authenticated
) {
    const std::string group = groupForEndpoint(endpoint);
    rate_limiter_->acquire(group);

    const std::string query = RequestSigner::buildQueryString(query_params);
    std::string url = base_url_ + endpoint;
    if (!query.empty()) {
        url += "?" + query;
    }

    std::map<std::string, std::string> headers;
    if (authenticated) {
        headers = signedHeaders(query);
    }

    auto response = performRequest("GET", url, "", headers);
    afterResponse(group, response);
    return response;
}

HttpResponse BybitHttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body
) {
    const std::string group = groupForEndpoint(endpoint);
    rate_limiter_->acquire(group);

    // 서명 대상과 전송 본문은 같은 문자열이어야 함
    const std::string payload = body.dump();
    auto headers = signedHeaders(payload);
    headers["Content-Type"] = "application/json";

    LOG_DEBUG("POST {} {}", endpoint, sanitizeForLog(body));

    auto response = performRequest("POST", base_url_ + endpoint, payload, headers);
    afterResponse(group, response);
    return response;
}

void BybitHttpClient::afterResponse(const std::string& group, const HttpResponse& response) {
    auto it = response.headers.find("x-bapi-limit-status");
    if (it != response.headers.end()) {
        rate_limiter_->updateFromHeader(group, it->second);
    }

    if (response.isRateLimited() || response.isForbidden()) {
        rate_limiter_->handleRateLimitError(response.status_code);
    }
}

HttpResponse BybitHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    // 조회만 중단 가능 (주문 전송을 끊으면 체결 여부가 모호해진다)
    if (method == "GET") {
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abortOnInterrupt);
    }

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        // pretransfer 단계까지 가지 못했다면 요청은 전송되지 않음
        double pretransfer = 0.0;
        curl_easy_getinfo(curl_, CURLINFO_PRETRANSFER_TIME, &pretransfer);
        const bool sent = !failedBeforeSend(res) && pretransfer > 0.0;
        throw TransientNetworkError(
            method + " " + url + " failed: " + std::string(curl_easy_strerror(res)), sent);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);
    return response;
}

size_t BybitHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t BybitHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = toLowerCopy(header_line.substr(0, colon_pos));
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace spotpilot
