#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace spotpilot {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // 헤더 이름은 소문자로 정규화

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isForbidden() const { return status_code == 403; }
    bool isUnauthorized() const { return status_code == 401; }
    bool isServerError() const { return status_code >= 500; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// 전송 계층 실패는 TransientNetworkError 로 던지고, HTTP 상태 해석은 호출자 몫
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET 요청 (authenticated=true 이면 서명 헤더 추가)
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {},
        bool authenticated = false
    ) = 0;

    // POST 요청 (항상 서명)
    virtual HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) = 0;
};

} // namespace network
} // namespace spotpilot
