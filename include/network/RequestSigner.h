#pragma once

#include <string>
#include <map>

namespace spotpilot {
namespace network {

class RequestSigner {
public:
    // Bybit v5 서명: hex(HMAC_SHA256(secret, timestamp + api_key + recv_window + payload))
    static std::string sign(
        const std::string& secret_key,
        long long timestamp_ms,
        const std::string& api_key,
        int recv_window_ms,
        const std::string& payload
    );

    static std::string hmacSha256Hex(const std::string& key, const std::string& message);

    // 정렬된 파라미터로 query string 생성 (서명 대상과 전송 URL 이 동일해야 함)
    static std::string buildQueryString(const std::map<std::string, std::string>& params);

    // orderLinkId 용 (최대 36자)
    static std::string generateOrderLinkId();
};

} // namespace network
} // namespace spotpilot
