#include "network/RequestSigner.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>
#include <iomanip>
#include <random>
#include <cstdint>

namespace spotpilot {
namespace network {

std::string RequestSigner::hmacSha256Hex(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         key.c_str(), static_cast<int>(key.length()),
         reinterpret_cast<const unsigned char*>(message.c_str()), message.length(),
         digest, &digest_len);

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex_stream.str();
}

std::string RequestSigner::sign(
    const std::string& secret_key,
    long long timestamp_ms,
    const std::string& api_key,
    int recv_window_ms,
    const std::string& payload
) {
    const std::string message = std::to_string(timestamp_ms) + api_key +
                                std::to_string(recv_window_ms) + payload;
    return hmacSha256Hex(secret_key, message);
}

std::string RequestSigner::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string RequestSigner::generateOrderLinkId() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << "sp" << std::hex << std::setfill('0')
        << std::setw(16) << dis(gen)
        << std::setw(16) << dis(gen);
    return oss.str();
}

} // namespace network
} // namespace spotpilot
