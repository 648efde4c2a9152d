#pragma once

#include <functional>
#include <string>

namespace spotpilot {
namespace network {

// 푸시 구독 (원문 텍스트를 그대로 전달, 해석은 피드 담당)
class IPushSubscription {
public:
    using TextHandler = std::function<void(const std::string&)>;

    virtual ~IPushSubscription() = default;

    // 이미 실행 중이면 false
    virtual bool start(TextHandler handler) = 0;

    // 진행 중인 수신을 끊고 작업 스레드가 끝날 때까지 대기
    virtual void stop() = 0;

    virtual bool isConnected() const = 0;
};

} // namespace network
} // namespace spotpilot
