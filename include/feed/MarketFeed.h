#pragma once

#include "common/Errors.h"
#include "exchange/IExchangeGateway.h"
#include "feed/FeedMessageParser.h"
#include "feed/FeedTypes.h"
#include "network/IPushSubscription.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace spotpilot {
namespace feed {

// 시세 피드
//  - STREAMING_PRIMARY: 푸시 구독 + watchdog (무응답이 stale_threshold 를 넘으면 전환)
//  - STREAMING_FALLBACK: 게이트웨이 폴링. 한 번 전환하면 primary 로 돌아가지 않음
// 이벤트 전달은 delivery_mutex_ 로 직렬화되어 구독자는 동시에 두 이벤트를 받지 않는다.
class MarketFeed {
public:
    using Handler = std::function<void(const FeedEvent&)>;
    using Clock = std::function<long long()>;

    MarketFeed(
        FeedConfig config,
        std::shared_ptr<exchange::IExchangeGateway> gateway,
        std::shared_ptr<network::IPushSubscription> push,
        Clock clock = nullptr
    );
    ~MarketFeed();

    MarketFeed(const MarketFeed&) = delete;
    MarketFeed& operator=(const MarketFeed&) = delete;

    int subscribe(Handler handler);
    void unsubscribe(int subscription_id);

    void start();
    void stop();

    // 워밍업으로 이미 소비한 봉 이후만 전달되도록 커서 설정
    void primeCandleCursor(long long period_start_ms);

    FeedState state() const { return state_.load(); }
    long long lastEventMs() const { return last_event_ms_.load(); }
    long long lastDeliveredCandleStart() const { return last_candle_start_.load(); }

private:
    void onPushMessage(const std::string& raw);
    void watchdogLoop();
    void pollLoop();
    void pollOnce();

    void switchToFallback(const StaleFeedError& reason);
    void startPollerLocked();
    void deliver(const FeedEvent& event, FeedState required_state);

    bool isStopping() const;
    // stop 신호가 오면 true
    bool waitForStop(std::chrono::milliseconds duration);
    void markExited(std::atomic<bool>& flag);
    void joinWithTimeout(std::thread& worker, std::atomic<bool>& exited, const char* name);

    FeedConfig config_;
    std::shared_ptr<exchange::IExchangeGateway> gateway_;
    std::shared_ptr<network::IPushSubscription> push_;
    Clock clock_;
    FeedMessageParser parser_;

    std::atomic<FeedState> state_{FeedState::DISCONNECTED};
    std::atomic<long long> last_event_ms_{0};
    std::atomic<long long> last_candle_start_{-1};

    mutable std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::condition_variable exit_cv_;
    bool stopping_ = false;

    // 스레드 핸들 생성/회수
    std::mutex lifecycle_mutex_;
    bool running_ = false;
    std::thread watchdog_thread_;
    std::thread poller_thread_;
    std::atomic<bool> watchdog_exited_{true};
    std::atomic<bool> poller_exited_{true};

    std::mutex delivery_mutex_;

    std::mutex subscribers_mutex_;
    std::map<int, Handler> subscribers_;
    int next_subscription_id_ = 1;
};

} // namespace feed
} // namespace spotpilot
