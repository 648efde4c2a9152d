#pragma once

#include "network/IPushSubscription.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace spotpilot {
namespace network {

struct PushEndpoint {
    std::string host;                 // stream.bybit.com / stream-testnet.bybit.com
    std::string port = "443";
    std::string target;               // /v5/public/spot
    std::vector<std::string> topics;  // tickers.BTCUSDT, kline.1.BTCUSDT
    std::chrono::seconds ping_interval{20};
};

class BybitPublicWebSocketClient : public IPushSubscription {
public:
    explicit BybitPublicWebSocketClient(PushEndpoint endpoint);
    ~BybitPublicWebSocketClient() override;

    bool start(TextHandler handler) override;
    void stop() override;

    bool isConnected() const override { return connected_.load(); }
    long long getLastMessageTimeMs() const { return last_message_time_ms_.load(); }

    static std::string buildSubscribeMessage(const std::vector<std::string>& topics);

private:
    void runLoop();
    void connectAndReadLoop();
    void dispatchMessage(const std::string& payload);
    bool waitBeforeReconnect(std::chrono::seconds delay);

    PushEndpoint endpoint_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<long long> last_message_time_ms_{0};
    std::thread worker_thread_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    mutable std::mutex handler_mutex_;
    TextHandler message_handler_;
};

} // namespace network
} // namespace spotpilot
