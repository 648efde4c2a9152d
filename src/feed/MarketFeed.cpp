#include "feed/MarketFeed.h"

#include "common/Logger.h"
#include "execution/RetryPolicy.h"

#include <algorithm>
#include <chrono>
#include <vector>

namespace spotpilot {
namespace feed {
namespace {
long long systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
}

MarketFeed::MarketFeed(
    FeedConfig config,
    std::shared_ptr<exchange::IExchangeGateway> gateway,
    std::shared_ptr<network::IPushSubscription> push,
    Clock clock
)
    : config_(std::move(config))
    , gateway_(std::move(gateway))
    , push_(std::move(push))
    , clock_(clock ? std::move(clock) : Clock(systemNowMs))
    , parser_(config_.symbol)
{
    if (!gateway_) {
        throw std::invalid_argument("MarketFeed requires an exchange gateway for polling");
    }
}

MarketFeed::~MarketFeed() {
    stop();
}

int MarketFeed::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    const int id = next_subscription_id_++;
    subscribers_[id] = std::move(handler);
    return id;
}

void MarketFeed::unsubscribe(int subscription_id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(subscription_id);
}

void MarketFeed::primeCandleCursor(long long period_start_ms) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    if (period_start_ms > last_candle_start_.load()) {
        last_candle_start_ = period_start_ms;
    }
}

void MarketFeed::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = false;
    }
    running_ = true;
    last_event_ms_ = clock_();

    if (config_.primary_enabled && push_) {
        state_ = FeedState::STREAMING_PRIMARY;
        const bool started = push_->start([this](const std::string& raw) {
            onPushMessage(raw);
        });
        if (started) {
            LOG_INFO("Feed {} streaming via push subscription (stale after {}ms)",
                     config_.symbol, config_.stale_threshold.count());
            watchdog_exited_ = false;
            watchdog_thread_ = std::thread(&MarketFeed::watchdogLoop, this);
            return;
        }
        LOG_WARN("Feed {} push subscription did not start, polling instead", config_.symbol);
    } else {
        LOG_INFO("Feed {} has no push stream, polling every {}ms",
                 config_.symbol, config_.poll_interval.count());
    }

    state_ = FeedState::STREAMING_FALLBACK;
    startPollerLocked();
}

void MarketFeed::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();

    std::thread watchdog;
    std::thread poller;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;

        // 수신 대기 중인 read 를 먼저 끊는다
        if (push_ && config_.primary_enabled) {
            push_->stop();
        }
        watchdog = std::move(watchdog_thread_);
        poller = std::move(poller_thread_);
    }

    joinWithTimeout(watchdog, watchdog_exited_, "watchdog");
    joinWithTimeout(poller, poller_exited_, "poller");

    state_ = FeedState::DISCONNECTED;
    LOG_INFO("Feed {} stopped", config_.symbol);
}

void MarketFeed::startPollerLocked() {
    poller_exited_ = false;
    poller_thread_ = std::thread(&MarketFeed::pollLoop, this);
}

void MarketFeed::switchToFallback(const StaleFeedError& reason) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_ || isStopping() || state_.load() != FeedState::STREAMING_PRIMARY) {
        return;
    }

    {
        // 진행 중인 primary 전달이 끝난 뒤 상태를 바꾼다
        std::lock_guard<std::mutex> delivery(delivery_mutex_);
        state_ = FeedState::STREAMING_FALLBACK;
    }

    LOG_WARN("Feed {} failing over to polling: {} (silent {}ms, threshold {}ms)",
             config_.symbol, reason.what(), reason.silentMs(), config_.stale_threshold.count());

    push_->stop();
    startPollerLocked();
}

void MarketFeed::onPushMessage(const std::string& raw) {
    ParsedFeedMessage parsed;
    try {
        parsed = parser_.parse(raw, clock_());
    } catch (const InvalidResponse& e) {
        LOG_WARN("Feed {} dropped push message: {}", config_.symbol, e.what());
        return;
    }

    if (config_.mode == FeedMode::TICK) {
        for (const auto& tick : parsed.ticks) {
            deliver(FeedEvent::ofTick(tick, FeedSource::PRIMARY), FeedState::STREAMING_PRIMARY);
        }
    } else {
        for (const auto& candle : parsed.candles) {
            deliver(FeedEvent::ofCandle(candle, FeedSource::PRIMARY), FeedState::STREAMING_PRIMARY);
        }
    }
}

void MarketFeed::watchdogLoop() {
    while (!waitForStop(config_.watchdog_interval)) {
        if (state_.load() != FeedState::STREAMING_PRIMARY) {
            break;
        }
        const long long silent_ms = clock_() - last_event_ms_.load();
        if (silent_ms >= config_.stale_threshold.count()) {
            switchToFallback(StaleFeedError("no events from push subscription", silent_ms));
            break;
        }
    }
    markExited(watchdog_exited_);
}

void MarketFeed::pollLoop() {
    // 게이트웨이 재시도 대기와 HTTP 전송도 stop 신호로 끝나도록
    execution::RetryInterrupt::Scope interrupt([this](std::chrono::milliseconds duration) {
        return waitForStop(duration);
    });

    do {
        try {
            pollOnce();
        } catch (const TradingError& e) {
            LOG_WARN("Feed {} poll failed: {}", config_.symbol, e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Feed {} poll error: {}", config_.symbol, e.what());
        }
    } while (!waitForStop(config_.poll_interval));
    markExited(poller_exited_);
}

void MarketFeed::pollOnce() {
    if (config_.mode == FeedMode::TICK) {
        const auto ticker = gateway_->getTicker(config_.symbol);
        Tick tick;
        tick.symbol = config_.symbol;
        tick.price = ticker.last_price;
        tick.observed_at_ms = clock_();
        deliver(FeedEvent::ofTick(tick, FeedSource::FALLBACK), FeedState::STREAMING_FALLBACK);
        return;
    }

    auto candles = gateway_->getCandles(config_.symbol, config_.interval, config_.poll_candle_limit);
    candles.erase(std::remove_if(candles.begin(), candles.end(),
                                 [](const Candle& c) { return !c.confirmed; }),
                  candles.end());
    if (candles.empty()) {
        return;
    }
    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.period_start_ms < b.period_start_ms;
    });

    // 커서가 없으면 과거 봉을 재생하지 않고 최신 확정 봉만
    if (last_candle_start_.load() < 0) {
        deliver(FeedEvent::ofCandle(candles.back(), FeedSource::FALLBACK), FeedState::STREAMING_FALLBACK);
        return;
    }

    for (const auto& candle : candles) {
        deliver(FeedEvent::ofCandle(candle, FeedSource::FALLBACK), FeedState::STREAMING_FALLBACK);
    }
}

void MarketFeed::deliver(const FeedEvent& event, FeedState required_state) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);

    // 비활성 소스에서 늦게 도착한 이벤트는 버린다
    if (state_.load() != required_state || isStopping()) {
        return;
    }

    if (event.kind == FeedEvent::Kind::CANDLE) {
        if (!event.candle.confirmed) {
            return;
        }
        if (event.candle.period_start_ms <= last_candle_start_.load()) {
            return;
        }
        last_candle_start_ = event.candle.period_start_ms;
    }
    last_event_ms_ = clock_();

    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        handlers.reserve(subscribers_.size());
        for (const auto& [id, handler] : subscribers_) {
            handlers.push_back(handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Feed {} subscriber failed: {}", config_.symbol, e.what());
        }
    }
}

bool MarketFeed::isStopping() const {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    return stopping_;
}

bool MarketFeed::waitForStop(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return stop_cv_.wait_for(lock, duration, [this]() { return stopping_; });
}

void MarketFeed::markExited(std::atomic<bool>& flag) {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        flag = true;
    }
    exit_cv_.notify_all();
}

void MarketFeed::joinWithTimeout(std::thread& worker, std::atomic<bool>& exited, const char* name) {
    if (!worker.joinable()) {
        return;
    }

    {
        std::unique_lock<std::mutex> lock(stop_mutex_);
        const bool finished = exit_cv_.wait_for(lock, config_.join_timeout, [&exited]() {
            return exited.load();
        });
        if (!finished) {
            // 중단 신호를 보지 못하는 호출(구독자 처리 등)이 끝날 때까지 기다린다
            LOG_WARN("Feed {} {} did not exit within {}ms, waiting for in-flight call",
                     config_.symbol, name, config_.join_timeout.count());
        }
    }
    worker.join();
}

} // namespace feed
} // namespace spotpilot
