#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "engine/CsvTradeJournal.h"
#include "engine/TradeEngine.h"
#include "exchange/BybitGateway.h"
#include "execution/OrderNormalizer.h"
#include "execution/RateLimiter.h"
#include "feed/FeedMessageParser.h"
#include "feed/MarketFeed.h"
#include "network/BybitHttpClient.h"
#include "network/BybitPublicWebSocketClient.h"
#include "strategy/IndicatorWindow.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace spotpilot;

namespace {
// 시그널 핸들러에서는 플래그만 세운다
std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested.store(true);
    }
}

std::filesystem::path resolvePath(const std::string& path) {
    if (std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return utils::PathUtils::resolveRelativePath(path);
}

std::shared_ptr<network::IPushSubscription> makePushSubscription(
    const exchange::GatewayConfig& gateway_config,
    const feed::FeedConfig& feed_config
) {
    if (!feed_config.primary_enabled) {
        return nullptr;
    }
    const std::string host = exchange::streamHost(gateway_config.environment);
    if (host.empty()) {
        return nullptr;
    }

    network::PushEndpoint endpoint;
    endpoint.host = host;
    endpoint.target = exchange::streamTarget(gateway_config.category);
    if (feed_config.mode == feed::FeedMode::TICK) {
        endpoint.topics.push_back(feed::FeedMessageParser::tickerTopic(feed_config.symbol));
    } else {
        endpoint.topics.push_back(feed::FeedMessageParser::klineTopic(feed_config.interval, feed_config.symbol));
    }
    return std::make_shared<network::BybitPublicWebSocketClient>(endpoint);
}
}

int main() {
    auto& config = Config::getInstance();
    try {
        config.load("config/config.json");
    } catch (const std::exception& e) {
        std::cerr << "설정 오류: " << e.what() << std::endl;
        return 1;
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << "로거 초기화 실패: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n";
    std::cout << "=============================================\n";
    std::cout << "       SpotPilot v1.0\n";
    std::cout << "       Bybit spot scalping bot\n";
    std::cout << "=============================================\n\n";

    const auto gateway_config = config.getGatewayConfig();
    const auto feed_config = config.getFeedConfig();
    const auto engine_config = config.getEngineConfig();
    const auto strategy_config = config.getStrategyConfig();

    LOG_INFO("Environment: {} ({})", toString(gateway_config.environment),
             exchange::restBaseUrl(gateway_config.environment));
    LOG_INFO("Symbol: {} / feed mode: {} / interval: {}", engine_config.symbol,
             feed_config.mode == feed::FeedMode::TICK ? "tick" : "candle", feed_config.interval);
    if (!config.entriesEnabled()) {
        LOG_WARN("Tick feed mode: entries are disabled, only exits of an open position are watched");
    }

    auto rate_limiter = std::make_shared<execution::RateLimiter>();
    auto http_client = std::make_shared<network::BybitHttpClient>(
        network::ApiCredentials{config.getApiKey(), config.getApiSecret()},
        exchange::restBaseUrl(gateway_config.environment),
        gateway_config.timeout_seconds,
        gateway_config.recv_window_ms,
        rate_limiter
    );
    auto gateway = std::make_shared<exchange::BybitGateway>(http_client, gateway_config);

    // 시작 시 잔고 조회 실패는 유일한 치명적 경로
    try {
        const auto balance = gateway->getWalletBalance({engine_config.quote_coin});
        LOG_INFO("Account type {}: {} available {:.2f}",
                 gateway->resolvedAccountType(), engine_config.quote_coin,
                 balance.available(engine_config.quote_coin));
    } catch (const TradingError& e) {
        LOG_ERROR("Startup balance check failed: {}", e.what());
        Logger::getInstance().flush();
        return 1;
    }

    std::shared_ptr<execution::OrderNormalizer> normalizer;
    try {
        normalizer = std::make_shared<execution::OrderNormalizer>(
            gateway, engine_config.symbol, engine_config.quote_coin);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Order normalizer setup failed: {}", e.what());
        return 1;
    }

    // 이전 실행에서 남은 미체결 주문은 알리기만 한다
    try {
        const auto leftovers = normalizer->openOrders();
        for (const auto& order : leftovers) {
            LOG_WARN("Open order left on exchange: {} {} qty {} @ {} ({})",
                     order.order_id, toString(order.side),
                     order.quantity, order.price, order.status);
        }
    } catch (const TradingError& e) {
        LOG_WARN("Open order listing failed: {}", e.what());
    }

    auto journal = std::make_shared<engine::CsvTradeJournal>(resolvePath(config.getTradeJournalPath()));
    engine::TradeEngine trade_engine(engine_config, strategy_config, normalizer, gateway, journal);
    strategy::IndicatorWindow window(strategy_config.fast_ema_period, strategy_config.slow_ema_period);

    auto push = makePushSubscription(gateway_config, feed_config);
    feed::MarketFeed market_feed(feed_config, gateway, push);

    // 워밍업: 최근 봉으로 지표 창을 채우고 폴링 커서를 맞춘다
    if (config.getWarmupCandles() > 0) {
        try {
            const auto history = gateway->getCandles(engine_config.symbol, feed_config.interval,
                                                     config.getWarmupCandles());
            window.seed(history);
            if (window.size() > 0) {
                market_feed.primeCandleCursor(window.lastPeriodStart());
            }
            LOG_INFO("Warm-up: {} confirmed candles loaded", window.size());
        } catch (const TradingError& e) {
            LOG_WARN("Warm-up skipped: {}", e.what());
        }
    }

    market_feed.subscribe([&](const feed::FeedEvent& event) {
        if (event.kind == feed::FeedEvent::Kind::CANDLE) {
            window.add(event.candle);
            trade_engine.onCandle(event.candle, window.snapshot());
        } else {
            trade_engine.onTick(event.tick);
        }
    });

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    market_feed.start();
    LOG_INFO("Feed started ({}), press Ctrl+C to stop", feed::toString(market_feed.state()));

    while (!g_stop_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutdown signal received");
    market_feed.stop();
    if (trade_engine.inPosition()) {
        const auto& position = trade_engine.position();
        LOG_WARN("Exiting with open position: qty {} @ {:.2f} (not flattened)",
                 position->quantity, position->entry_price);
    }
    LOG_INFO("SpotPilot stopped");
    Logger::getInstance().flush();
    return 0;
}
