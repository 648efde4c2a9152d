#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "exchange/GatewayConfig.h"
#include "feed/FeedTypes.h"
#include "strategy/StrategyConfig.h"

namespace spotpilot {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 기본값 유지, JSON 파싱 오류/검증 실패는 예외
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // 값이 모순되면 std::invalid_argument
    void validate() const;

    // 기본값으로 초기화 (테스트용)
    void reset();

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    ExchangeEnvironment getEnvironment() const { return gateway_config_.environment; }

    exchange::GatewayConfig getGatewayConfig() const { return gateway_config_; }
    feed::FeedConfig getFeedConfig() const { return feed_config_; }
    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    strategy::ScalpingStrategyConfig getStrategyConfig() const { return strategy_config_; }

    // 진입은 확정 봉에서만 평가되므로 틱 모드에서는 청산만 동작
    bool entriesEnabled() const { return feed_config_.mode == feed::FeedMode::CANDLE; }

    int getWarmupCandles() const { return warmup_candles_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getTradeJournalPath() const { return trade_journal_path_; }

    // DEMO | TESTNET | PROD (PRODUCTION) - 대소문자 무시
    static ExchangeEnvironment parseEnvironment(const std::string& name);
    static feed::FeedMode parseFeedMode(const std::string& name);
    static strategy::StopLossMode parseStopLossMode(const std::string& name);

private:
    Config() = default;

    std::string api_key_;
    std::string api_secret_;

    exchange::GatewayConfig gateway_config_;
    feed::FeedConfig feed_config_;
    engine::EngineConfig engine_config_;
    strategy::ScalpingStrategyConfig strategy_config_;

    int warmup_candles_ = 200;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string trade_journal_path_ = "trades/trades.csv";
};

} // namespace spotpilot
