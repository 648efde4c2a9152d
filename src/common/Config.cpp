#include "common/Config.h"
#include "common/PathUtils.h"
#include "exchange/BybitResponseParser.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace spotpilot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string upperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(s);
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

std::chrono::milliseconds msValue(const nlohmann::json& section, const char* key,
                                  std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(section.value(key, static_cast<long long>(fallback.count())));
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    api_key_.clear();
    api_secret_.clear();
    gateway_config_ = exchange::GatewayConfig();
    feed_config_ = feed::FeedConfig();
    engine_config_ = engine::EngineConfig();
    strategy_config_ = strategy::ScalpingStrategyConfig();
    warmup_candles_ = 200;
    log_level_ = "info";
    log_dir_ = "logs";
    trade_journal_path_ = "trades/trades.csv";
}

ExchangeEnvironment Config::parseEnvironment(const std::string& name) {
    const std::string upper = upperCopy(name);
    if (upper == "DEMO") return ExchangeEnvironment::DEMO;
    if (upper == "TESTNET") return ExchangeEnvironment::TESTNET;
    if (upper == "PROD" || upper == "PRODUCTION" || upper == "MAINNET") return ExchangeEnvironment::PRODUCTION;
    throw std::invalid_argument("Unknown exchange environment: " + name);
}

feed::FeedMode Config::parseFeedMode(const std::string& name) {
    const std::string upper = upperCopy(name);
    if (upper == "CANDLE" || upper == "KLINE") return feed::FeedMode::CANDLE;
    if (upper == "TICK" || upper == "TICKER") return feed::FeedMode::TICK;
    throw std::invalid_argument("Unknown feed mode: " + name);
}

strategy::StopLossMode Config::parseStopLossMode(const std::string& name) {
    const std::string upper = upperCopy(name);
    if (upper == "ATR") return strategy::StopLossMode::ATR;
    if (upper == "PERCENT" || upper == "PCT") return strategy::StopLossMode::PERCENT;
    throw std::invalid_argument("Unknown stop loss mode: " + name);
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "설정 파일 경로: " << config_path << std::endl;

    nlohmann::json j = nlohmann::json::object();
    if (!std::filesystem::exists(config_path)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cout << "기본값을 사용합니다." << std::endl;
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw std::runtime_error("Config file not readable: " + config_path.string());
        }
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Config file " + config_path.string() + " is not valid JSON: " + e.what());
        }
    }

    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("exchange")) {
        const auto& e = j["exchange"];
        if (!trimCopy(e.value("api_key", "")).empty() || !trimCopy(e.value("api_secret", "")).empty()) {
            std::cout << "경고: config 의 API 키 값은 무시됩니다. 환경 변수(BYBIT_API_KEY/BYBIT_API_SECRET)를 사용하세요."
                      << std::endl;
        }
        gateway_config_.environment = parseEnvironment(e.value("environment", std::string("DEMO")));
        gateway_config_.category = e.value("category", gateway_config_.category);
        gateway_config_.account_type = e.value("account_type", gateway_config_.account_type);
        if (e.contains("account_type_candidates")) {
            gateway_config_.account_type_candidates = e["account_type_candidates"].get<std::vector<std::string>>();
        }
        gateway_config_.recv_window_ms = e.value("recv_window_ms", gateway_config_.recv_window_ms);
        gateway_config_.timeout_seconds = e.value("timeout_seconds", gateway_config_.timeout_seconds);
    }

    const std::string env_override = readEnvVar("BYBIT_ENV");
    if (!env_override.empty()) {
        gateway_config_.environment = parseEnvironment(env_override);
        std::cout << "BYBIT_ENV 적용: " << toString(gateway_config_.environment) << std::endl;
    }

    api_key_ = readEnvVar("BYBIT_API_KEY");
    api_secret_ = readEnvVar("BYBIT_API_SECRET");
    if (api_key_.empty() || api_secret_.empty()) {
        std::cout << "경고: BYBIT_API_KEY 또는 BYBIT_API_SECRET 환경 변수가 비어 있습니다." << std::endl;
    }

    if (j.contains("trading")) {
        const auto& t = j["trading"];
        engine_config_.symbol = upperCopy(t.value("symbol", engine_config_.symbol));
        engine_config_.quote_coin = upperCopy(t.value("quote_coin", engine_config_.quote_coin));
        engine_config_.entry_cooldown_seconds = t.value("entry_cooldown_seconds", engine_config_.entry_cooldown_seconds);
        engine_config_.fill_lookup_attempts = t.value("fill_lookup_attempts", engine_config_.fill_lookup_attempts);
        engine_config_.fill_lookup_delay_ms = t.value("fill_lookup_delay_ms", engine_config_.fill_lookup_delay_ms);
        trade_journal_path_ = t.value("trade_journal", trade_journal_path_);
    }

    if (j.contains("strategy")) {
        const auto& s = j["strategy"];
        strategy_config_.risk_usdt = s.value("risk_usdt", strategy_config_.risk_usdt);
        strategy_config_.take_profit_pct = s.value("take_profit_pct", strategy_config_.take_profit_pct);
        strategy_config_.stop_loss_pct = s.value("stop_loss_pct", strategy_config_.stop_loss_pct);
        if (s.contains("stop_loss_mode")) {
            strategy_config_.stop_loss_mode = parseStopLossMode(s["stop_loss_mode"].get<std::string>());
        }
        strategy_config_.atr_multiplier = s.value("atr_multiplier", strategy_config_.atr_multiplier);
        strategy_config_.max_open_minutes = s.value("max_open_minutes", strategy_config_.max_open_minutes);
        strategy_config_.adx_threshold = s.value("adx_threshold", strategy_config_.adx_threshold);
        strategy_config_.rsi_threshold = s.value("rsi_threshold", strategy_config_.rsi_threshold);
        strategy_config_.use_volume_filter = s.value("use_volume_filter", strategy_config_.use_volume_filter);
        strategy_config_.volume_multiplier = s.value("volume_multiplier", strategy_config_.volume_multiplier);
        strategy_config_.fast_ema_period = s.value("fast_ema_period", strategy_config_.fast_ema_period);
        strategy_config_.slow_ema_period = s.value("slow_ema_period", strategy_config_.slow_ema_period);
    }

    // 피드: 모드별 기본값 위에 파일 값을 덮어씀
    {
        const nlohmann::json f = j.contains("feed") ? j["feed"] : nlohmann::json::object();
        const auto mode = parseFeedMode(f.value("mode", std::string("candle")));
        const std::string interval = f.value("interval", std::string("1"));

        feed::FeedConfig feed_config = mode == feed::FeedMode::TICK
            ? feed::FeedConfig::tickDefaults(engine_config_.symbol)
            : feed::FeedConfig::candleDefaults(engine_config_.symbol, interval);
        if (mode == feed::FeedMode::CANDLE) {
            // 봉 간격 + 10초 여유
            feed_config.stale_threshold = std::chrono::milliseconds(
                exchange::bybit::intervalToMs(interval) + 10000);
        }

        feed_config.stale_threshold = msValue(f, "stale_threshold_ms", feed_config.stale_threshold);
        feed_config.watchdog_interval = msValue(f, "watchdog_interval_ms", feed_config.watchdog_interval);
        feed_config.poll_interval = msValue(f, "poll_interval_ms", feed_config.poll_interval);
        feed_config.join_timeout = msValue(f, "join_timeout_ms", feed_config.join_timeout);
        feed_config.poll_candle_limit = f.value("poll_candle_limit", feed_config.poll_candle_limit);
        feed_config.primary_enabled = f.value("primary_enabled", true);
        warmup_candles_ = f.value("warmup_candles", warmup_candles_);

        // DEMO 는 공개 푸시 스트림이 없음
        if (gateway_config_.environment == ExchangeEnvironment::DEMO) {
            feed_config.primary_enabled = false;
        }
        feed_config_ = feed_config;
        if (mode == feed::FeedMode::TICK) {
            std::cout << "경고: feed.mode=tick 에서는 신규 진입이 없습니다 (청산 감시만 동작)." << std::endl;
        }
    }

    if (j.contains("retry")) {
        const auto& r = j["retry"];
        auto apply = [&r](execution::RetryPolicy& policy) {
            policy.max_attempts = r.value("max_attempts", policy.max_attempts);
            policy.initial_backoff = msValue(r, "initial_backoff_ms", policy.initial_backoff);
            policy.max_backoff = msValue(r, "max_backoff_ms", policy.max_backoff);
            policy.backoff_multiplier = r.value("multiplier", policy.backoff_multiplier);
        };
        apply(gateway_config_.read_policy);
        apply(gateway_config_.write_policy);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    validate();
}

void Config::validate() const {
    if (engine_config_.symbol.empty() || engine_config_.quote_coin.empty()) {
        throw std::invalid_argument("trading.symbol and trading.quote_coin are required");
    }
    if (engine_config_.symbol.size() <= engine_config_.quote_coin.size() ||
        engine_config_.symbol.compare(engine_config_.symbol.size() - engine_config_.quote_coin.size(),
                                      engine_config_.quote_coin.size(), engine_config_.quote_coin) != 0) {
        throw std::invalid_argument("trading.symbol " + engine_config_.symbol +
                                    " does not end with quote coin " + engine_config_.quote_coin);
    }
    if (engine_config_.entry_cooldown_seconds < 0) {
        throw std::invalid_argument("trading.entry_cooldown_seconds must not be negative");
    }
    if (engine_config_.fill_lookup_attempts <= 0 || engine_config_.fill_lookup_delay_ms < 0) {
        throw std::invalid_argument("trading.fill_lookup_attempts must be positive");
    }

    if (strategy_config_.risk_usdt <= 0.0) {
        throw std::invalid_argument("strategy.risk_usdt must be positive");
    }
    if (strategy_config_.take_profit_pct <= 0.0) {
        throw std::invalid_argument("strategy.take_profit_pct must be positive");
    }
    if (strategy_config_.stop_loss_pct <= 0.0 || strategy_config_.stop_loss_pct >= 1.0) {
        throw std::invalid_argument("strategy.stop_loss_pct must be in (0, 1)");
    }
    if (strategy_config_.atr_multiplier <= 0.0 || strategy_config_.max_open_minutes <= 0) {
        throw std::invalid_argument("strategy.atr_multiplier and max_open_minutes must be positive");
    }
    if (strategy_config_.adx_threshold <= 0.0 || strategy_config_.rsi_threshold <= 0.0 ||
        strategy_config_.rsi_threshold >= 100.0 || strategy_config_.volume_multiplier <= 0.0) {
        throw std::invalid_argument("strategy thresholds must be positive (RSI below 100)");
    }
    if (strategy_config_.fast_ema_period <= 0 ||
        strategy_config_.fast_ema_period >= strategy_config_.slow_ema_period) {
        throw std::invalid_argument("strategy.fast_ema_period must be positive and below slow_ema_period");
    }

    if (feed_config_.stale_threshold.count() <= 0 || feed_config_.watchdog_interval.count() <= 0 ||
        feed_config_.poll_interval.count() <= 0 || feed_config_.join_timeout.count() <= 0) {
        throw std::invalid_argument("feed intervals and thresholds must be positive");
    }
    if (feed_config_.poll_candle_limit <= 0 || warmup_candles_ < 0) {
        throw std::invalid_argument("feed.poll_candle_limit must be positive");
    }

    const auto& retry = gateway_config_.read_policy;
    if (retry.max_attempts <= 0 || retry.initial_backoff.count() < 0 ||
        retry.max_backoff < retry.initial_backoff || retry.backoff_multiplier < 1.0) {
        throw std::invalid_argument("retry settings are inconsistent");
    }
    if (gateway_config_.recv_window_ms <= 0 || gateway_config_.timeout_seconds <= 0) {
        throw std::invalid_argument("exchange.recv_window_ms and timeout_seconds must be positive");
    }
}

} // namespace spotpilot
