#include "engine/TradeEngine.h"

#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace spotpilot {
namespace engine {
namespace {
long long systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
}

TradeEngine::TradeEngine(
    EngineConfig config,
    strategy::ScalpingStrategyConfig strategy_config,
    std::shared_ptr<execution::OrderNormalizer> normalizer,
    std::shared_ptr<exchange::IExchangeGateway> gateway,
    std::shared_ptr<ITradeJournal> journal,
    Clock clock,
    Sleeper sleeper
)
    : config_(std::move(config))
    , strategy_config_(strategy_config)
    , normalizer_(std::move(normalizer))
    , gateway_(std::move(gateway))
    , journal_(std::move(journal))
    , clock_(clock ? std::move(clock) : Clock(systemNowMs))
    , sleeper_(sleeper ? std::move(sleeper)
                       : Sleeper([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }))
{
    if (!normalizer_ || !gateway_) {
        throw std::invalid_argument("TradeEngine requires an order normalizer and a gateway");
    }

    LOG_INFO("Strategy configured for {}:", config_.symbol);
    LOG_INFO("  - risk per trade: {} {}", strategy_config_.risk_usdt, config_.quote_coin);
    LOG_INFO("  - take profit: {:.2f}%", strategy_config_.take_profit_pct * 100.0);
    if (strategy_config_.stop_loss_mode == strategy::StopLossMode::ATR) {
        LOG_INFO("  - stop loss: ATR x {} (fallback {:.2f}%)",
                 strategy_config_.atr_multiplier, strategy_config_.stop_loss_pct * 100.0);
    } else {
        LOG_INFO("  - stop loss: {:.2f}%", strategy_config_.stop_loss_pct * 100.0);
    }
    LOG_INFO("  - ADX > {}, RSI < {}, volume > SMA x {} ({})",
             strategy_config_.adx_threshold, strategy_config_.rsi_threshold,
             strategy_config_.volume_multiplier,
             strategy_config_.use_volume_filter ? "on" : "off");
}

bool TradeEngine::inCooldown() const {
    return clock_() < cooldown_until_ms_;
}

EntrySignal TradeEngine::evaluateEntry(const strategy::IndicatorSnapshot& snapshot,
                                       const strategy::ScalpingStrategyConfig& config) {
    namespace ind = strategy::indicator;

    EntrySignal signal;
    const auto ema_fast = snapshot.get(ind::EMA_FAST);
    const auto ema_slow = snapshot.get(ind::EMA_SLOW);
    const auto adx = snapshot.get(ind::ADX);
    const auto rsi = snapshot.get(ind::RSI);
    if (!ema_fast || !ema_slow || !adx || !rsi) {
        return signal;
    }

    const bool crossover = *ema_fast > *ema_slow;
    const bool trending = *adx > config.adx_threshold;
    const bool not_overbought = *rsi < config.rsi_threshold;

    bool has_volume = true;
    if (config.use_volume_filter) {
        const auto volume = snapshot.get(ind::VOLUME);
        const auto volume_sma = snapshot.get(ind::VOLUME_SMA);
        if (!volume || !volume_sma) {
            return signal;
        }
        has_volume = *volume > *volume_sma * config.volume_multiplier;
    }

    if (crossover && trending && not_overbought) {
        if (has_volume) {
            signal.enter = true;
            signal.reason = "ok";
        } else {
            signal.reason = "low_volume";
        }
        return signal;
    }
    if (crossover && trending) {
        signal.reason = "rsi_overbought";
    } else if (crossover) {
        signal.reason = "lateral";
    }
    return signal;
}

std::optional<std::string> TradeEngine::evaluateExit(double price, long long now_ms) const {
    if (!position_) {
        return std::nullopt;
    }
    if (price >= position_->entry_price * (1.0 + strategy_config_.take_profit_pct)) {
        return std::string("tp");
    }
    if (price <= position_->stop_loss_price) {
        return std::string("sl");
    }
    const long long max_open_ms = static_cast<long long>(strategy_config_.max_open_minutes) * 60LL * 1000LL;
    if (now_ms - position_->opened_at_ms > max_open_ms) {
        return std::string("timeout");
    }
    return std::nullopt;
}

double TradeEngine::computeStopLoss(double entry_price, const strategy::IndicatorSnapshot& snapshot,
                                    const strategy::ScalpingStrategyConfig& config) {
    if (config.stop_loss_mode == strategy::StopLossMode::ATR) {
        const double atr = snapshot.valueOr(strategy::indicator::ATR, 0.0);
        if (atr > 0.0) {
            return entry_price - atr * config.atr_multiplier;
        }
    }
    return entry_price * (1.0 - config.stop_loss_pct);
}

void TradeEngine::onCandle(const Candle& candle, const strategy::IndicatorSnapshot& snapshot) {
    if (!candle.confirmed) {
        return;
    }

    if (!position_) {
        tryEnter(candle.close, snapshot);
    } else {
        tryExit(candle.close);
    }
}

void TradeEngine::onTick(const Tick& tick) {
    if (position_) {
        tryExit(tick.price);
    }
}

void TradeEngine::startCooldown(const std::string& why) {
    cooldown_until_ms_ = clock_() + static_cast<long long>(config_.entry_cooldown_seconds) * 1000LL;
    LOG_WARN("Entry failed ({}), no new entries for {}s", why, config_.entry_cooldown_seconds);
}

void TradeEngine::tryEnter(double price, const strategy::IndicatorSnapshot& snapshot) {
    // 포지션 보유 중 진입 시도는 무시
    if (position_) {
        return;
    }

    const auto signal = evaluateEntry(snapshot, strategy_config_);
    if (!signal.enter) {
        namespace ind = strategy::indicator;
        if (signal.reason == "lateral") {
            LOG_INFO("Entry rejected [lateral]: ADX {:.2f}", snapshot.valueOr(ind::ADX, 0.0));
        } else if (signal.reason == "rsi_overbought") {
            LOG_INFO("Entry rejected [rsi_overbought]: RSI {:.2f}", snapshot.valueOr(ind::RSI, 0.0));
        } else if (signal.reason == "low_volume") {
            LOG_INFO("Entry rejected [low_volume]: volume {:.4f} vs SMA {:.4f}",
                     snapshot.valueOr(ind::VOLUME, 0.0), snapshot.valueOr(ind::VOLUME_SMA, 0.0));
        }
        return;
    }

    if (inCooldown()) {
        LOG_DEBUG("Entry signal ignored during cooldown ({}ms left)", cooldown_until_ms_ - clock_());
        return;
    }

    try {
        const auto filters = normalizer_->filters();
        if (strategy_config_.risk_usdt < filters.min_notional) {
            LOG_DEBUG("Entry skipped: risk {} {} below minimum order value {}",
                      strategy_config_.risk_usdt, config_.quote_coin, filters.min_notional);
            return;
        }

        const auto order = normalizer_->buyByQuote(strategy_config_.risk_usdt);
        const auto fill = lookupFill(order.order_id);
        if (fill.quantity <= 0.0) {
            startCooldown("no fill for order " + order.order_id);
            return;
        }

        Position position;
        position.entry_price = fill.average_price;
        position.quantity = fill.quantity;
        position.opened_at_ms = clock_();
        position.stop_loss_price = computeStopLoss(fill.average_price, snapshot, strategy_config_);
        position.entry_order_id = order.order_id;
        position_ = position;

        LOG_INFO("==========================================");
        LOG_INFO("BUY FILLED | {} @ {:.2f} | qty {} (signal close {:.2f})",
                 config_.symbol, position.entry_price, position.quantity, price);
        LOG_INFO("  - stop loss {:.2f} (ATR {:.4f}), take profit {:.2f}",
                 position.stop_loss_price,
                 snapshot.valueOr(strategy::indicator::ATR, 0.0),
                 position.entry_price * (1.0 + strategy_config_.take_profit_pct));
        LOG_INFO("==========================================");
    } catch (const TradingError& e) {
        LOG_ERROR("Entry order for {} failed: {}", config_.symbol, e.what());
        startCooldown(e.what());
    }
}

void TradeEngine::tryExit(double price) {
    const auto reason = evaluateExit(price, clock_());
    if (!reason) {
        return;
    }

    const Position held = *position_;
    try {
        const auto order = normalizer_->sellByBase(held.quantity);
        const auto fill = lookupFill(order.order_id);
        const double exit_price = fill.quantity > 0.0 ? fill.average_price : price;

        const double pnl = (exit_price - held.entry_price) * held.quantity;
        const char* label = pnl > 0.0 ? "gain" : "loss";

        LOG_INFO("==========================================");
        LOG_INFO("SELL ({}) | {} | {} @ {:.2f}", *reason, label, config_.symbol, exit_price);
        LOG_INFO("  - PnL: {:+.2f} {}", pnl, config_.quote_coin);
        LOG_INFO("==========================================");

        if (journal_) {
            TradeRecord record;
            record.ts_ms = clock_();
            record.symbol = config_.symbol;
            record.side = "SELL";
            record.reason = *reason;
            record.price = exit_price;
            record.quantity = held.quantity;
            record.investment = held.entry_price * held.quantity;
            record.pnl = pnl;
            record.balance = quoteBalance();
            if (!journal_->append(record)) {
                LOG_ERROR("Trade record for {} not written", config_.symbol);
            }
        }

        position_.reset();
    } catch (const TradingError& e) {
        // 포지션 유지 - 다음 이벤트에서 같은 조건을 다시 평가
        LOG_ERROR("Exit ({}) for {} qty {} failed: {}", *reason, config_.symbol, held.quantity, e.what());
    }
}

FillSummary TradeEngine::lookupFill(const std::string& order_id) {
    FillSummary summary;
    const int attempts = std::max(1, config_.fill_lookup_attempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            const auto fills = gateway_->getExecutions(config_.symbol, order_id, 50);
            double quantity = 0.0;
            double notional = 0.0;
            for (const auto& fill : fills) {
                if (!order_id.empty() && fill.order_id != order_id) {
                    continue;
                }
                quantity += fill.quantity;
                notional += fill.quantity * fill.price;
            }
            if (quantity > 0.0) {
                summary.quantity = quantity;
                summary.average_price = notional / quantity;
                return summary;
            }
        } catch (const TradingError& e) {
            LOG_WARN("Fill lookup for {} failed (attempt {}/{}): {}", order_id, attempt, attempts, e.what());
        }

        if (attempt < attempts) {
            sleeper_(std::chrono::milliseconds(config_.fill_lookup_delay_ms));
        }
    }

    LOG_WARN("No executions found for order {}", order_id);
    return summary;
}

double TradeEngine::quoteBalance() {
    try {
        return gateway_->getWalletBalance({config_.quote_coin}).available(config_.quote_coin);
    } catch (const TradingError& e) {
        LOG_WARN("Balance after exit unavailable: {}", e.what());
        return 0.0;
    }
}

} // namespace engine
} // namespace spotpilot
