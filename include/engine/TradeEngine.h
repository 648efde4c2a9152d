#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/TradeJournal.h"
#include "exchange/IExchangeGateway.h"
#include "execution/OrderNormalizer.h"
#include "strategy/IndicatorSnapshot.h"
#include "strategy/StrategyConfig.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace spotpilot {
namespace engine {

struct Position {
    double entry_price = 0.0;
    double quantity = 0.0;
    long long opened_at_ms = 0;
    double stop_loss_price = 0.0;
    std::string entry_order_id;
};

struct EntrySignal {
    bool enter = false;
    std::string reason;     // ok / lateral / rsi_overbought / low_volume / "" (교차 없음, 지표 부족)
};

struct FillSummary {
    double quantity = 0.0;
    double average_price = 0.0;   // 수량 가중 평균
};

// 포지션 상태 머신: Flat -> InPosition -> Flat (동시에 1개)
// 피드의 직렬화된 전달 컨텍스트에서만 호출되므로 내부 잠금 없음
class TradeEngine {
public:
    using Clock = std::function<long long()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    TradeEngine(
        EngineConfig config,
        strategy::ScalpingStrategyConfig strategy_config,
        std::shared_ptr<execution::OrderNormalizer> normalizer,
        std::shared_ptr<exchange::IExchangeGateway> gateway,
        std::shared_ptr<ITradeJournal> journal,
        Clock clock = nullptr,
        Sleeper sleeper = nullptr
    );

    // 확정 봉: Flat 이면 진입, InPosition 이면 청산 평가 (종가 기준)
    void onCandle(const Candle& candle, const strategy::IndicatorSnapshot& snapshot);

    // 틱: 청산만 평가
    void onTick(const Tick& tick);

    bool inPosition() const { return position_.has_value(); }
    const std::optional<Position>& position() const { return position_; }
    bool inCooldown() const;
    long long cooldownUntilMs() const { return cooldown_until_ms_; }

    static EntrySignal evaluateEntry(const strategy::IndicatorSnapshot& snapshot,
                                     const strategy::ScalpingStrategyConfig& config);

    // tp -> sl -> timeout 순서, 해당 없으면 nullopt
    std::optional<std::string> evaluateExit(double price, long long now_ms) const;

    static double computeStopLoss(double entry_price, const strategy::IndicatorSnapshot& snapshot,
                                  const strategy::ScalpingStrategyConfig& config);

private:
    void tryEnter(double price, const strategy::IndicatorSnapshot& snapshot);
    void tryExit(double price);
    FillSummary lookupFill(const std::string& order_id);
    double quoteBalance();
    void startCooldown(const std::string& why);

    EngineConfig config_;
    strategy::ScalpingStrategyConfig strategy_config_;
    std::shared_ptr<execution::OrderNormalizer> normalizer_;
    std::shared_ptr<exchange::IExchangeGateway> gateway_;
    std::shared_ptr<ITradeJournal> journal_;
    Clock clock_;
    Sleeper sleeper_;

    std::optional<Position> position_;
    long long cooldown_until_ms_ = 0;
};

} // namespace engine
} // namespace spotpilot
