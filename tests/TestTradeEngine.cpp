#include "engine/TradeEngine.h"
#include "common/Errors.h"
#include "TestDoubles.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

using namespace spotpilot;
using namespace spotpilot::engine;
using spotpilot::testing::FakeExchangeGateway;
namespace ind = spotpilot::strategy::indicator;

namespace {
bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

class RecordingJournal : public ITradeJournal {
public:
    bool append(const TradeRecord& record) override {
        records.push_back(record);
        return true;
    }
    std::vector<TradeRecord> records;
};

strategy::IndicatorSnapshot bullishSnapshot(double atr = 0.5) {
    strategy::IndicatorSnapshot snapshot;
    snapshot.set(ind::EMA_FAST, 101.0);
    snapshot.set(ind::EMA_SLOW, 100.0);
    snapshot.set(ind::ADX, 30.0);
    snapshot.set(ind::RSI, 55.0);
    snapshot.set(ind::ATR, atr);
    snapshot.set(ind::VOLUME, 20.0);
    snapshot.set(ind::VOLUME_SMA, 10.0);
    return snapshot;
}

Candle closedAt(double close, bool confirmed = true) {
    return Candle(1700000000000LL, close, close, close, close, 20.0, confirmed);
}

Tick tickAt(double price) {
    Tick tick;
    tick.symbol = "BTCUSDT";
    tick.price = price;
    return tick;
}

struct Harness {
    std::shared_ptr<FakeExchangeGateway> gateway = std::make_shared<FakeExchangeGateway>();
    std::shared_ptr<RecordingJournal> journal = std::make_shared<RecordingJournal>();
    long long now_ms = 1700000000000LL;
    int sleeps = 0;
    std::unique_ptr<TradeEngine> engine;

    explicit Harness(strategy::ScalpingStrategyConfig strategy_config = strategy::ScalpingStrategyConfig()) {
        gateway->balances["USDT"] = 1000.0;
        gateway->last_price = 100.0;
        auto normalizer = std::make_shared<execution::OrderNormalizer>(gateway, "BTCUSDT", "USDT");
        engine = std::make_unique<TradeEngine>(
            EngineConfig(), strategy_config, normalizer, gateway, journal,
            [this]() { return now_ms; },
            [this](std::chrono::milliseconds) { ++sleeps; });
    }

    // 진입가 100, 수량 2
    void enter() {
        gateway->addFill("order-" + std::to_string(gateway->placed.size() + 1), 100.0, 2.0);
        engine->onCandle(closedAt(100.0), bullishSnapshot());
        assert(engine->inPosition());
        gateway->balances["BTC"] = 2.0;
    }
};
}

int main() {
    // ===== 진입 신호 판정 =====
    {
        const strategy::ScalpingStrategyConfig config;
        auto signal = TradeEngine::evaluateEntry(bullishSnapshot(), config);
        assert(signal.enter && signal.reason == "ok");

        auto snapshot = bullishSnapshot();
        snapshot.set(ind::ADX, 20.0);
        signal = TradeEngine::evaluateEntry(snapshot, config);
        assert(!signal.enter && signal.reason == "lateral");

        snapshot = bullishSnapshot();
        snapshot.set(ind::RSI, 70.0);
        signal = TradeEngine::evaluateEntry(snapshot, config);
        assert(!signal.enter && signal.reason == "rsi_overbought");

        snapshot = bullishSnapshot();
        snapshot.set(ind::VOLUME, 11.0);   // 11 < 10 * 1.2
        signal = TradeEngine::evaluateEntry(snapshot, config);
        assert(!signal.enter && signal.reason == "low_volume");

        strategy::ScalpingStrategyConfig no_volume = config;
        no_volume.use_volume_filter = false;
        assert(TradeEngine::evaluateEntry(snapshot, no_volume).enter);

        snapshot = bullishSnapshot();
        snapshot.set(ind::EMA_FAST, 99.0);
        signal = TradeEngine::evaluateEntry(snapshot, config);
        assert(!signal.enter && signal.reason.empty());

        // 지표가 비어 있으면 진입하지 않음
        assert(!TradeEngine::evaluateEntry(strategy::IndicatorSnapshot(), config).enter);
    }

    // ===== 손절가 =====
    {
        strategy::ScalpingStrategyConfig config;
        assert(near(TradeEngine::computeStopLoss(100.0, bullishSnapshot(0.5), config), 99.25));
        assert(near(TradeEngine::computeStopLoss(100.0, bullishSnapshot(0.0), config), 99.5));
        config.stop_loss_mode = strategy::StopLossMode::PERCENT;
        assert(near(TradeEngine::computeStopLoss(100.0, bullishSnapshot(0.5), config), 99.5));
    }

    // ===== 진입 -> 익절: 100 진입, tp 0.3% 는 100.3 에서 발동, 100.5 체결 PnL 1.0 =====
    {
        Harness h;
        h.enter();
        assert(h.gateway->placed.size() == 1);
        const auto& buy = h.gateway->placed.front();
        assert(buy.side == OrderSide::BUY);
        assert(buy.quantity == "5.00");
        assert(near(h.engine->position()->entry_price, 100.0));
        assert(near(h.engine->position()->quantity, 2.0));
        assert(near(h.engine->position()->stop_loss_price, 99.25));

        // 보유 중 진입 신호는 무시 (청산 조건만 평가)
        h.engine->onCandle(closedAt(100.1), bullishSnapshot());
        assert(h.gateway->placed.size() == 1);

        h.engine->onTick(tickAt(100.29));
        assert(h.engine->inPosition());

        h.gateway->last_price = 100.5;
        h.gateway->addFill("order-2", 100.5, 2.0);
        h.engine->onTick(tickAt(100.3));
        assert(!h.engine->inPosition());
        assert(h.gateway->placed.size() == 2);
        assert(h.gateway->placed.back().side == OrderSide::SELL);
        assert(h.gateway->placed.back().quantity == "2.0000");

        assert(h.journal->records.size() == 1);
        const auto& record = h.journal->records.front();
        assert(record.reason == "tp");
        assert(record.side == "SELL");
        assert(near(record.price, 100.5));
        assert(near(record.quantity, 2.0));
        assert(near(record.pnl, 1.0));
        assert(near(record.investment, 200.0));
        assert(near(record.balance, 1000.0));
    }

    // ===== 손절: 체결 내역이 없으면 트리거 가격으로 기록 =====
    {
        Harness h;
        h.enter();
        h.engine->onTick(tickAt(99.3));
        assert(h.engine->inPosition());

        h.engine->onTick(tickAt(99.2));
        assert(!h.engine->inPosition());
        assert(h.journal->records.size() == 1);
        assert(h.journal->records.front().reason == "sl");
        assert(near(h.journal->records.front().price, 99.2));
        assert(near(h.journal->records.front().pnl, -1.6));
        assert(h.sleeps == 2);   // 체결 조회 3회, 사이 대기 2회
    }

    // ===== 보유 시간 초과 =====
    {
        Harness h;
        h.enter();
        h.now_ms += 20LL * 60 * 1000;
        h.engine->onTick(tickAt(100.1));
        assert(h.engine->inPosition());

        h.now_ms += 1;
        h.engine->onTick(tickAt(100.1));
        assert(!h.engine->inPosition());
        assert(h.journal->records.front().reason == "timeout");
    }

    // ===== 청산 실패 시 포지션 유지, 다음 이벤트에서 재시도 =====
    {
        Harness h;
        h.enter();
        h.gateway->balances["BTC"] = 0.0;
        h.engine->onTick(tickAt(100.4));
        assert(h.engine->inPosition());
        assert(h.journal->records.empty());
        assert(h.gateway->placed.size() == 1);

        h.gateway->balances["BTC"] = 2.0;
        h.engine->onTick(tickAt(100.4));
        assert(!h.engine->inPosition());
        assert(h.journal->records.size() == 1);
    }

    // ===== 진입 실패 후 재진입 대기 =====
    {
        Harness h;
        // 체결 내역이 없으면 진입 실패
        h.engine->onCandle(closedAt(100.0), bullishSnapshot());
        assert(!h.engine->inPosition());
        assert(h.engine->inCooldown());
        assert(h.gateway->placed.size() == 1);
        assert(h.gateway->execution_calls == 3);

        h.now_ms += 30 * 1000;
        h.engine->onCandle(closedAt(100.0), bullishSnapshot());
        assert(h.gateway->placed.size() == 1);

        h.now_ms += 31 * 1000;
        assert(!h.engine->inCooldown());
        h.gateway->addFill("order-2", 100.0, 0.05);
        h.engine->onCandle(closedAt(100.0), bullishSnapshot());
        assert(h.gateway->placed.size() == 2);
        assert(h.engine->inPosition());
    }

    // ===== 주문 거절도 재진입 대기 =====
    {
        Harness h;
        h.gateway->on_place = [](const OrderRequest&) -> OrderAck {
            throw ExchangeRejected(170131, "Insufficient balance.");
        };
        h.engine->onCandle(closedAt(100.0), bullishSnapshot());
        assert(!h.engine->inPosition());
        assert(h.engine->inCooldown());
        assert(h.engine->cooldownUntilMs() == h.now_ms + 60 * 1000);
    }

    // ===== 최소 주문 금액보다 작은 투입 금액은 주문하지 않음 =====
    {
        strategy::ScalpingStrategyConfig config;
        config.risk_usdt = 3.0;
        Harness h(config);
        h.engine->onCandle(closedAt(100.0), bullishSnapshot());
        assert(h.gateway->placed.empty());
        assert(!h.engine->inCooldown());
    }

    // ===== 미확정 봉 / 지표 부족 =====
    {
        Harness h;
        h.engine->onCandle(closedAt(100.0, false), bullishSnapshot());
        h.engine->onCandle(closedAt(100.0), strategy::IndicatorSnapshot());
        h.engine->onTick(tickAt(100.0));
        assert(h.gateway->placed.empty());
    }

    std::cout << "[TEST] TradeEngine PASSED\n";
    return 0;
}
