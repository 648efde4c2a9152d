#pragma once

#include <string>

namespace spotpilot {
namespace engine {

// 청산된 포지션 1건
struct TradeRecord {
    long long ts_ms = 0;
    std::string symbol;
    std::string side;          // "SELL"
    std::string reason;        // tp / sl / timeout
    double price = 0.0;
    double quantity = 0.0;
    double investment = 0.0;   // entry * quantity
    double pnl = 0.0;
    double balance = 0.0;      // 청산 후 quote 잔고
};

class ITradeJournal {
public:
    virtual ~ITradeJournal() = default;

    virtual bool append(const TradeRecord& record) = 0;
};

} // namespace engine
} // namespace spotpilot
