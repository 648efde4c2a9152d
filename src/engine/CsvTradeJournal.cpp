#include "engine/CsvTradeJournal.h"

#include "common/Logger.h"
#include "common/TickSizeHelper.h"

#include <ctime>
#include <fstream>
#include <sstream>
#include <system_error>

namespace spotpilot {
namespace engine {

namespace {
std::string formatUtc(long long ts_ms, const char* pattern) {
    const std::time_t seconds = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), pattern, &tm_utc);
    return buf;
}
}

CsvTradeJournal::CsvTradeJournal(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

const char* CsvTradeJournal::header() {
    return "date,time,symbol,side,reason,price,quantity,investment,pnl,balance";
}

std::string CsvTradeJournal::formatRow(const TradeRecord& record) {
    std::ostringstream row;
    row << formatUtc(record.ts_ms, "%Y-%m-%d") << ","
        << formatUtc(record.ts_ms, "%H:%M:%S") << ","
        << record.symbol << ","
        << record.side << ","
        << record.reason << ","
        << common::formatFixed(record.price, 8) << ","
        << common::formatFixed(record.quantity, 8) << ","
        << common::formatFixed(record.investment, 2) << ","
        << common::formatFixed(record.pnl, 2) << ","
        << common::formatFixed(record.balance, 2);
    return row.str();
}

bool CsvTradeJournal::append(const TradeRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Trade journal directory {} not created: {}",
                      file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    const bool needs_header = !std::filesystem::exists(file_path_, ec) ||
                              std::filesystem::file_size(file_path_, ec) == 0;

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Trade journal {} not writable", file_path_.string());
        return false;
    }

    if (needs_header) {
        out << header() << "\n";
    }
    out << formatRow(record) << "\n";
    out.flush();
    return static_cast<bool>(out);
}

} // namespace engine
} // namespace spotpilot
