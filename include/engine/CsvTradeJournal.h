#pragma once

#include <filesystem>
#include <mutex>

#include "engine/TradeJournal.h"

namespace spotpilot {
namespace engine {

// date,time,symbol,side,reason,price,quantity,investment,pnl,balance (UTC)
class CsvTradeJournal : public ITradeJournal {
public:
    explicit CsvTradeJournal(std::filesystem::path file_path);

    bool append(const TradeRecord& record) override;

    const std::filesystem::path& path() const { return file_path_; }

    static const char* header();
    static std::string formatRow(const TradeRecord& record);

private:
    std::filesystem::path file_path_;
    std::mutex mutex_;
};

} // namespace engine
} // namespace spotpilot
