#include "backtest/FileMarketDataProvider.h"

#include "backtest/DataHistory.h"
#include "common/Logger.h"

namespace adaptiverisk {
namespace backtest {

FileMarketDataProvider::FileMarketDataProvider(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::vector<PriceBar> FileMarketDataProvider::fetchBars(const std::string& symbol,
                                                        const std::string& start_date,
                                                        const std::string& end_date) {
    const auto csv_path = data_dir_ / (symbol + ".csv");
    const auto json_path = data_dir_ / (symbol + ".json");

    std::vector<PriceBar> bars;
    if (std::filesystem::exists(csv_path)) {
        bars = DataHistory::loadCSV(csv_path.string(), symbol);
    } else if (std::filesystem::exists(json_path)) {
        bars = DataHistory::loadJSON(json_path.string(), symbol);
    } else {
        LOG_WARN("No data file for {} in {}", symbol, data_dir_.string());
        return bars;
    }
    return DataHistory::filterByDate(bars, start_date, end_date);
}

} // namespace backtest
} // namespace adaptiverisk
