#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/contracts/IMarketDataProvider.h"

namespace adaptiverisk {
namespace backtest {

// One file per symbol: <dir>/<SYMBOL>.csv, falling back to <dir>/<SYMBOL>.json.
class FileMarketDataProvider : public core::IMarketDataProvider {
public:
    explicit FileMarketDataProvider(std::filesystem::path data_dir);

    std::vector<PriceBar> fetchBars(
        const std::string& symbol,
        const std::string& start_date,
        const std::string& end_date
    ) override;

private:
    std::filesystem::path data_dir_;
};

} // namespace backtest
} // namespace adaptiverisk
