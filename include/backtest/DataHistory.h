#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace adaptiverisk {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    static std::vector<PriceBar> loadCSV(const std::string& file_path, const std::string& symbol);

    // Load bars from a JSON array (long or single-letter keys)
    static std::vector<PriceBar> loadJSON(const std::string& file_path, const std::string& symbol);

    // Keep bars whose UTC day lies in [start_date, end_date]. Empty bounds are open.
    static std::vector<PriceBar> filterByDate(const std::vector<PriceBar>& bars,
                                              const std::string& start_date,
                                              const std::string& end_date);
};

} // namespace backtest
} // namespace adaptiverisk
