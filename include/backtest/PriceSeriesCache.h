#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IMarketDataProvider.h"

namespace adaptiverisk {
namespace backtest {

// Per-symbol bars loaded once up front. Lookups are as-of: the bar at the
// exact timestamp, otherwise the latest bar strictly before it. Never a
// later bar.
class PriceSeriesCache {
public:
    // Replaces any bars already held for the symbol. Sorted on load; for
    // duplicate timestamps the last bar wins.
    void load(const std::string& symbol, std::vector<PriceBar> bars);

    // Returns the number of symbols that received at least one bar.
    size_t loadFrom(core::IMarketDataProvider& provider,
                    const std::vector<std::string>& symbols,
                    const std::string& start_date,
                    const std::string& end_date);

    std::optional<Price> priceAt(const std::string& symbol,
                                 TimestampMs timestamp,
                                 PriceField field = PriceField::CLOSE) const;
    std::optional<PriceBar> barAt(const std::string& symbol, TimestampMs timestamp) const;

    // Up to `lookback` bars ending at the as-of bar, oldest first.
    std::vector<PriceBar> history(const std::string& symbol, TimestampMs timestamp, size_t lookback) const;

    std::vector<std::string> symbols() const;
    std::vector<TimestampMs> timeline(const std::string& symbol) const;

private:
    // Index of the as-of bar, or -1 if none exists at or before timestamp.
    long asOfIndex(const std::vector<PriceBar>& bars, TimestampMs timestamp) const;

    std::map<std::string, std::vector<PriceBar>> series_;
};

} // namespace backtest
} // namespace adaptiverisk
