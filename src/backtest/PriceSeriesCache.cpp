#include "backtest/PriceSeriesCache.h"

#include <algorithm>

#include "common/Logger.h"

namespace adaptiverisk {
namespace backtest {

void PriceSeriesCache::load(const std::string& symbol, std::vector<PriceBar> bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<PriceBar> unique_bars;
    unique_bars.reserve(bars.size());
    for (auto& bar : bars) {
        bar.symbol = symbol;
        if (!unique_bars.empty() && unique_bars.back().timestamp == bar.timestamp) {
            unique_bars.back() = bar;
            continue;
        }
        unique_bars.push_back(bar);
    }

    if (unique_bars.size() != bars.size()) {
        LOG_WARN("{}: dropped {} duplicate bars", symbol, bars.size() - unique_bars.size());
    }
    series_[symbol] = std::move(unique_bars);
}

size_t PriceSeriesCache::loadFrom(core::IMarketDataProvider& provider,
                                  const std::vector<std::string>& symbols,
                                  const std::string& start_date,
                                  const std::string& end_date) {
    size_t loaded = 0;
    for (const auto& symbol : symbols) {
        auto bars = provider.fetchBars(symbol, start_date, end_date);
        if (bars.empty()) {
            LOG_WARN("No bars for {} between {} and {}", symbol, start_date, end_date);
            continue;
        }
        load(symbol, std::move(bars));
        ++loaded;
    }
    LOG_INFO("Price cache loaded {}/{} symbols", loaded, symbols.size());
    return loaded;
}

long PriceSeriesCache::asOfIndex(const std::vector<PriceBar>& bars, TimestampMs timestamp) const {
    auto it = std::upper_bound(bars.begin(), bars.end(), timestamp,
                               [](TimestampMs ts, const PriceBar& bar) { return ts < bar.timestamp; });
    if (it == bars.begin()) {
        return -1;
    }
    return static_cast<long>(std::distance(bars.begin(), it)) - 1;
}

std::optional<Price> PriceSeriesCache::priceAt(const std::string& symbol,
                                               TimestampMs timestamp,
                                               PriceField field) const {
    auto bar = barAt(symbol, timestamp);
    if (!bar) {
        return std::nullopt;
    }
    return bar->field(field);
}

std::optional<PriceBar> PriceSeriesCache::barAt(const std::string& symbol, TimestampMs timestamp) const {
    auto it = series_.find(symbol);
    if (it == series_.end()) {
        return std::nullopt;
    }
    const long idx = asOfIndex(it->second, timestamp);
    if (idx < 0) {
        return std::nullopt;
    }
    return it->second[static_cast<size_t>(idx)];
}

std::vector<PriceBar> PriceSeriesCache::history(const std::string& symbol,
                                                TimestampMs timestamp,
                                                size_t lookback) const {
    auto it = series_.find(symbol);
    if (it == series_.end() || lookback == 0) {
        return {};
    }
    const long idx = asOfIndex(it->second, timestamp);
    if (idx < 0) {
        return {};
    }
    const size_t end = static_cast<size_t>(idx) + 1;
    const size_t begin = (end > lookback) ? end - lookback : 0;
    return std::vector<PriceBar>(it->second.begin() + static_cast<long>(begin),
                                 it->second.begin() + static_cast<long>(end));
}

std::vector<std::string> PriceSeriesCache::symbols() const {
    std::vector<std::string> out;
    out.reserve(series_.size());
    for (const auto& [symbol, bars] : series_) {
        out.push_back(symbol);
    }
    return out;
}

std::vector<TimestampMs> PriceSeriesCache::timeline(const std::string& symbol) const {
    std::vector<TimestampMs> out;
    auto it = series_.find(symbol);
    if (it == series_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (const auto& bar : it->second) {
        out.push_back(bar.timestamp);
    }
    return out;
}

} // namespace backtest
} // namespace adaptiverisk
