#pragma once

#include <mutex>
#include <vector>

#include "backtest/PositionLedger.h"
#include "backtest/PriceSeriesCache.h"
#include "core/model/EngineTypes.h"
#include "engine/EngineConfig.h"

namespace adaptiverisk {
namespace backtest {

// Fills requests against the price cache with slippage and a flat
// commission, mutating the ledger it owns. Every fill appends exactly one
// SimulatedTrade; rejections are returned, never thrown.
class TradeSimulator {
public:
    TradeSimulator(const PriceSeriesCache& prices, const engine::SimulationConfig& config);

    core::ExecutionResult execute(const core::TradeRequest& request);

    // Appends one equity point valued at as-of close prices. Refuses a
    // timestamp earlier than the last recorded point.
    bool recordEquity(TimestampMs timestamp);

    const PositionLedger& ledger() const { return ledger_; }
    const PriceSeriesCache& prices() const { return prices_; }

    std::vector<SimulatedTrade> trades() const;
    std::vector<EquityPoint> equityCurve() const;

    // As-of close lookup bound to a point in time, for ledger valuation.
    PositionLedger::PriceLookup priceLookupAt(TimestampMs timestamp) const;

private:
    core::ExecutionResult reject(const core::TradeRequest& request,
                                 core::RejectReason reason,
                                 const std::string& message) const;

    const PriceSeriesCache& prices_;
    engine::SimulationConfig config_;
    PositionLedger ledger_;

    std::vector<SimulatedTrade> trades_;
    std::vector<EquityPoint> equity_curve_;
    long long trade_seq_ = 0;

    // Covers funds check, ledger mutation and trade append as one step.
    mutable std::mutex mutex_;
};

} // namespace backtest
} // namespace adaptiverisk
