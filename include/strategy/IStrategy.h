#pragma once

#include <string>
#include <vector>

#include "backtest/PriceSeriesCache.h"
#include "backtest/TradeSimulator.h"
#include "common/Types.h"

namespace adaptiverisk {
namespace strategy {

struct StrategyInfo {
    std::string name;
    std::string description;
    std::string timeframe;
};

// What a strategy may see and do at one replay step. Prices are as-of the
// step timestamp; the simulator is the only way to trade.
struct StrategyContext {
    TimestampMs timestamp;
    const std::vector<std::string>& symbols;
    const backtest::PriceSeriesCache& prices;
    backtest::TradeSimulator& simulator;
};

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // Bars the strategy needs before its first step.
    virtual size_t lookbackBars() const = 0;

    // Called once per timeline step, in timestamp order.
    virtual void onStep(StrategyContext& context) = 0;
};

} // namespace strategy
} // namespace adaptiverisk
