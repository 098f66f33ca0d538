#pragma once

#include <memory>
#include <string>
#include <vector>

#include "backtest/PriceSeriesCache.h"
#include "backtest/TradeSimulator.h"
#include "core/contracts/IMarketDataProvider.h"
#include "engine/EngineConfig.h"
#include "engine/PerformanceTypes.h"
#include "strategy/IStrategy.h"

namespace adaptiverisk {
namespace backtest {

class BacktestEngine {
public:
    BacktestEngine();

    // Initialize engine with configuration
    void init(const engine::SimulationConfig& config);

    // Load historical data once for the whole run. The first symbol's bars
    // drive the replay timeline.
    size_t loadData(core::IMarketDataProvider& provider,
                    const std::vector<std::string>& symbols,
                    const std::string& start_date,
                    const std::string& end_date);

    // Direct load, mostly for fixtures
    void loadBars(const std::string& symbol, std::vector<PriceBar> bars);

    // Replays the timeline in order. Returns false when there is nothing to replay.
    bool run(strategy::IStrategy& active_strategy);

    engine::BacktestReport getResult() const;

    const PriceSeriesCache& prices() const { return prices_; }

private:
    engine::SimulationConfig config_;
    PriceSeriesCache prices_;
    std::vector<std::string> symbols_;
    std::string start_date_;
    std::string end_date_;
    std::unique_ptr<TradeSimulator> simulator_;
};

} // namespace backtest
} // namespace adaptiverisk
