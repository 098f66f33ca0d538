#include "backtest/BacktestEngine.h"

#include <algorithm>

#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "engine/LotMatcher.h"
#include "engine/PerformanceAnalyzer.h"

namespace adaptiverisk {
namespace backtest {

BacktestEngine::BacktestEngine() = default;

void BacktestEngine::init(const engine::SimulationConfig& config) {
    config_ = config;
    simulator_.reset();
    LOG_INFO("Backtest engine initialized: capital={:.2f}, slippage={:.3f}%, commission={:.2f}",
             config_.initial_capital, config_.slippage_pct, config_.commission);
}

size_t BacktestEngine::loadData(core::IMarketDataProvider& provider,
                                const std::vector<std::string>& symbols,
                                const std::string& start_date,
                                const std::string& end_date) {
    start_date_ = start_date;
    end_date_ = end_date;
    for (const auto& symbol : symbols) {
        if (std::find(symbols_.begin(), symbols_.end(), symbol) == symbols_.end()) {
            symbols_.push_back(symbol);
        }
    }
    return prices_.loadFrom(provider, symbols, start_date, end_date);
}

void BacktestEngine::loadBars(const std::string& symbol, std::vector<PriceBar> bars) {
    if (std::find(symbols_.begin(), symbols_.end(), symbol) == symbols_.end()) {
        symbols_.push_back(symbol);
    }
    prices_.load(symbol, std::move(bars));
}

bool BacktestEngine::run(strategy::IStrategy& active_strategy) {
    if (symbols_.empty()) {
        LOG_ERROR("Backtest has no symbols");
        return false;
    }

    const auto dates = prices_.timeline(symbols_.front());
    if (dates.empty()) {
        LOG_ERROR("No bars for timeline symbol {}", symbols_.front());
        return false;
    }

    simulator_ = std::make_unique<TradeSimulator>(prices_, config_);
    const size_t lookback = active_strategy.lookbackBars();

    LOG_INFO("Starting backtest '{}' over {} steps ({} symbols)",
             active_strategy.getInfo().name, dates.size(), symbols_.size());

    for (size_t i = 0; i < dates.size(); ++i) {
        if (i < lookback) {
            continue;
        }
        simulator_->recordEquity(dates[i]);

        strategy::StrategyContext context{dates[i], symbols_, prices_, *simulator_};
        active_strategy.onStep(context);
    }

    // Final mark after the last step's trades
    simulator_->recordEquity(dates.back());

    const auto curve = simulator_->equityCurve();
    LOG_INFO("Backtest completed: {} trades, final equity {:.2f}",
             simulator_->trades().size(), curve.empty() ? config_.initial_capital : curve.back().equity);
    return true;
}

engine::BacktestReport BacktestEngine::getResult() const {
    if (!simulator_) {
        return engine::PerformanceAnalyzer::report({}, {}, config_.initial_capital);
    }

    const auto trades = simulator_->trades();
    const auto closed = engine::LotMatcher::closeTrades(trades);
    auto report = engine::PerformanceAnalyzer::report(simulator_->equityCurve(), closed, config_.initial_capital);
    report.trade_history = trades;

    TimestampMs ts = 0;
    if (!start_date_.empty() && utils::parseDate(start_date_, ts)) {
        report.start_time = ts;
    }
    if (!end_date_.empty() && utils::parseDate(end_date_, ts)) {
        report.end_time = ts;
    }
    return report;
}

} // namespace backtest
} // namespace adaptiverisk
