#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "engine/PerformanceTypes.h"

namespace adaptiverisk {
namespace engine {

// Return, Sharpe, drawdown and trade statistics. Used for a finished
// backtest and for rolling windows of live history; windowing is done by
// the caller through closedWithin().
class PerformanceAnalyzer {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;

    static BacktestReport report(const std::vector<EquityPoint>& equity_curve,
                                 const std::vector<ClosedTrade>& closed_trades,
                                 double initial_capital);

    static PerformanceWindowReport windowReport(const std::string& timeframe,
                                                const std::vector<ClosedTrade>& closed_trades);

    // Annualized; 0 with fewer than two returns or zero variance.
    static double sharpeRatio(const std::vector<EquityPoint>& equity_curve);

    // Most negative peak-to-trough decline in percent; 0 if none.
    static double maxDrawdownPct(const std::vector<EquityPoint>& equity_curve);

    static double winRate(const std::vector<ClosedTrade>& closed_trades);

    // +inf with winners and no losers, 0 without trades.
    static double profitFactor(const std::vector<ClosedTrade>& closed_trades);

    // Trades whose exit falls within (now - days, now].
    static std::vector<ClosedTrade> closedWithin(const std::vector<ClosedTrade>& closed_trades,
                                                 TimestampMs now,
                                                 int days);

    // Percent change of equity since the start of the day. The baseline is
    // the last point before day_start, or the first point of the day.
    static double dailyPnlPct(const std::vector<EquityPoint>& equity_curve, TimestampMs day_start);
};

} // namespace engine
} // namespace adaptiverisk
