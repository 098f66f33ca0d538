#include "engine/PerformanceAnalyzer.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "common/TimeUtils.h"
#include "engine/CalibrationAnalyzer.h"

namespace adaptiverisk {
namespace engine {
namespace {
constexpr double kVarianceEpsilon = 1e-12;

std::vector<double> periodReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }
    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].equity;
        if (prev == 0.0) {
            continue;
        }
        returns.push_back((equity_curve[i].equity - prev) / prev);
    }
    return returns;
}
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<EquityPoint>& equity_curve) {
    const auto returns = periodReturns(equity_curve);
    if (returns.size() < 2) {
        return 0.0;
    }

    double sum = 0.0;
    for (double r : returns) {
        sum += r;
    }
    const double mean = sum / static_cast<double>(returns.size());

    double sq = 0.0;
    for (double r : returns) {
        sq += (r - mean) * (r - mean);
    }
    // Sample standard deviation (n - 1)
    const double stdev = std::sqrt(sq / static_cast<double>(returns.size() - 1));
    if (!(stdev > kVarianceEpsilon)) {
        return 0.0;
    }
    return (mean / stdev) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double PerformanceAnalyzer::maxDrawdownPct(const std::vector<EquityPoint>& equity_curve) {
    double running_max = -std::numeric_limits<double>::infinity();
    double worst = 0.0;
    for (const auto& point : equity_curve) {
        running_max = std::max(running_max, point.equity);
        if (running_max <= 0.0) {
            continue;
        }
        const double drawdown = (point.equity - running_max) / running_max;
        worst = std::min(worst, drawdown);
    }
    return worst * 100.0;
}

double PerformanceAnalyzer::winRate(const std::vector<ClosedTrade>& closed_trades) {
    if (closed_trades.empty()) {
        return 0.0;
    }
    const auto wins = std::count_if(closed_trades.begin(), closed_trades.end(),
                                    [](const ClosedTrade& t) { return t.pnl > 0.0; });
    return static_cast<double>(wins) / static_cast<double>(closed_trades.size());
}

double PerformanceAnalyzer::profitFactor(const std::vector<ClosedTrade>& closed_trades) {
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    for (const auto& trade : closed_trades) {
        if (trade.pnl > 0.0) {
            gross_profit += trade.pnl;
        } else if (trade.pnl < 0.0) {
            gross_loss += -trade.pnl;
        }
    }
    if (gross_loss > 0.0) {
        return gross_profit / gross_loss;
    }
    return (gross_profit > 0.0) ? std::numeric_limits<double>::infinity() : 0.0;
}

BacktestReport PerformanceAnalyzer::report(const std::vector<EquityPoint>& equity_curve,
                                           const std::vector<ClosedTrade>& closed_trades,
                                           double initial_capital) {
    BacktestReport r;
    r.initial_capital = initial_capital;
    r.final_value = equity_curve.empty() ? initial_capital : equity_curve.back().equity;
    r.total_return = r.final_value - initial_capital;
    r.total_return_pct = (initial_capital != 0.0) ? (r.total_return / initial_capital * 100.0) : 0.0;
    r.sharpe_ratio = sharpeRatio(equity_curve);
    r.max_drawdown = maxDrawdownPct(equity_curve);

    r.total_trades = static_cast<int>(closed_trades.size());
    r.win_rate = winRate(closed_trades);
    r.profit_factor = profitFactor(closed_trades);
    if (!closed_trades.empty()) {
        double total_pnl = 0.0;
        for (const auto& trade : closed_trades) {
            total_pnl += trade.pnl;
        }
        r.avg_trade_pnl = total_pnl / static_cast<double>(closed_trades.size());
    }

    r.trading_days = static_cast<int>(equity_curve.size());
    if (!equity_curve.empty()) {
        r.start_time = equity_curve.front().timestamp;
        r.end_time = equity_curve.back().timestamp;
    }
    r.equity_curve = equity_curve;
    r.closed_trades = closed_trades;
    return r;
}

PerformanceWindowReport PerformanceAnalyzer::windowReport(const std::string& timeframe,
                                                          const std::vector<ClosedTrade>& closed_trades) {
    PerformanceWindowReport r;
    r.timeframe = timeframe;
    r.total_trades = static_cast<int>(closed_trades.size());
    if (closed_trades.empty()) {
        return r;
    }

    double win_sum = 0.0;
    double loss_sum = 0.0;
    int wins = 0;
    int losses = 0;
    for (const auto& trade : closed_trades) {
        r.total_pnl += trade.pnl;
        if (trade.pnl > 0.0) {
            ++wins;
            win_sum += trade.pnl;
        } else if (trade.pnl < 0.0) {
            ++losses;
            loss_sum += trade.pnl;
        }

        if (trade.strategy_name.empty()) {
            continue;
        }
        auto& stats = r.strategy_performance[trade.strategy_name];
        stats.trades++;
        stats.total_pnl += trade.pnl;
        if (trade.pnl > 0.0) {
            stats.wins++;
        } else if (trade.pnl < 0.0) {
            stats.losses++;
        }
    }

    r.win_rate = static_cast<double>(wins) / static_cast<double>(closed_trades.size());
    r.avg_win = (wins > 0) ? (win_sum / wins) : 0.0;
    r.avg_loss = (losses > 0) ? (loss_sum / losses) : 0.0;
    r.profit_factor = profitFactor(closed_trades);
    r.calibration = CalibrationAnalyzer::calibration(closed_trades);
    return r;
}

std::vector<ClosedTrade> PerformanceAnalyzer::closedWithin(const std::vector<ClosedTrade>& closed_trades,
                                                           TimestampMs now,
                                                           int days) {
    const TimestampMs cutoff = now - static_cast<TimestampMs>(days) * utils::MS_PER_DAY;
    std::vector<ClosedTrade> out;
    for (const auto& trade : closed_trades) {
        if (trade.exit_time > cutoff && trade.exit_time <= now) {
            out.push_back(trade);
        }
    }
    return out;
}

double PerformanceAnalyzer::dailyPnlPct(const std::vector<EquityPoint>& equity_curve, TimestampMs day_start) {
    const EquityPoint* baseline = nullptr;
    const EquityPoint* latest = nullptr;
    for (const auto& point : equity_curve) {
        if (point.timestamp < day_start) {
            baseline = &point;
            continue;
        }
        if (!baseline) {
            baseline = &point;
        }
        latest = &point;
    }
    if (!baseline || !latest || baseline->equity <= 0.0) {
        return 0.0;
    }
    return (latest->equity - baseline->equity) / baseline->equity * 100.0;
}

} // namespace engine
} // namespace adaptiverisk
