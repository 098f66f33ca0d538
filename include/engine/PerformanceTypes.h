#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace adaptiverisk {
namespace engine {

struct StrategyPerformanceStats {
    int trades = 0;
    int wins = 0;
    int losses = 0;
    double total_pnl = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double avgPnl() const {
        return (trades > 0) ? (total_pnl / static_cast<double>(trades)) : 0.0;
    }
};

struct ConfidenceBucketStats {
    int count = 0;
    double win_rate = 0.0;
    double avg_pnl = 0.0;
};

// high >= 0.8, medium [0.6, 0.8), low (0, 0.6). Unscored trades are left out.
struct CalibrationReport {
    ConfidenceBucketStats high;
    ConfidenceBucketStats medium;
    ConfidenceBucketStats low;
    bool is_well_calibrated = false;
};

// Which suggestion rule fired; applying re-runs the same rule.
enum class ThresholdAdjustment { HOLD, LOWER, RAISE };

inline const char* thresholdAdjustmentToString(ThresholdAdjustment adjustment) {
    switch (adjustment) {
        case ThresholdAdjustment::HOLD: return "hold";
        case ThresholdAdjustment::LOWER: return "lower";
        case ThresholdAdjustment::RAISE: return "raise";
    }
    return "hold";
}

struct ThresholdSuggestion {
    ThresholdAdjustment adjustment = ThresholdAdjustment::HOLD;
    double current_threshold = 0.0;
    double suggested_threshold = 0.0;
    std::string reason;
    double confidence = 0.0;
    bool should_change = false;
};

struct PerformanceWindowReport {
    std::string timeframe;
    int total_trades = 0;
    double total_pnl = 0.0;
    double win_rate = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;          // mean of losing pnl, negative or 0
    double profit_factor = 0.0;     // may be +inf
    CalibrationReport calibration;
    std::map<std::string, StrategyPerformanceStats> strategy_performance;
};

struct BacktestReport {
    double initial_capital = 0.0;
    double final_value = 0.0;
    double total_return = 0.0;
    double total_return_pct = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;      // percent, <= 0
    double win_rate = 0.0;
    double profit_factor = 0.0;     // may be +inf
    int total_trades = 0;           // closed round trips
    double avg_trade_pnl = 0.0;
    int trading_days = 0;           // equity points
    std::optional<TimestampMs> start_time;
    std::optional<TimestampMs> end_time;
    std::vector<EquityPoint> equity_curve;
    std::vector<SimulatedTrade> trade_history;
    std::vector<ClosedTrade> closed_trades;
};

} // namespace engine
} // namespace adaptiverisk
