#pragma once

#include <string>
#include <vector>

namespace adaptiverisk {
namespace engine {

// Friction and account settings for historical replay
struct SimulationConfig {
    double initial_capital = 100000.0;
    double slippage_pct = 0.1;      // percent, 0.1 => 0.1%
    double commission = 0.0;        // flat amount per trade
    int lookback_bars = 5;          // bars skipped before the strategy runs

    double slippageRate() const { return slippage_pct / 100.0; }
};

// Values the parameter store falls back to before anything is persisted
struct RiskDefaults {
    double auto_trade_confidence_threshold = 0.95;
    double max_position_size_pct = 10.0;
    double max_portfolio_exposure_pct = 80.0;
    double daily_loss_limit_pct = 2.0;
    double min_risk_reward_ratio = 2.0;
    double learning_aggression = 0.5;
};

struct CalibrationWindow {
    std::string label;
    int days = 0;
};

struct CalibrationConfig {
    std::vector<CalibrationWindow> windows{
        {"short", 7},
        {"medium", 30},
        {"long", 90}
    };
    int min_samples = 10;           // high-bucket trades needed before suggesting a move
    std::string apply_window = "medium";
};

struct StorageConfig {
    std::string parameter_file = "state/risk_parameters.json";
};

struct LoggingConfig {
    std::string level = "info";
    std::string directory = "logs";
};

} // namespace engine
} // namespace adaptiverisk
