#pragma once

#include <optional>
#include <string>

#include "engine/RiskParameterStore.h"

namespace adaptiverisk {
namespace engine {

enum class GateOutcome {
    ALLOW,              // auto-execute
    DENY,               // hard block
    REQUIRE_APPROVAL    // soft block pending manual action
};

inline const char* gateOutcomeToString(GateOutcome outcome) {
    switch (outcome) {
        case GateOutcome::ALLOW: return "ALLOW";
        case GateOutcome::DENY: return "DENY";
        case GateOutcome::REQUIRE_APPROVAL: return "REQUIRE_APPROVAL";
    }
    return "UNKNOWN";
}

struct RecentPerformance {
    std::optional<double> win_rate;     // unset when there is no recent history
    double daily_pnl_pct = 0.0;
};

struct GateDecision {
    GateOutcome outcome = GateOutcome::DENY;
    double effective_threshold = 0.0;
    double confidence_gap = 0.0;        // threshold - confidence when approval is required
    std::string reason;
};

struct RiskRewardAssessment {
    double risk_reward_ratio = 0.0;     // +inf when the stop is at or above entry
    double potential_gain = 0.0;
    double potential_loss = 0.0;
    double min_required = 0.0;
    bool is_acceptable = false;
};

class AutoExecutionGate {
public:
    static constexpr double CIRCUIT_BREAKER_FRACTION = 0.8;
    static constexpr double LOW_WIN_RATE = 0.4;
    static constexpr double LOW_WIN_RATE_PENALTY = 0.05;

    explicit AutoExecutionGate(const RiskParameterStore& store);

    GateDecision decide(double confidence, const RecentPerformance& recent) const;

    RiskRewardAssessment evaluateRiskReward(double entry_price, double target_price, double stop_loss) const;

private:
    const RiskParameterStore& store_;
};

} // namespace engine
} // namespace adaptiverisk
