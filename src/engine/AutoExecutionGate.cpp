#include "engine/AutoExecutionGate.h"

#include <limits>
#include <sstream>
#include <iomanip>

#include "common/Logger.h"

namespace adaptiverisk {
namespace engine {

namespace {
std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (fraction * 100.0) << "%";
    return oss.str();
}
}

AutoExecutionGate::AutoExecutionGate(const RiskParameterStore& store)
    : store_(store) {}

GateDecision AutoExecutionGate::decide(double confidence, const RecentPerformance& recent) const {
    GateDecision decision;

    // Risk limits are checked before confidence.
    const double loss_limit = store_.get(params::DAILY_LOSS_LIMIT_PCT);
    const double breaker = -CIRCUIT_BREAKER_FRACTION * loss_limit;
    if (recent.daily_pnl_pct < breaker) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "Daily loss circuit breaker (" << recent.daily_pnl_pct << "% < " << breaker << "%)";
        decision.outcome = GateOutcome::DENY;
        decision.effective_threshold = store_.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
        decision.reason = oss.str();
        LOG_WARN("Gate DENY: {}", decision.reason);
        return decision;
    }

    double threshold = store_.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
    if (recent.win_rate.has_value() && *recent.win_rate < LOW_WIN_RATE) {
        threshold += LOW_WIN_RATE_PENALTY;
    }
    decision.effective_threshold = threshold;

    if (confidence >= threshold) {
        decision.outcome = GateOutcome::ALLOW;
        decision.reason = "Confidence " + percent(confidence) + " meets threshold " + percent(threshold);
        return decision;
    }

    decision.outcome = GateOutcome::REQUIRE_APPROVAL;
    decision.confidence_gap = threshold - confidence;
    decision.reason = "Confidence " + percent(confidence) + " below threshold " + percent(threshold);
    LOG_INFO("Gate REQUIRE_APPROVAL: {} (gap {:.4f})", decision.reason, decision.confidence_gap);
    return decision;
}

RiskRewardAssessment AutoExecutionGate::evaluateRiskReward(double entry_price,
                                                           double target_price,
                                                           double stop_loss) const {
    RiskRewardAssessment r;
    r.potential_gain = target_price - entry_price;
    r.potential_loss = entry_price - stop_loss;
    r.risk_reward_ratio = (r.potential_loss <= 0.0)
        ? std::numeric_limits<double>::infinity()
        : r.potential_gain / r.potential_loss;
    r.min_required = store_.get(params::MIN_RISK_REWARD_RATIO);
    r.is_acceptable = r.risk_reward_ratio >= r.min_required;
    return r;
}

} // namespace engine
} // namespace adaptiverisk
