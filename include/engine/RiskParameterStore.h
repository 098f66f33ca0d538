#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/contracts/IParameterRepository.h"
#include "core/model/EngineTypes.h"
#include "engine/EngineConfig.h"

namespace adaptiverisk {
namespace engine {

namespace params {
constexpr const char* AUTO_TRADE_CONFIDENCE_THRESHOLD = "auto_trade_confidence_threshold";
constexpr const char* MAX_POSITION_SIZE_PCT = "max_position_size_pct";
constexpr const char* MAX_PORTFOLIO_EXPOSURE_PCT = "max_portfolio_exposure_pct";
constexpr const char* DAILY_LOSS_LIMIT_PCT = "daily_loss_limit_pct";
constexpr const char* MIN_RISK_REWARD_RATIO = "min_risk_reward_ratio";
constexpr const char* LEARNING_AGGRESSION = "learning_aggression";
}

// Named risk parameters with an audit trail. Values only move forward;
// nothing is ever deleted. With a repository attached, persisted values
// win over defaults and every change is written through.
class RiskParameterStore {
public:
    explicit RiskParameterStore(const RiskDefaults& defaults = RiskDefaults(),
                                std::shared_ptr<core::IParameterRepository> repository = nullptr);

    // Unknown names resolve to 0.0 and log a warning.
    double get(const std::string& name) const;

    core::ParameterUpdateResult set(const std::string& name, double value, const std::string& reason);

    // Read-modify-write under one lock. fn must not call back into the store.
    core::ParameterUpdateResult update(const std::string& name,
                                       const std::function<double(double)>& fn,
                                       const std::string& reason);

    std::map<std::string, double> all() const;
    std::optional<core::RiskParameter> record(const std::string& name) const;
    std::vector<core::ParameterChange> history(const std::string& name) const;

    static const std::vector<std::string>& knownNames();
    static bool isKnown(const std::string& name);

    // Empty string when valid, otherwise why the value is refused.
    static std::string validate(const std::string& name, double value);

private:
    double defaultFor(const std::string& name) const;
    core::ParameterUpdateResult applyLocked(const std::string& name, double value, const std::string& reason);
    void seedFromRepository();

    RiskDefaults defaults_;
    std::shared_ptr<core::IParameterRepository> repository_;
    std::map<std::string, core::RiskParameter> records_;
    std::map<std::string, std::vector<core::ParameterChange>> history_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace adaptiverisk
