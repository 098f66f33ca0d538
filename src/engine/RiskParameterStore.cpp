#include "engine/RiskParameterStore.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace adaptiverisk {
namespace engine {

namespace {
const char* kInitialReason = "Initial system setup";

double* defaultSlot(RiskDefaults& d, const std::string& name) {
    if (name == params::AUTO_TRADE_CONFIDENCE_THRESHOLD) return &d.auto_trade_confidence_threshold;
    if (name == params::MAX_POSITION_SIZE_PCT) return &d.max_position_size_pct;
    if (name == params::MAX_PORTFOLIO_EXPOSURE_PCT) return &d.max_portfolio_exposure_pct;
    if (name == params::DAILY_LOSS_LIMIT_PCT) return &d.daily_loss_limit_pct;
    if (name == params::MIN_RISK_REWARD_RATIO) return &d.min_risk_reward_ratio;
    return &d.learning_aggression;
}

bool isUnitInterval(const std::string& name) {
    return name == params::AUTO_TRADE_CONFIDENCE_THRESHOLD || name == params::LEARNING_AGGRESSION;
}
}

RiskParameterStore::RiskParameterStore(const RiskDefaults& defaults,
                                       std::shared_ptr<core::IParameterRepository> repository)
    : defaults_(defaults)
    , repository_(std::move(repository)) {
    for (const auto& name : knownNames()) {
        double* slot = defaultSlot(defaults_, name);
        const std::string why = validate(name, *slot);
        if (!why.empty()) {
            RiskDefaults builtin;
            LOG_WARN("Configured default for {} is invalid ({}); using built-in default", name, why);
            *slot = *defaultSlot(builtin, name);
        }
    }
    seedFromRepository();
}

const std::vector<std::string>& RiskParameterStore::knownNames() {
    static const std::vector<std::string> names{
        params::AUTO_TRADE_CONFIDENCE_THRESHOLD,
        params::MAX_POSITION_SIZE_PCT,
        params::MAX_PORTFOLIO_EXPOSURE_PCT,
        params::DAILY_LOSS_LIMIT_PCT,
        params::MIN_RISK_REWARD_RATIO,
        params::LEARNING_AGGRESSION
    };
    return names;
}

bool RiskParameterStore::isKnown(const std::string& name) {
    const auto& names = knownNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string RiskParameterStore::validate(const std::string& name, double value) {
    if (!std::isfinite(value)) {
        return "value must be finite";
    }
    if (isUnitInterval(name)) {
        if (value < 0.0 || value > 1.0) {
            return "value must be within [0, 1]";
        }
        return {};
    }
    if (value < 0.0) {
        return "value must not be negative";
    }
    return {};
}

double RiskParameterStore::defaultFor(const std::string& name) const {
    if (!isKnown(name)) {
        return 0.0;
    }
    RiskDefaults copy = defaults_;
    return *defaultSlot(copy, name);
}

void RiskParameterStore::seedFromRepository() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, core::RiskParameter> persisted;
    if (repository_) {
        persisted = repository_->loadRecords();
    }

    for (const auto& [name, record] : persisted) {
        if (!isKnown(name)) {
            LOG_WARN("Ignoring unknown persisted parameter: {}", name);
            continue;
        }
        const std::string why = validate(name, record.value);
        if (!why.empty()) {
            LOG_WARN("Persisted {}={} is invalid ({}); default kept", name, record.value, why);
            continue;
        }
        records_[name] = record;
        history_[name].push_back({name, record.previous_value, record.value, record.change_reason, record.updated_at});
    }

    for (const auto& name : knownNames()) {
        if (records_.count(name) > 0) {
            continue;
        }
        core::RiskParameter record;
        record.name = name;
        record.value = defaultFor(name);
        record.change_reason = kInitialReason;
        record.updated_at = utils::nowMs();
        records_[name] = record;
        history_[name].push_back({name, std::nullopt, record.value, record.change_reason, record.updated_at});

        if (repository_ && !repository_->updateParameter(name, record.value, kInitialReason)) {
            LOG_ERROR("Failed to persist initial value for {}", name);
        }
    }
}

double RiskParameterStore::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it != records_.end()) {
        return it->second.value;
    }
    LOG_WARN("Unknown risk parameter requested: {}", name);
    return 0.0;
}

core::ParameterUpdateResult RiskParameterStore::set(const std::string& name, double value, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    return applyLocked(name, value, reason);
}

core::ParameterUpdateResult RiskParameterStore::update(const std::string& name,
                                                       const std::function<double(double)>& fn,
                                                       const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        core::ParameterUpdateResult result;
        result.status = core::ParameterUpdateStatus::UNKNOWN_PARAMETER;
        result.message = "unknown parameter: " + name;
        LOG_WARN("Update refused: {}", result.message);
        return result;
    }
    return applyLocked(name, fn(it->second.value), reason);
}

core::ParameterUpdateResult RiskParameterStore::applyLocked(const std::string& name,
                                                            double value,
                                                            const std::string& reason) {
    core::ParameterUpdateResult result;
    result.new_value = value;

    auto it = records_.find(name);
    if (it == records_.end()) {
        result.status = core::ParameterUpdateStatus::UNKNOWN_PARAMETER;
        result.message = "unknown parameter: " + name;
        LOG_WARN("Update refused: {}", result.message);
        return result;
    }

    result.old_value = it->second.value;
    const std::string why = validate(name, value);
    if (!why.empty()) {
        result.status = core::ParameterUpdateStatus::INVALID_PARAMETER_VALUE;
        result.new_value = it->second.value;
        result.message = why;
        LOG_WARN("Rejected {}={}: {}", name, value, why);
        return result;
    }

    core::RiskParameter& record = it->second;
    record.previous_value = record.value;
    record.value = value;
    record.change_reason = reason;
    record.updated_at = utils::nowMs();
    history_[name].push_back({name, record.previous_value, value, reason, record.updated_at});

    result.status = core::ParameterUpdateStatus::APPLIED;
    if (repository_) {
        result.persisted = repository_->updateParameter(name, value, reason);
        if (!result.persisted) {
            LOG_ERROR("Parameter {} changed in memory but could not be persisted", name);
        }
    }

    LOG_INFO("Parameter {}: {} -> {} ({})", name, result.old_value, value, reason);
    return result;
}

std::map<std::string, double> RiskParameterStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, double> values;
    for (const auto& [name, record] : records_) {
        values[name] = record.value;
    }
    return values;
}

std::optional<core::RiskParameter> RiskParameterStore::record(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::ParameterChange> RiskParameterStore::history(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(name);
    if (it == history_.end()) {
        return {};
    }
    return it->second;
}

} // namespace engine
} // namespace adaptiverisk
