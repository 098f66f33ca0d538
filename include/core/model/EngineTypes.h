#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace adaptiverisk {
namespace core {

enum class RejectReason {
    NONE,
    DATA_UNAVAILABLE,
    INSUFFICIENT_FUNDS,
    INSUFFICIENT_SHARES,
    INVALID_REQUEST
};

inline const char* rejectReasonToString(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::DATA_UNAVAILABLE: return "DATA_UNAVAILABLE";
        case RejectReason::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case RejectReason::INSUFFICIENT_SHARES: return "INSUFFICIENT_SHARES";
        case RejectReason::INVALID_REQUEST: return "INVALID_REQUEST";
    }
    return "UNKNOWN";
}

struct TradeRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Quantity quantity = 0.0;
    TimestampMs timestamp = 0;
    double confidence = 0.0;
    std::string strategy_name;
    std::string reasoning;
};

// Either a fill or a typed rejection. Rejections are values so a driving
// loop can log and move on to the next step.
struct ExecutionResult {
    bool ok = false;
    RejectReason reason = RejectReason::NONE;
    std::string message;
    std::optional<SimulatedTrade> trade;

    static ExecutionResult filled(SimulatedTrade t) {
        ExecutionResult result;
        result.ok = true;
        result.trade = std::move(t);
        return result;
    }

    static ExecutionResult rejected(RejectReason r, std::string msg) {
        ExecutionResult result;
        result.reason = r;
        result.message = std::move(msg);
        return result;
    }
};

struct OrderIntent {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Quantity quantity = 0.0;
    OrderType order_type = OrderType::MARKET;
    TimestampMs timestamp = 0;
    double confidence = 0.0;
    std::string strategy_name;
    std::string reasoning;
};

enum class BrokerStatus { FILLED, REJECTED };

inline const char* brokerStatusToString(BrokerStatus status) {
    return (status == BrokerStatus::FILLED) ? "FILLED" : "REJECTED";
}

struct BrokerFill {
    BrokerStatus status = BrokerStatus::REJECTED;
    std::string order_id;
    Price fill_price = 0.0;
    Quantity filled_quantity = 0.0;
    std::string reason;
};

enum class ParameterUpdateStatus {
    APPLIED,
    INVALID_PARAMETER_VALUE,
    UNKNOWN_PARAMETER
};

inline const char* parameterUpdateStatusToString(ParameterUpdateStatus status) {
    switch (status) {
        case ParameterUpdateStatus::APPLIED: return "APPLIED";
        case ParameterUpdateStatus::INVALID_PARAMETER_VALUE: return "INVALID_PARAMETER_VALUE";
        case ParameterUpdateStatus::UNKNOWN_PARAMETER: return "UNKNOWN_PARAMETER";
    }
    return "UNKNOWN";
}

struct ParameterUpdateResult {
    ParameterUpdateStatus status = ParameterUpdateStatus::APPLIED;
    double old_value = 0.0;
    double new_value = 0.0;
    bool persisted = false;     // false when no repository is attached or the write failed
    std::string message;

    bool ok() const { return status == ParameterUpdateStatus::APPLIED; }
};

struct RiskParameter {
    std::string name;
    double value = 0.0;
    std::optional<double> previous_value;
    std::string change_reason;
    TimestampMs updated_at = 0;
};

struct ParameterChange {
    std::string name;
    std::optional<double> old_value;
    double new_value = 0.0;
    std::string reason;
    TimestampMs changed_at = 0;
};

} // namespace core
} // namespace adaptiverisk
