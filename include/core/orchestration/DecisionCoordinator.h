#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/contracts/IExecutionBroker.h"
#include "core/model/EngineTypes.h"
#include "engine/AutoExecutionGate.h"
#include "engine/PositionSizer.h"

namespace adaptiverisk {
namespace core {

struct DecisionRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Quantity requested_quantity = 0.0;  // sells only; buys are sized
    Price reference_price = 0.0;
    TimestampMs timestamp = 0;
    double confidence = 0.0;
    std::string strategy_name;
    std::string reasoning;
    Amount account_value = 0.0;
    double current_exposure_fraction = 0.0;
    engine::RecentPerformance recent;
};

enum class DecisionStatus {
    EXECUTED,
    PENDING_APPROVAL,
    BLOCKED,
    SKIPPED,
    FAILED
};

inline const char* decisionStatusToString(DecisionStatus status) {
    switch (status) {
        case DecisionStatus::EXECUTED: return "EXECUTED";
        case DecisionStatus::PENDING_APPROVAL: return "PENDING_APPROVAL";
        case DecisionStatus::BLOCKED: return "BLOCKED";
        case DecisionStatus::SKIPPED: return "SKIPPED";
        case DecisionStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

struct TradeDecision {
    DecisionStatus status = DecisionStatus::SKIPPED;
    Quantity quantity = 0.0;
    std::optional<engine::GateDecision> gate;
    std::optional<BrokerFill> fill;
    std::string reason;
};

// One live decision cycle: size, gate, then hand allowed intents to the broker.
class DecisionCoordinator {
public:
    DecisionCoordinator(
        std::shared_ptr<engine::PositionSizer> sizer,
        std::shared_ptr<engine::AutoExecutionGate> gate,
        std::shared_ptr<IExecutionBroker> broker
    );

    TradeDecision evaluate(const DecisionRequest& request);

private:
    std::shared_ptr<engine::PositionSizer> sizer_;
    std::shared_ptr<engine::AutoExecutionGate> gate_;
    std::shared_ptr<IExecutionBroker> broker_;
};

} // namespace core
} // namespace adaptiverisk
