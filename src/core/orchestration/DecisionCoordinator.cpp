#include "core/orchestration/DecisionCoordinator.h"

#include "common/Logger.h"

namespace adaptiverisk {
namespace core {

DecisionCoordinator::DecisionCoordinator(
    std::shared_ptr<engine::PositionSizer> sizer,
    std::shared_ptr<engine::AutoExecutionGate> gate,
    std::shared_ptr<IExecutionBroker> broker
)
    : sizer_(std::move(sizer))
    , gate_(std::move(gate))
    , broker_(std::move(broker)) {}

TradeDecision DecisionCoordinator::evaluate(const DecisionRequest& request) {
    TradeDecision decision;

    if (!sizer_ || !gate_) {
        decision.status = DecisionStatus::FAILED;
        decision.reason = "risk_components_unset";
        return decision;
    }

    if (request.side == OrderSide::BUY) {
        decision.quantity = static_cast<Quantity>(sizer_->size(
            request.symbol,
            request.confidence,
            request.account_value,
            request.reference_price,
            request.current_exposure_fraction
        ));
    } else {
        decision.quantity = request.requested_quantity;
    }

    if (decision.quantity <= 0.0) {
        decision.status = DecisionStatus::SKIPPED;
        decision.reason = "position size is zero";
        LOG_INFO("{} {} skipped: {}", orderSideToString(request.side), request.symbol, decision.reason);
        return decision;
    }

    const auto gate_decision = gate_->decide(request.confidence, request.recent);
    decision.gate = gate_decision;
    decision.reason = gate_decision.reason;

    if (gate_decision.outcome == engine::GateOutcome::DENY) {
        decision.status = DecisionStatus::BLOCKED;
        return decision;
    }
    if (gate_decision.outcome == engine::GateOutcome::REQUIRE_APPROVAL) {
        decision.status = DecisionStatus::PENDING_APPROVAL;
        return decision;
    }

    if (!broker_) {
        decision.status = DecisionStatus::FAILED;
        decision.reason = "broker_unset";
        return decision;
    }

    OrderIntent intent;
    intent.symbol = request.symbol;
    intent.side = request.side;
    intent.quantity = decision.quantity;
    intent.order_type = OrderType::MARKET;
    intent.timestamp = request.timestamp;
    intent.confidence = request.confidence;
    intent.strategy_name = request.strategy_name;
    intent.reasoning = request.reasoning;

    const BrokerFill fill = broker_->submit(intent);
    decision.fill = fill;
    if (fill.status == BrokerStatus::FILLED) {
        decision.status = DecisionStatus::EXECUTED;
        LOG_INFO("{} {} x{:.4f} executed @ {:.4f} ({})", orderSideToString(request.side), request.symbol,
                 fill.filled_quantity, fill.fill_price, fill.order_id);
    } else {
        decision.status = DecisionStatus::FAILED;
        decision.reason = fill.reason;
        LOG_WARN("{} {} broker rejected: {}", orderSideToString(request.side), request.symbol, fill.reason);
    }
    return decision;
}

} // namespace core
} // namespace adaptiverisk
