#include "core/adapters/SimulatedBrokerAdapter.h"

#include "common/Logger.h"

namespace adaptiverisk {
namespace core {

SimulatedBrokerAdapter::SimulatedBrokerAdapter(backtest::TradeSimulator& simulator)
    : simulator_(simulator) {}

BrokerFill SimulatedBrokerAdapter::submit(const OrderIntent& intent) {
    BrokerFill fill;
    if (intent.order_type != OrderType::MARKET) {
        fill.reason = std::string("order type not simulated: ") + orderTypeToString(intent.order_type);
        LOG_WARN("Paper broker refused {} {}: {}", orderSideToString(intent.side), intent.symbol, fill.reason);
        return fill;
    }

    TradeRequest request;
    request.symbol = intent.symbol;
    request.side = intent.side;
    request.quantity = intent.quantity;
    request.timestamp = intent.timestamp;
    request.confidence = intent.confidence;
    request.strategy_name = intent.strategy_name;
    request.reasoning = intent.reasoning;

    const auto result = simulator_.execute(request);
    if (!result.ok || !result.trade) {
        fill.reason = std::string(rejectReasonToString(result.reason)) + ": " + result.message;
        return fill;
    }

    fill.status = BrokerStatus::FILLED;
    fill.order_id = result.trade->trade_id;
    fill.fill_price = result.trade->price;
    fill.filled_quantity = result.trade->quantity;
    return fill;
}

} // namespace core
} // namespace adaptiverisk
