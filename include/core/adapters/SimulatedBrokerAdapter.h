#pragma once

#include "backtest/TradeSimulator.h"
#include "core/contracts/IExecutionBroker.h"

namespace adaptiverisk {
namespace core {

// Paper-trading broker: market intents are filled by a TradeSimulator
// at as-of prices. Limit intents are refused.
class SimulatedBrokerAdapter : public IExecutionBroker {
public:
    explicit SimulatedBrokerAdapter(backtest::TradeSimulator& simulator);

    BrokerFill submit(const OrderIntent& intent) override;

private:
    backtest::TradeSimulator& simulator_;
};

} // namespace core
} // namespace adaptiverisk
