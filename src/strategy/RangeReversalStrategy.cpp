#include "strategy/RangeReversalStrategy.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace adaptiverisk {
namespace strategy {

RangeReversalStrategy::RangeReversalStrategy(size_t lookback, double cash_fraction, double confidence)
    : lookback_(lookback)
    , cash_fraction_(cash_fraction)
    , confidence_(confidence) {}

StrategyInfo RangeReversalStrategy::getInfo() const {
    StrategyInfo info;
    info.name = NAME;
    info.description = "Buy on " + std::to_string(lookback_) + "-bar lows, sell on " +
                       std::to_string(lookback_) + "-bar highs";
    info.timeframe = "1day";
    return info;
}

void RangeReversalStrategy::onStep(StrategyContext& context) {
    for (const auto& symbol : context.symbols) {
        // Only act on symbols that printed a bar at this exact step.
        const auto bars = context.prices.history(symbol, context.timestamp, lookback_);
        if (bars.empty() || bars.back().timestamp != context.timestamp) {
            continue;
        }

        const double close = bars.back().close;
        double range_low = bars.front().low;
        double range_high = bars.front().high;
        for (const auto& bar : bars) {
            range_low = std::min(range_low, bar.low);
            range_high = std::max(range_high, bar.high);
        }

        const Quantity held = context.simulator.ledger().quantity(symbol);
        const bool has_position = held > QUANTITY_EPSILON;

        core::TradeRequest request;
        request.symbol = symbol;
        request.timestamp = context.timestamp;
        request.confidence = confidence_;
        request.strategy_name = NAME;

        if (!has_position && close <= range_low) {
            if (!(close > 0.0)) {
                continue;
            }
            const double shares = std::floor(context.simulator.ledger().cash() * cash_fraction_ / close);
            if (shares <= 0.0) {
                continue;
            }
            request.side = OrderSide::BUY;
            request.quantity = shares;
            request.reasoning = "Price at " + std::to_string(lookback_) + "-day low";
            const auto result = context.simulator.execute(request);
            if (!result.ok) {
                LOG_DEBUG("{} buy skipped: {}", symbol, core::rejectReasonToString(result.reason));
            }
        } else if (has_position && close >= range_high) {
            request.side = OrderSide::SELL;
            request.quantity = held;
            request.reasoning = "Price at " + std::to_string(lookback_) + "-day high";
            const auto result = context.simulator.execute(request);
            if (!result.ok) {
                LOG_DEBUG("{} sell skipped: {}", symbol, core::rejectReasonToString(result.reason));
            }
        }
    }
}

} // namespace strategy
} // namespace adaptiverisk
