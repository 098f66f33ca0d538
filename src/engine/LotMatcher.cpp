#include "engine/LotMatcher.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace adaptiverisk {
namespace engine {

std::vector<ClosedTrade> LotMatcher::closeTrades(const std::vector<SimulatedTrade>& trades) {
    return replay(trades).closed_trades;
}

LotReplay LotMatcher::replay(const std::vector<SimulatedTrade>& trades) {
    LotReplay result;

    for (const auto& trade : trades) {
        if (trade.quantity <= 0.0) {
            continue;
        }

        if (trade.side == OrderSide::BUY) {
            Lot lot;
            lot.symbol = trade.symbol;
            lot.entry_price = trade.price;
            lot.quantity = trade.quantity;
            lot.entry_time = trade.timestamp;
            lot.entry_trade_id = trade.trade_id;
            lot.confidence = trade.confidence;
            lot.strategy_name = trade.strategy_name;
            result.open_lots[trade.symbol].push_back(lot);
            continue;
        }

        auto queue_it = result.open_lots.find(trade.symbol);
        if (queue_it == result.open_lots.end() || queue_it->second.empty()) {
            // No short tracking: a sell with nothing open is dropped.
            ++result.unmatched_sells;
            LOG_WARN("Sell {} of {} has no open lot; ignored", trade.trade_id, trade.symbol);
            continue;
        }

        auto& queue = queue_it->second;
        Quantity remaining = trade.quantity;
        while (remaining > QUANTITY_EPSILON && !queue.empty()) {
            Lot& lot = queue.front();
            const Quantity matched = std::min(remaining, lot.quantity);

            ClosedTrade closed;
            closed.symbol = trade.symbol;
            closed.quantity = matched;
            closed.entry_price = lot.entry_price;
            closed.exit_price = trade.price;
            closed.pnl = (trade.price - lot.entry_price) * matched;
            closed.pnl_pct = (lot.entry_price > 0.0)
                ? (trade.price - lot.entry_price) / lot.entry_price * 100.0
                : 0.0;
            closed.entry_time = lot.entry_time;
            closed.exit_time = trade.timestamp;
            closed.confidence = lot.confidence;
            closed.strategy_name = lot.strategy_name;
            result.closed_trades.push_back(closed);

            lot.quantity -= matched;
            remaining -= matched;
            if (std::fabs(lot.quantity) <= QUANTITY_EPSILON) {
                queue.pop_front();
            }
        }

        if (remaining > QUANTITY_EPSILON) {
            LOG_WARN("Sell {} of {} exceeds open lots by {:.4f}; excess ignored",
                     trade.trade_id, trade.symbol, remaining);
        }
        if (queue.empty()) {
            result.open_lots.erase(queue_it);
        }
    }

    return result;
}

} // namespace engine
} // namespace adaptiverisk
