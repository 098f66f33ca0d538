#include "backtest/PositionLedger.h"

#include <cmath>

namespace adaptiverisk {
namespace backtest {

PositionLedger::PositionLedger(Amount initial_cash)
    : cash_(initial_cash) {}

Amount PositionLedger::cash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cash_;
}

Quantity PositionLedger::quantity(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    return (it != positions_.end()) ? it->second : 0.0;
}

std::map<std::string, Quantity> PositionLedger::holdings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_;
}

Amount PositionLedger::portfolioValue(const PriceLookup& price_lookup) const {
    Amount cash = 0.0;
    std::map<std::string, Quantity> positions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cash = cash_;
        positions = positions_;
    }
    return cash + valuePositions(positions, price_lookup);
}

Amount PositionLedger::positionsValue(const PriceLookup& price_lookup) const {
    return valuePositions(holdings(), price_lookup);
}

// Runs without the ledger lock so a lookup may read the ledger itself.
Amount PositionLedger::valuePositions(const std::map<std::string, Quantity>& positions,
                                      const PriceLookup& price_lookup) {
    Amount total = 0.0;
    for (const auto& [symbol, qty] : positions) {
        const auto price = price_lookup(symbol);
        if (!price) {
            continue;
        }
        total += qty * (*price);
    }
    return total;
}

core::RejectReason PositionLedger::debitForBuy(const std::string& symbol, Quantity quantity, Amount cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cost > cash_) {
        return core::RejectReason::INSUFFICIENT_FUNDS;
    }
    cash_ -= cost;
    positions_[symbol] += quantity;
    return core::RejectReason::NONE;
}

core::RejectReason PositionLedger::creditForSell(const std::string& symbol, Quantity quantity, Amount proceeds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    const Quantity held = (it != positions_.end()) ? it->second : 0.0;
    if (it == positions_.end() || held + QUANTITY_EPSILON < quantity) {
        return core::RejectReason::INSUFFICIENT_SHARES;
    }
    // Commission larger than the proceeds must not push cash below zero
    if (cash_ + proceeds < 0.0) {
        return core::RejectReason::INSUFFICIENT_FUNDS;
    }
    cash_ += proceeds;
    it->second -= quantity;
    if (std::fabs(it->second) <= QUANTITY_EPSILON) {
        positions_.erase(it);
    }
    return core::RejectReason::NONE;
}

} // namespace backtest
} // namespace adaptiverisk
