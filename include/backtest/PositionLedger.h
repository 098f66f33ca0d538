#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "common/Types.h"
#include "core/model/EngineTypes.h"

namespace adaptiverisk {
namespace backtest {

class TradeSimulator;

// Cash balance and per-symbol share counts. Reads are public; every
// mutation goes through TradeSimulator.
class PositionLedger {
public:
    using PriceLookup = std::function<std::optional<Price>(const std::string&)>;

    explicit PositionLedger(Amount initial_cash);

    Amount cash() const;
    Quantity quantity(const std::string& symbol) const;
    std::map<std::string, Quantity> holdings() const;

    // Cash plus quantity * price for each held symbol. Symbols without a
    // price are skipped rather than failing the valuation. The lookup is
    // called after the ledger lock is released.
    Amount portfolioValue(const PriceLookup& price_lookup) const;
    Amount positionsValue(const PriceLookup& price_lookup) const;

private:
    friend class TradeSimulator;

    // Funds check and mutation happen under one lock.
    core::RejectReason debitForBuy(const std::string& symbol, Quantity quantity, Amount cost);
    core::RejectReason creditForSell(const std::string& symbol, Quantity quantity, Amount proceeds);

    static Amount valuePositions(const std::map<std::string, Quantity>& positions,
                                 const PriceLookup& price_lookup);

    Amount cash_;
    std::map<std::string, Quantity> positions_;
    mutable std::mutex mutex_;
};

} // namespace backtest
} // namespace adaptiverisk
