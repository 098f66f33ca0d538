#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace adaptiverisk {

// Milliseconds since the Unix epoch (UTC).
using TimestampMs = long long;
using Price = double;
using Quantity = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT };
enum class PriceField { OPEN, HIGH, LOW, CLOSE };

// Quantities at or below this magnitude are treated as flat.
constexpr double QUANTITY_EPSILON = 1e-9;

struct PriceBar {
    std::string symbol;
    TimestampMs timestamp;
    Price open;
    Price high;
    Price low;
    Price close;
    long long volume;

    PriceBar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    PriceBar(std::string s, TimestampMs t, Price o, Price h, Price l, Price c, long long v)
        : symbol(std::move(s)), timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}

    Price field(PriceField f) const {
        switch (f) {
            case PriceField::OPEN: return open;
            case PriceField::HIGH: return high;
            case PriceField::LOW: return low;
            case PriceField::CLOSE: return close;
        }
        return close;
    }
};

// Immutable record of one executed simulated fill.
struct SimulatedTrade {
    std::string trade_id;
    TimestampMs timestamp = 0;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Quantity quantity = 0.0;
    Price price = 0.0;          // fill price after slippage
    Amount gross_value = 0.0;   // price * quantity, before commission
    Amount value = 0.0;         // cash debited (buy) or credited (sell), commission included
    Amount commission = 0.0;
    double confidence = 0.0;
    std::string strategy_name;
    std::string reasoning;
    Amount cash_after = 0.0;
};

struct Lot {
    std::string symbol;
    Price entry_price = 0.0;
    Quantity quantity = 0.0;    // remaining
    TimestampMs entry_time = 0;
    std::string entry_trade_id;
    double confidence = 0.0;
    std::string strategy_name;
};

struct ClosedTrade {
    std::string symbol;
    Quantity quantity = 0.0;
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    Amount pnl = 0.0;
    double pnl_pct = 0.0;       // percent
    TimestampMs entry_time = 0;
    TimestampMs exit_time = 0;
    double confidence = 0.0;    // confidence the lot was opened with
    std::string strategy_name;
};

struct EquityPoint {
    TimestampMs timestamp = 0;
    Amount equity = 0.0;
    Amount cash = 0.0;
    Amount positions_value = 0.0;
};

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "buy" : "sell";
}

inline bool orderSideFromString(const std::string& value, OrderSide& out) {
    if (value == "buy" || value == "BUY") {
        out = OrderSide::BUY;
        return true;
    }
    if (value == "sell" || value == "SELL") {
        out = OrderSide::SELL;
        return true;
    }
    return false;
}

inline const char* orderTypeToString(OrderType type) {
    return (type == OrderType::MARKET) ? "market" : "limit";
}

} // namespace adaptiverisk
