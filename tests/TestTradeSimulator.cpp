#include "backtest/PriceSeriesCache.h"
#include "backtest/TradeSimulator.h"
#include "common/TimeUtils.h"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

using namespace adaptiverisk;

namespace {
constexpr TimestampMs DAY1 = 1704067200000LL;   // 2024-01-01
constexpr TimestampMs DAY2 = DAY1 + utils::MS_PER_DAY;
constexpr TimestampMs DAY3 = DAY2 + utils::MS_PER_DAY;

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

backtest::PriceSeriesCache makeCache() {
    backtest::PriceSeriesCache cache;
    cache.load("AAA", {
        PriceBar("AAA", DAY1, 99.0, 101.0, 98.0, 100.0, 1000),
        PriceBar("AAA", DAY2, 105.0, 111.0, 104.0, 110.0, 1200),
        PriceBar("AAA", DAY3, 115.0, 121.0, 114.0, 120.0, 900)
    });
    return cache;
}

core::TradeRequest request(OrderSide side, Quantity qty, TimestampMs ts, const std::string& symbol = "AAA") {
    core::TradeRequest r;
    r.symbol = symbol;
    r.side = side;
    r.quantity = qty;
    r.timestamp = ts;
    r.confidence = 0.7;
    r.strategy_name = "test";
    r.reasoning = "unit";
    return r;
}

engine::SimulationConfig frictionless(double capital) {
    engine::SimulationConfig cfg;
    cfg.initial_capital = capital;
    cfg.slippage_pct = 0.0;
    cfg.commission = 0.0;
    return cfg;
}

void testRoundTripRestoresCash() {
    auto cache = makeCache();
    backtest::TradeSimulator sim(cache, frictionless(10000.0));

    auto buy = sim.execute(request(OrderSide::BUY, 10, DAY1));
    assert(buy.ok);
    assert(buy.trade->trade_id == "sim-1");
    assert(sim.ledger().cash() == 9000.0);
    assert(sim.ledger().quantity("AAA") == 10.0);

    auto sell = sim.execute(request(OrderSide::SELL, 10, DAY1));
    assert(sell.ok);
    assert(sim.ledger().cash() == 10000.0);
    assert(sim.ledger().holdings().empty());
    assert(sim.trades().size() == 2);
    std::cout << "[TEST] RoundTripRestoresCash PASSED\n";
}

void testSlippageAndCommission() {
    auto cache = makeCache();
    engine::SimulationConfig cfg;
    cfg.initial_capital = 10000.0;
    cfg.slippage_pct = 0.1;
    cfg.commission = 1.0;
    backtest::TradeSimulator sim(cache, cfg);

    auto buy = sim.execute(request(OrderSide::BUY, 10, DAY1));
    assert(buy.ok);
    assert(near(buy.trade->price, 100.1));
    assert(near(buy.trade->gross_value, 1001.0));
    assert(near(buy.trade->value, 1002.0));
    assert(near(buy.trade->commission, 1.0));
    assert(near(sim.ledger().cash(), 8998.0));
    assert(near(buy.trade->cash_after, 8998.0));

    auto sell = sim.execute(request(OrderSide::SELL, 10, DAY2));
    assert(sell.ok);
    assert(near(sell.trade->price, 109.89));
    assert(near(sell.trade->gross_value, 1098.9));
    assert(near(sell.trade->value, 1097.9));
    assert(near(sim.ledger().cash(), 8998.0 + 1097.9));
    std::cout << "[TEST] SlippageAndCommission PASSED\n";
}

void testRejections() {
    auto cache = makeCache();
    backtest::TradeSimulator sim(cache, frictionless(10000.0));

    auto too_big = sim.execute(request(OrderSide::BUY, 1000, DAY1));
    assert(!too_big.ok);
    assert(too_big.reason == core::RejectReason::INSUFFICIENT_FUNDS);
    assert(!too_big.trade.has_value());
    assert(sim.ledger().cash() == 10000.0);

    auto no_shares = sim.execute(request(OrderSide::SELL, 5, DAY1));
    assert(no_shares.reason == core::RejectReason::INSUFFICIENT_SHARES);

    assert(sim.execute(request(OrderSide::BUY, 1, DAY1)).ok);
    auto over_sell = sim.execute(request(OrderSide::SELL, 2, DAY1));
    assert(over_sell.reason == core::RejectReason::INSUFFICIENT_SHARES);
    assert(sim.ledger().quantity("AAA") == 1.0);

    auto early = sim.execute(request(OrderSide::BUY, 1, DAY1 - 1));
    assert(early.reason == core::RejectReason::DATA_UNAVAILABLE);
    auto unknown = sim.execute(request(OrderSide::BUY, 1, DAY2, "ZZZ"));
    assert(unknown.reason == core::RejectReason::DATA_UNAVAILABLE);

    assert(sim.execute(request(OrderSide::BUY, 0, DAY1)).reason == core::RejectReason::INVALID_REQUEST);
    assert(sim.execute(request(OrderSide::BUY, -3, DAY1)).reason == core::RejectReason::INVALID_REQUEST);
    assert(sim.execute(request(OrderSide::BUY, 1, DAY1, "")).reason == core::RejectReason::INVALID_REQUEST);
    auto bad_conf = request(OrderSide::BUY, 1, DAY1);
    bad_conf.confidence = 1.5;
    assert(sim.execute(bad_conf).reason == core::RejectReason::INVALID_REQUEST);

    // Only the one good buy made it into the stream
    assert(sim.trades().size() == 1);
    std::cout << "[TEST] Rejections PASSED\n";
}

void testCommissionCannotOverdrawOnSell() {
    auto cache = makeCache();
    engine::SimulationConfig cfg = frictionless(100.0);
    cfg.commission = 50.0;
    backtest::TradeSimulator sim(cache, cfg);

    // 0.5 share costs 50 + 50 commission, leaving 0 cash
    assert(sim.execute(request(OrderSide::BUY, 0.5, DAY1)).ok);
    assert(near(sim.ledger().cash(), 0.0));
    // Selling 0.1 share yields 10 - 50 = -40
    auto sell = sim.execute(request(OrderSide::SELL, 0.1, DAY1));
    assert(!sell.ok);
    assert(sim.ledger().cash() >= 0.0);
    std::cout << "[TEST] CommissionCannotOverdrawOnSell PASSED\n";
}

void testAsOfPricing() {
    auto cache = makeCache();
    backtest::TradeSimulator sim(cache, frictionless(10000.0));

    // Midday of day 2 still trades at the day 2 close, never day 3
    auto buy = sim.execute(request(OrderSide::BUY, 1, DAY2 + utils::MS_PER_DAY / 2));
    assert(buy.ok);
    assert(buy.trade->price == 110.0);
    std::cout << "[TEST] AsOfPricing PASSED\n";
}

void testEquityCurve() {
    auto cache = makeCache();
    backtest::TradeSimulator sim(cache, frictionless(10000.0));
    assert(sim.execute(request(OrderSide::BUY, 10, DAY1)).ok);

    assert(sim.recordEquity(DAY1));
    assert(sim.recordEquity(DAY2));
    assert(sim.recordEquity(DAY2));          // equal timestamps are fine
    assert(!sim.recordEquity(DAY1));         // going back is refused

    const auto curve = sim.equityCurve();
    assert(curve.size() == 3);
    assert(curve[0].equity == 10000.0);
    assert(curve[1].positions_value == 1100.0);
    assert(curve[1].equity == 9000.0 + 1100.0);
    for (size_t i = 1; i < curve.size(); ++i) {
        assert(curve[i].timestamp >= curve[i - 1].timestamp);
    }

    // Unpriced holdings are skipped, not fatal
    const auto lookup = sim.priceLookupAt(DAY1 - 1);
    assert(sim.ledger().portfolioValue(lookup) == 9000.0);
    std::cout << "[TEST] EquityCurve PASSED\n";
}

void testLookupMayReadLedger() {
    auto cache = makeCache();
    backtest::TradeSimulator sim(cache, frictionless(10000.0));
    assert(sim.execute(request(OrderSide::BUY, 10, DAY1)).ok);

    // A lookup that consults the ledger it is pricing
    const auto& ledger = sim.ledger();
    int calls = 0;
    auto lookup = [&](const std::string& symbol) -> std::optional<Price> {
        ++calls;
        return ledger.quantity(symbol) > 0.0 && ledger.cash() > 0.0 ? std::optional<Price>(50.0)
                                                                    : std::nullopt;
    };
    assert(ledger.portfolioValue(lookup) == 9000.0 + 500.0);
    assert(ledger.positionsValue(lookup) == 500.0);
    assert(calls == 2);
    std::cout << "[TEST] LookupMayReadLedger PASSED\n";
}

void testConcurrentBuysNeverOverdraw() {
    auto cache = makeCache();
    backtest::TradeSimulator sim(cache, frictionless(1000.0));

    std::atomic<int> fills{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&]() {
            for (int k = 0; k < 4; ++k) {
                if (sim.execute(request(OrderSide::BUY, 3, DAY1)).ok) {
                    fills++;
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    // 300 per fill, 1000 available
    assert(fills.load() == 3);
    assert(sim.ledger().cash() == 100.0);
    assert(sim.ledger().quantity("AAA") == 9.0);
    assert(sim.trades().size() == 3);
    std::cout << "[TEST] ConcurrentBuysNeverOverdraw PASSED\n";
}
}

int main() {
    std::cout << "[TEST] Starting TradeSimulator Test..." << std::endl;
    testRoundTripRestoresCash();
    testSlippageAndCommission();
    testRejections();
    testCommissionCannotOverdrawOnSell();
    testAsOfPricing();
    testEquityCurve();
    testLookupMayReadLedger();
    testConcurrentBuysNeverOverdraw();
    std::cout << "[TEST] TradeSimulator PASSED" << std::endl;
    return 0;
}
