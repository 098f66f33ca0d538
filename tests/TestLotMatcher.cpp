#include "backtest/PriceSeriesCache.h"
#include "backtest/TradeSimulator.h"
#include "common/TimeUtils.h"
#include "engine/LotMatcher.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace adaptiverisk;

namespace {
constexpr TimestampMs DAY1 = 1704067200000LL;   // 2024-01-01

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

SimulatedTrade fill(const std::string& id, OrderSide side, Quantity qty, Price price,
                    TimestampMs ts, double confidence = 0.7, const std::string& strategy = "s") {
    SimulatedTrade t;
    t.trade_id = id;
    t.timestamp = ts;
    t.symbol = "AAA";
    t.side = side;
    t.quantity = qty;
    t.price = price;
    t.value = qty * price;
    t.confidence = confidence;
    t.strategy_name = strategy;
    return t;
}

void testFifoPartialClose() {
    const std::vector<SimulatedTrade> trades = {
        fill("b1", OrderSide::BUY, 10, 100.0, DAY1, 0.9, "first"),
        fill("b2", OrderSide::BUY, 5, 110.0, DAY1 + 1, 0.6, "second"),
        fill("s1", OrderSide::SELL, 12, 120.0, DAY1 + 2, 0.5, "exit")
    };

    const auto replay = engine::LotMatcher::replay(trades);
    assert(replay.closed_trades.size() == 2);
    assert(replay.unmatched_sells == 0);

    const auto& first = replay.closed_trades[0];
    assert(first.quantity == 10.0);
    assert(first.entry_price == 100.0);
    assert(near(first.pnl, 200.0));
    assert(near(first.pnl_pct, 20.0));
    // Entry attributes come from the lot, not the sell
    assert(first.confidence == 0.9);
    assert(first.strategy_name == "first");
    assert(first.entry_time == DAY1);
    assert(first.exit_time == DAY1 + 2);

    const auto& second = replay.closed_trades[1];
    assert(second.quantity == 2.0);
    assert(near(second.pnl, 20.0));
    assert(second.confidence == 0.6);

    const auto& open = replay.open_lots.at("AAA");
    assert(open.size() == 1);
    assert(near(open.front().quantity, 3.0));
    assert(open.front().entry_price == 110.0);
    assert(open.front().entry_trade_id == "b2");
    std::cout << "[TEST] FifoPartialClose PASSED\n";
}

void testUnmatchedSellIgnored() {
    const std::vector<SimulatedTrade> trades = {
        fill("s0", OrderSide::SELL, 4, 100.0, DAY1),
        fill("b1", OrderSide::BUY, 2, 100.0, DAY1 + 1),
        fill("s1", OrderSide::SELL, 5, 90.0, DAY1 + 2)
    };

    const auto replay = engine::LotMatcher::replay(trades);
    assert(replay.unmatched_sells == 1);
    assert(replay.closed_trades.size() == 1);
    assert(replay.closed_trades[0].quantity == 2.0);
    assert(near(replay.closed_trades[0].pnl, -20.0));
    assert(replay.open_lots.empty());
    std::cout << "[TEST] UnmatchedSellIgnored PASSED\n";
}

void testFractionalLotsDrainWithinEpsilon() {
    const std::vector<SimulatedTrade> trades = {
        fill("b1", OrderSide::BUY, 0.1, 50.0, DAY1),
        fill("b2", OrderSide::BUY, 0.2, 50.0, DAY1 + 1),
        fill("s1", OrderSide::SELL, 0.3, 60.0, DAY1 + 2)
    };

    const auto closed = engine::LotMatcher::closeTrades(trades);
    assert(closed.size() == 2);
    assert(engine::LotMatcher::replay(trades).open_lots.empty());
    std::cout << "[TEST] FractionalLotsDrainWithinEpsilon PASSED\n";
}

void testLedgerMatchesOpenLots() {
    backtest::PriceSeriesCache cache;
    cache.load("AAA", {
        PriceBar("AAA", DAY1, 100, 100, 100, 100.0, 1),
        PriceBar("AAA", DAY1 + utils::MS_PER_DAY, 110, 110, 110, 110.0, 1),
        PriceBar("AAA", DAY1 + 2 * utils::MS_PER_DAY, 120, 120, 120, 120.0, 1)
    });
    engine::SimulationConfig cfg;
    cfg.initial_capital = 10000.0;
    cfg.slippage_pct = 0.0;
    backtest::TradeSimulator sim(cache, cfg);

    auto send = [&](OrderSide side, Quantity qty, int day) {
        core::TradeRequest r;
        r.symbol = "AAA";
        r.side = side;
        r.quantity = qty;
        r.timestamp = DAY1 + day * utils::MS_PER_DAY;
        r.confidence = 0.8;
        return sim.execute(r).ok;
    };
    assert(send(OrderSide::BUY, 10, 0));
    assert(send(OrderSide::BUY, 5, 1));
    assert(send(OrderSide::SELL, 12, 2));

    const auto replay = engine::LotMatcher::replay(sim.trades());
    Quantity open_qty = 0.0;
    for (const auto& lot : replay.open_lots.at("AAA")) {
        open_qty += lot.quantity;
    }
    assert(near(open_qty, sim.ledger().quantity("AAA")));
    assert(near(open_qty, 3.0));
    std::cout << "[TEST] LedgerMatchesOpenLots PASSED\n";
}
}

int main() {
    std::cout << "[TEST] Starting LotMatcher Test..." << std::endl;
    testFifoPartialClose();
    testUnmatchedSellIgnored();
    testFractionalLotsDrainWithinEpsilon();
    testLedgerMatchesOpenLots();
    std::cout << "[TEST] LotMatcher PASSED" << std::endl;
    return 0;
}
