#include "common/TimeUtils.h"
#include "engine/AutoExecutionGate.h"
#include "engine/CalibrationAnalyzer.h"
#include "engine/RiskParameterStore.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace adaptiverisk;
using engine::CalibrationAnalyzer;

namespace {
constexpr TimestampMs NOW = 1717200000000LL;    // 2024-06-01

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

// Appends `wins` winners and `losses` losers at one confidence level.
void addTrades(std::vector<ClosedTrade>& out, double confidence, int wins, int losses,
               TimestampMs exit_time = NOW - utils::MS_PER_DAY) {
    for (int i = 0; i < wins + losses; ++i) {
        ClosedTrade t;
        t.symbol = "AAA";
        t.quantity = 1.0;
        t.pnl = (i < wins) ? 10.0 : -5.0;
        t.confidence = confidence;
        t.exit_time = exit_time;
        t.strategy_name = "s";
        out.push_back(t);
    }
}

void testBuckets() {
    std::vector<ClosedTrade> trades;
    addTrades(trades, 0.9, 16, 4);
    addTrades(trades, 0.5, 8, 12);
    addTrades(trades, 0.7, 1, 1);
    addTrades(trades, 0.0, 3, 0);       // unscored

    const auto report = CalibrationAnalyzer::calibration(trades);
    assert(report.high.count == 20);
    assert(near(report.high.win_rate, 0.8));
    assert(near(report.high.avg_pnl, (16 * 10.0 - 4 * 5.0) / 20.0));
    assert(report.medium.count == 2);
    assert(report.low.count == 20);
    assert(near(report.low.win_rate, 0.4));
    assert(report.is_well_calibrated);

    // Bucket edges: 0.8 is high, 0.6 is medium
    std::vector<ClosedTrade> edges;
    addTrades(edges, 0.8, 1, 0);
    addTrades(edges, 0.6, 1, 0);
    const auto edge_report = CalibrationAnalyzer::calibration(edges);
    assert(edge_report.high.count == 1);
    assert(edge_report.medium.count == 1);
    assert(edge_report.low.count == 0);

    const auto empty = CalibrationAnalyzer::calibration({});
    assert(empty.high.count == 0);
    assert(!empty.is_well_calibrated);
    std::cout << "[TEST] Buckets PASSED\n";
}

void testSuggestions() {
    CalibrationAnalyzer analyzer;
    std::vector<ClosedTrade> strong;
    addTrades(strong, 0.9, 16, 4);
    const auto strong_report = CalibrationAnalyzer::calibration(strong);

    auto lower = analyzer.suggestThreshold(strong_report, 0.95);
    assert(near(lower.suggested_threshold, 0.90));
    assert(lower.should_change);
    assert(lower.confidence == 0.8);
    assert(near(analyzer.suggestThreshold(strong_report, 0.78).suggested_threshold, 0.75));
    // Already at the floor: nothing to do
    assert(!analyzer.suggestThreshold(strong_report, 0.75).should_change);

    std::vector<ClosedTrade> weak;
    addTrades(weak, 0.85, 4, 6);
    const auto weak_report = CalibrationAnalyzer::calibration(weak);
    auto raise = analyzer.suggestThreshold(weak_report, 0.95);
    assert(near(raise.suggested_threshold, 0.98));
    assert(raise.should_change);
    assert(raise.confidence == 0.9);
    assert(!analyzer.suggestThreshold(weak_report, 0.98).should_change);

    // Nine samples are not enough
    std::vector<ClosedTrade> thin;
    addTrades(thin, 0.9, 9, 0);
    auto hold = analyzer.suggestThreshold(CalibrationAnalyzer::calibration(thin), 0.95);
    assert(hold.suggested_threshold == 0.95);
    assert(!hold.should_change);
    assert(hold.confidence == 0.5);

    // Configurable sample minimum
    engine::CalibrationConfig relaxed;
    relaxed.min_samples = 5;
    assert(CalibrationAnalyzer(relaxed).suggestThreshold(CalibrationAnalyzer::calibration(thin), 0.95).should_change);
    std::cout << "[TEST] Suggestions PASSED\n";
}

void testWindowsAreIndependent() {
    std::vector<ClosedTrade> trades;
    addTrades(trades, 0.9, 0, 10, NOW - 1 * utils::MS_PER_DAY);
    addTrades(trades, 0.9, 30, 0, NOW - 20 * utils::MS_PER_DAY);
    addTrades(trades, 0.9, 0, 40, NOW - 60 * utils::MS_PER_DAY);
    addTrades(trades, 0.9, 5, 0, NOW - 200 * utils::MS_PER_DAY);     // outside every window

    CalibrationAnalyzer analyzer;
    const auto windows = analyzer.analyzeWindows(trades, NOW, 0.90);
    assert(windows.size() == 3);

    assert(windows[0].label == "short" && windows[0].days == 7);
    assert(windows[0].report.total_trades == 10);
    assert(near(windows[0].suggestion.suggested_threshold, 0.95));

    assert(windows[1].label == "medium");
    assert(windows[1].report.total_trades == 40);
    assert(near(windows[1].report.calibration.high.win_rate, 0.75));
    assert(near(windows[1].suggestion.suggested_threshold, 0.85));

    assert(windows[2].label == "long");
    assert(windows[2].report.total_trades == 80);
    assert(near(windows[2].suggestion.suggested_threshold, 0.95));
    assert(windows[2].report.timeframe == "long");
    std::cout << "[TEST] WindowsAreIndependent PASSED\n";
}

void testFeedbackLoopLowersStoredThreshold() {
    engine::RiskParameterStore store;
    engine::AutoExecutionGate gate(store);
    CalibrationAnalyzer analyzer;

    assert(gate.decide(0.92, engine::RecentPerformance{}).outcome == engine::GateOutcome::REQUIRE_APPROVAL);

    std::vector<ClosedTrade> trades;
    addTrades(trades, 0.9, 16, 4, NOW - 3 * utils::MS_PER_DAY);
    const double current = store.get(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
    const auto windows = analyzer.analyzeWindows(trades, NOW, current);
    const auto& medium = windows[1];
    assert(medium.suggestion.should_change);

    auto applied = analyzer.applySuggestion(store, medium.suggestion);
    assert(applied.has_value());
    assert(applied->ok());
    assert(near(store.get(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD), 0.90));

    const auto trail = store.history(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
    assert(trail.size() == 2);
    assert(trail.back().reason == medium.suggestion.reason);

    assert(gate.decide(0.92, engine::RecentPerformance{}).outcome == engine::GateOutcome::ALLOW);

    // A suggestion without a change writes nothing
    engine::ThresholdSuggestion idle;
    idle.current_threshold = 0.9;
    idle.suggested_threshold = 0.9;
    assert(!analyzer.applySuggestion(store, idle).has_value());
    assert(store.history(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD).size() == 2);
    std::cout << "[TEST] FeedbackLoopLowersStoredThreshold PASSED\n";
}

void testApplySteppingFromCurrentValue() {
    engine::RiskParameterStore store;
    CalibrationAnalyzer analyzer;

    // Suggestion computed against 0.95, but the stored value moved meanwhile
    engine::ThresholdSuggestion stale;
    stale.adjustment = engine::ThresholdAdjustment::LOWER;
    stale.current_threshold = 0.95;
    stale.suggested_threshold = 0.90;
    stale.should_change = true;
    stale.reason = "lower";
    assert(store.set(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD, 0.78, "manual").ok());

    auto applied = analyzer.applySuggestion(store, stale);
    assert(applied && applied->ok());
    assert(near(store.get(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD), 0.75));
    std::cout << "[TEST] ApplySteppingFromCurrentValue PASSED\n";
}

void testApplyOutsideBand() {
    CalibrationAnalyzer analyzer;

    // Strong bucket below the floor: the lowering rule clamps up to 0.75
    std::vector<ClosedTrade> strong;
    addTrades(strong, 0.9, 16, 4);
    engine::RiskParameterStore low_store;
    assert(low_store.set(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD, 0.5, "manual").ok());
    auto lower = analyzer.suggestThreshold(CalibrationAnalyzer::calibration(strong), 0.5);
    assert(lower.adjustment == engine::ThresholdAdjustment::LOWER);
    assert(near(lower.suggested_threshold, 0.75));
    assert(lower.should_change);
    auto applied = analyzer.applySuggestion(low_store, lower);
    assert(applied && applied->ok());
    assert(near(low_store.get(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD), 0.75));

    // Weak bucket above the ceiling: the raising rule clamps down to 0.98
    std::vector<ClosedTrade> weak;
    addTrades(weak, 0.9, 6, 14);
    engine::RiskParameterStore high_store;
    assert(high_store.set(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD, 1.0, "manual").ok());
    auto raise = analyzer.suggestThreshold(CalibrationAnalyzer::calibration(weak), 1.0);
    assert(raise.adjustment == engine::ThresholdAdjustment::RAISE);
    assert(near(raise.suggested_threshold, 0.98));
    applied = analyzer.applySuggestion(high_store, raise);
    assert(applied && applied->ok());
    assert(near(high_store.get(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD), 0.98));

    // A hold never writes, even when flagged as a change
    engine::ThresholdSuggestion hold;
    hold.should_change = true;
    assert(!analyzer.applySuggestion(high_store, hold).has_value());
    std::cout << "[TEST] ApplyOutsideBand PASSED\n";
}
}

int main() {
    std::cout << "[TEST] Starting CalibrationAnalyzer Test..." << std::endl;
    testBuckets();
    testSuggestions();
    testWindowsAreIndependent();
    testFeedbackLoopLowersStoredThreshold();
    testApplySteppingFromCurrentValue();
    testApplyOutsideBand();
    std::cout << "[TEST] CalibrationAnalyzer PASSED" << std::endl;
    return 0;
}
