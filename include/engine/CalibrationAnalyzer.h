#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/EngineTypes.h"
#include "engine/EngineConfig.h"
#include "engine/PerformanceTypes.h"

namespace adaptiverisk {
namespace engine {

class RiskParameterStore;

struct WindowAnalysis {
    std::string label;
    int days = 0;
    PerformanceWindowReport report;     // carries the window's calibration
    ThresholdSuggestion suggestion;
};

// Checks whether stated confidence tracks realized outcomes and proposes
// moves of the auto-trade threshold. Each lookback window is evaluated on
// its own trade subset; windows are never blended.
class CalibrationAnalyzer {
public:
    static constexpr double HIGH_CONFIDENCE = 0.8;
    static constexpr double MEDIUM_CONFIDENCE = 0.6;
    static constexpr double STRONG_WIN_RATE = 0.7;
    static constexpr double WEAK_WIN_RATE = 0.5;
    static constexpr double THRESHOLD_STEP = 0.05;
    static constexpr double THRESHOLD_FLOOR = 0.75;
    static constexpr double THRESHOLD_CEILING = 0.98;
    static constexpr double CHANGE_TOLERANCE = 0.01;

    explicit CalibrationAnalyzer(const CalibrationConfig& config = CalibrationConfig());

    static CalibrationReport calibration(const std::vector<ClosedTrade>& trades);

    // Threshold after applying one rule to the given value, clamped to
    // [THRESHOLD_FLOOR, THRESHOLD_CEILING] by the rule's own bound.
    static double adjustedThreshold(ThresholdAdjustment adjustment, double current_threshold);

    ThresholdSuggestion suggestThreshold(const CalibrationReport& report, double current_threshold) const;

    std::vector<WindowAnalysis> analyzeWindows(const std::vector<ClosedTrade>& trades,
                                               TimestampMs now,
                                               double current_threshold) const;

    // Writes a changed threshold through the store as one read-modify-write,
    // re-running the suggestion's rule on whatever value is current at that
    // moment. Returns nullopt when the suggestion does not call for a change.
    std::optional<core::ParameterUpdateResult> applySuggestion(RiskParameterStore& store,
                                                               const ThresholdSuggestion& suggestion) const;

private:
    CalibrationConfig config_;
};

} // namespace engine
} // namespace adaptiverisk
