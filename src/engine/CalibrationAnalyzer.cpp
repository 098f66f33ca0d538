#include "engine/CalibrationAnalyzer.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"
#include "engine/PerformanceAnalyzer.h"
#include "engine/RiskParameterStore.h"

namespace adaptiverisk {
namespace engine {
namespace {
ConfidenceBucketStats bucketStats(const std::vector<const ClosedTrade*>& trades) {
    ConfidenceBucketStats stats;
    stats.count = static_cast<int>(trades.size());
    if (trades.empty()) {
        return stats;
    }
    int wins = 0;
    double pnl = 0.0;
    for (const auto* trade : trades) {
        if (trade->pnl > 0.0) {
            ++wins;
        }
        pnl += trade->pnl;
    }
    stats.win_rate = static_cast<double>(wins) / static_cast<double>(trades.size());
    stats.avg_pnl = pnl / static_cast<double>(trades.size());
    return stats;
}
}

double CalibrationAnalyzer::adjustedThreshold(ThresholdAdjustment adjustment, double current_threshold) {
    switch (adjustment) {
        case ThresholdAdjustment::LOWER:
            return std::max(THRESHOLD_FLOOR, current_threshold - THRESHOLD_STEP);
        case ThresholdAdjustment::RAISE:
            return std::min(THRESHOLD_CEILING, current_threshold + THRESHOLD_STEP);
        case ThresholdAdjustment::HOLD:
            break;
    }
    return current_threshold;
}

CalibrationAnalyzer::CalibrationAnalyzer(const CalibrationConfig& config)
    : config_(config) {}

CalibrationReport CalibrationAnalyzer::calibration(const std::vector<ClosedTrade>& trades) {
    std::vector<const ClosedTrade*> high;
    std::vector<const ClosedTrade*> medium;
    std::vector<const ClosedTrade*> low;

    for (const auto& trade : trades) {
        // Zero confidence means unscored.
        if (!(trade.confidence > 0.0)) {
            continue;
        }
        if (trade.confidence >= HIGH_CONFIDENCE) {
            high.push_back(&trade);
        } else if (trade.confidence >= MEDIUM_CONFIDENCE) {
            medium.push_back(&trade);
        } else {
            low.push_back(&trade);
        }
    }

    CalibrationReport report;
    report.high = bucketStats(high);
    report.medium = bucketStats(medium);
    report.low = bucketStats(low);
    report.is_well_calibrated = report.high.win_rate > report.low.win_rate;
    return report;
}

ThresholdSuggestion CalibrationAnalyzer::suggestThreshold(const CalibrationReport& report,
                                                          double current_threshold) const {
    ThresholdSuggestion s;
    s.current_threshold = current_threshold;

    const auto& high = report.high;
    if (high.win_rate > STRONG_WIN_RATE && high.count >= config_.min_samples) {
        s.adjustment = ThresholdAdjustment::LOWER;
        s.reason = "High-confidence trades performing well, can be more aggressive";
        s.confidence = 0.8;
    } else if (high.win_rate < WEAK_WIN_RATE && high.count >= config_.min_samples) {
        s.adjustment = ThresholdAdjustment::RAISE;
        s.reason = "High-confidence trades underperforming, need to be more selective";
        s.confidence = 0.9;
    } else {
        s.reason = "Current threshold seems appropriate";
        s.confidence = 0.5;
    }

    s.suggested_threshold = adjustedThreshold(s.adjustment, current_threshold);
    s.should_change = std::fabs(s.suggested_threshold - current_threshold) > CHANGE_TOLERANCE;
    return s;
}

std::vector<WindowAnalysis> CalibrationAnalyzer::analyzeWindows(const std::vector<ClosedTrade>& trades,
                                                                TimestampMs now,
                                                                double current_threshold) const {
    std::vector<WindowAnalysis> out;
    out.reserve(config_.windows.size());
    for (const auto& window : config_.windows) {
        WindowAnalysis analysis;
        analysis.label = window.label;
        analysis.days = window.days;

        const auto subset = PerformanceAnalyzer::closedWithin(trades, now, window.days);
        analysis.report = PerformanceAnalyzer::windowReport(window.label, subset);
        analysis.suggestion = suggestThreshold(analysis.report.calibration, current_threshold);

        LOG_INFO("Window {} ({}d): trades={}, high={} @ {:.2f}, suggest {:.2f} -> {:.2f}{}",
                 window.label, window.days, analysis.report.total_trades,
                 analysis.report.calibration.high.count, analysis.report.calibration.high.win_rate,
                 current_threshold, analysis.suggestion.suggested_threshold,
                 analysis.suggestion.should_change ? " (change)" : "");
        out.push_back(std::move(analysis));
    }
    return out;
}

std::optional<core::ParameterUpdateResult> CalibrationAnalyzer::applySuggestion(
    RiskParameterStore& store,
    const ThresholdSuggestion& suggestion
) const {
    if (!suggestion.should_change || suggestion.adjustment == ThresholdAdjustment::HOLD) {
        return std::nullopt;
    }

    const ThresholdAdjustment adjustment = suggestion.adjustment;
    return store.update(
        params::AUTO_TRADE_CONFIDENCE_THRESHOLD,
        [adjustment](double current) { return adjustedThreshold(adjustment, current); },
        suggestion.reason
    );
}

} // namespace engine
} // namespace adaptiverisk
