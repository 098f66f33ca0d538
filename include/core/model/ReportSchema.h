#pragma once

#include <cmath>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/TimeUtils.h"
#include "common/Types.h"
#include "core/model/EngineTypes.h"
#include "engine/CalibrationAnalyzer.h"
#include "engine/PerformanceTypes.h"

namespace adaptiverisk {
namespace core {
namespace schema {

// JSON has no infinity; +inf is written as the string "inf".
inline nlohmann::json number(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    if (std::isnan(value)) {
        return nullptr;
    }
    return value;
}

inline double readNumber(const nlohmann::json& value, double fallback = 0.0) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s == "inf") return HUGE_VAL;
        if (s == "-inf") return -HUGE_VAL;
    }
    return fallback;
}

inline nlohmann::json toJson(const SimulatedTrade& trade) {
    nlohmann::json j;
    j["trade_id"] = trade.trade_id;
    j["timestamp"] = trade.timestamp;
    j["date"] = utils::formatDate(trade.timestamp);
    j["symbol"] = trade.symbol;
    j["action"] = orderSideToString(trade.side);
    j["quantity"] = trade.quantity;
    j["price"] = trade.price;
    j["gross_value"] = trade.gross_value;
    j["value"] = trade.value;
    j["commission"] = trade.commission;
    j["confidence"] = trade.confidence;
    j["strategy_name"] = trade.strategy_name;
    j["reasoning"] = trade.reasoning;
    j["cash_after"] = trade.cash_after;
    return j;
}

// Accepts the trade_history entries written by toJson(SimulatedTrade).
inline bool fromJson(const nlohmann::json& j, SimulatedTrade& out) {
    if (!j.is_object() || !j.contains("symbol") || !j.contains("quantity") || !j.contains("price")) {
        return false;
    }
    const std::string side = j.value("action", j.value("side", std::string()));
    if (!orderSideFromString(side, out.side)) {
        return false;
    }
    out.trade_id = j.value("trade_id", std::string());
    out.timestamp = utils::toMsTimestamp(j.value("timestamp", 0LL));
    out.symbol = j["symbol"].get<std::string>();
    out.quantity = readNumber(j["quantity"]);
    out.price = readNumber(j["price"]);
    out.gross_value = readNumber(j.value("gross_value", nlohmann::json(out.price * out.quantity)));
    out.value = readNumber(j.value("value", nlohmann::json(0.0)));
    out.commission = readNumber(j.value("commission", nlohmann::json(0.0)));
    out.confidence = readNumber(j.value("confidence", nlohmann::json(0.0)));
    out.strategy_name = j.value("strategy_name", std::string());
    out.reasoning = j.value("reasoning", std::string());
    out.cash_after = readNumber(j.value("cash_after", nlohmann::json(0.0)));
    return true;
}

inline nlohmann::json toJson(const ClosedTrade& trade) {
    nlohmann::json j;
    j["symbol"] = trade.symbol;
    j["quantity"] = trade.quantity;
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price;
    j["pnl"] = trade.pnl;
    j["pnl_pct"] = trade.pnl_pct;
    j["entry_time"] = trade.entry_time;
    j["exit_time"] = trade.exit_time;
    j["confidence"] = trade.confidence;
    j["strategy_name"] = trade.strategy_name;
    return j;
}

inline bool fromJson(const nlohmann::json& j, ClosedTrade& out) {
    if (!j.is_object() || !j.contains("pnl") || !j.contains("exit_time")) {
        return false;
    }
    out.symbol = j.value("symbol", std::string());
    out.quantity = readNumber(j.value("quantity", nlohmann::json(0.0)));
    out.entry_price = readNumber(j.value("entry_price", nlohmann::json(0.0)));
    out.exit_price = readNumber(j.value("exit_price", nlohmann::json(0.0)));
    out.pnl = readNumber(j["pnl"]);
    out.pnl_pct = readNumber(j.value("pnl_pct", nlohmann::json(0.0)));
    out.entry_time = utils::toMsTimestamp(j.value("entry_time", 0LL));
    out.exit_time = utils::toMsTimestamp(j["exit_time"].get<long long>());
    out.confidence = readNumber(j.value("confidence", nlohmann::json(0.0)));
    out.strategy_name = j.value("strategy_name", std::string());
    return true;
}

inline nlohmann::json toJson(const engine::BacktestReport& report) {
    nlohmann::json j;
    j["initial_capital"] = report.initial_capital;
    j["final_value"] = report.final_value;
    j["total_return"] = report.total_return;
    j["total_return_pct"] = report.total_return_pct;
    j["sharpe_ratio"] = number(report.sharpe_ratio);
    j["max_drawdown"] = number(report.max_drawdown);
    j["win_rate"] = report.win_rate;
    j["profit_factor"] = number(report.profit_factor);
    j["total_trades"] = report.total_trades;
    j["avg_trade_pnl"] = report.avg_trade_pnl;
    if (report.start_time) {
        j["start_date"] = utils::formatDate(*report.start_time);
    }
    if (report.end_time) {
        j["end_date"] = utils::formatDate(*report.end_time);
    }
    j["trading_days"] = report.trading_days;

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& point : report.equity_curve) {
        j["equity_curve"].push_back({
            {"date", utils::formatDate(point.timestamp)},
            {"equity", point.equity}
        });
    }

    j["trade_history"] = nlohmann::json::array();
    for (const auto& trade : report.trade_history) {
        j["trade_history"].push_back(toJson(trade));
    }
    return j;
}

inline nlohmann::json toJson(const engine::ConfidenceBucketStats& bucket) {
    return {
        {"count", bucket.count},
        {"win_rate", bucket.win_rate},
        {"avg_pnl", bucket.avg_pnl}
    };
}

inline nlohmann::json toJson(const engine::CalibrationReport& report) {
    nlohmann::json j;
    j["high_confidence"] = toJson(report.high);
    j["medium_confidence"] = toJson(report.medium);
    j["low_confidence"] = toJson(report.low);
    j["is_well_calibrated"] = report.is_well_calibrated;
    return j;
}

inline nlohmann::json toJson(const engine::PerformanceWindowReport& report) {
    nlohmann::json j;
    j["timeframe"] = report.timeframe;
    j["total_trades"] = report.total_trades;
    j["total_pnl"] = report.total_pnl;
    j["win_rate"] = report.win_rate;
    j["avg_win"] = report.avg_win;
    j["avg_loss"] = report.avg_loss;
    j["profit_factor"] = number(report.profit_factor);
    j["confidence_accuracy"] = toJson(report.calibration);

    j["strategy_performance"] = nlohmann::json::object();
    for (const auto& [name, stats] : report.strategy_performance) {
        j["strategy_performance"][name] = {
            {"trades", stats.trades},
            {"wins", stats.wins},
            {"losses", stats.losses},
            {"total_pnl", stats.total_pnl},
            {"win_rate", stats.winRate()},
            {"avg_pnl", stats.avgPnl()}
        };
    }
    return j;
}

inline nlohmann::json toJson(const engine::ThresholdSuggestion& s) {
    return {
        {"adjustment", engine::thresholdAdjustmentToString(s.adjustment)},
        {"current_threshold", s.current_threshold},
        {"suggested_threshold", s.suggested_threshold},
        {"reason", s.reason},
        {"confidence", s.confidence},
        {"should_change", s.should_change}
    };
}

inline nlohmann::json toJson(const engine::WindowAnalysis& analysis) {
    nlohmann::json j;
    j["label"] = analysis.label;
    j["days"] = analysis.days;
    j["performance"] = toJson(analysis.report);
    j["suggestion"] = toJson(analysis.suggestion);
    return j;
}

inline nlohmann::json toJson(const RiskParameter& param) {
    nlohmann::json j;
    j["name"] = param.name;
    j["value"] = param.value;
    if (param.previous_value) {
        j["previous_value"] = *param.previous_value;
    } else {
        j["previous_value"] = nullptr;
    }
    j["change_reason"] = param.change_reason;
    j["updated_at"] = param.updated_at;
    return j;
}

} // namespace schema
} // namespace core
} // namespace adaptiverisk
