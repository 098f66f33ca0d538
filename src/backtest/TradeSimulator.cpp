#include "backtest/TradeSimulator.h"

#include <cmath>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace adaptiverisk {
namespace backtest {

TradeSimulator::TradeSimulator(const PriceSeriesCache& prices, const engine::SimulationConfig& config)
    : prices_(prices)
    , config_(config)
    , ledger_(config.initial_capital) {}

core::ExecutionResult TradeSimulator::reject(const core::TradeRequest& request,
                                             core::RejectReason reason,
                                             const std::string& message) const {
    LOG_WARN("[{}] {} {} x{:.4f} rejected: {} ({})",
             utils::formatDate(request.timestamp), orderSideToString(request.side), request.symbol,
             request.quantity, core::rejectReasonToString(reason), message);
    return core::ExecutionResult::rejected(reason, message);
}

core::ExecutionResult TradeSimulator::execute(const core::TradeRequest& request) {
    if (request.symbol.empty()) {
        return reject(request, core::RejectReason::INVALID_REQUEST, "empty symbol");
    }
    if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
        return reject(request, core::RejectReason::INVALID_REQUEST, "quantity must be positive");
    }
    if (!(request.confidence >= 0.0 && request.confidence <= 1.0)) {
        return reject(request, core::RejectReason::INVALID_REQUEST, "confidence must be within [0, 1]");
    }

    const auto market_price = prices_.priceAt(request.symbol, request.timestamp, PriceField::CLOSE);
    if (!market_price) {
        return reject(request, core::RejectReason::DATA_UNAVAILABLE, "no bar at or before timestamp");
    }

    const double slippage = config_.slippageRate();
    const bool is_buy = (request.side == OrderSide::BUY);
    const Price fill_price = is_buy ? (*market_price * (1.0 + slippage))
                                    : (*market_price * (1.0 - slippage));
    const Amount gross = fill_price * request.quantity;
    const Amount value = is_buy ? (gross + config_.commission) : (gross - config_.commission);

    std::lock_guard<std::mutex> lock(mutex_);

    const core::RejectReason outcome = is_buy
        ? ledger_.debitForBuy(request.symbol, request.quantity, value)
        : ledger_.creditForSell(request.symbol, request.quantity, value);
    if (outcome != core::RejectReason::NONE) {
        const std::string message = (outcome == core::RejectReason::INSUFFICIENT_SHARES)
            ? "requested quantity exceeds holdings"
            : "cost exceeds available cash";
        return reject(request, outcome, message);
    }

    SimulatedTrade trade;
    trade.trade_id = "sim-" + std::to_string(++trade_seq_);
    trade.timestamp = request.timestamp;
    trade.symbol = request.symbol;
    trade.side = request.side;
    trade.quantity = request.quantity;
    trade.price = fill_price;
    trade.gross_value = gross;
    trade.value = value;
    trade.commission = config_.commission;
    trade.confidence = request.confidence;
    trade.strategy_name = request.strategy_name;
    trade.reasoning = request.reasoning;
    trade.cash_after = ledger_.cash();
    trades_.push_back(trade);

    LOG_INFO("[{}] {} {} x{:.4f} @ {:.4f} (value {:.2f}, cash {:.2f})",
             utils::formatDate(trade.timestamp), orderSideToString(trade.side), trade.symbol,
             trade.quantity, trade.price, trade.value, trade.cash_after);
    Logger::getInstance().logTrade(trade.symbol, orderSideToString(trade.side),
                                   trade.price, trade.quantity, trade.cash_after);

    return core::ExecutionResult::filled(std::move(trade));
}

PositionLedger::PriceLookup TradeSimulator::priceLookupAt(TimestampMs timestamp) const {
    const PriceSeriesCache* prices = &prices_;
    return [prices, timestamp](const std::string& symbol) {
        return prices->priceAt(symbol, timestamp, PriceField::CLOSE);
    };
}

bool TradeSimulator::recordEquity(TimestampMs timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!equity_curve_.empty() && timestamp < equity_curve_.back().timestamp) {
        LOG_WARN("Equity point at {} precedes last point at {}; refused",
                 timestamp, equity_curve_.back().timestamp);
        return false;
    }

    const auto lookup = priceLookupAt(timestamp);
    EquityPoint point;
    point.timestamp = timestamp;
    point.cash = ledger_.cash();
    point.positions_value = ledger_.positionsValue(lookup);
    point.equity = point.cash + point.positions_value;
    equity_curve_.push_back(point);
    return true;
}

std::vector<SimulatedTrade> TradeSimulator::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

std::vector<EquityPoint> TradeSimulator::equityCurve() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return equity_curve_;
}

} // namespace backtest
} // namespace adaptiverisk
