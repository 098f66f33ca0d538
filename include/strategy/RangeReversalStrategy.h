#pragma once

#include "strategy/IStrategy.h"

namespace adaptiverisk {
namespace strategy {

// Buys a tenth of cash when the close touches the lowest low of the
// lookback range and the symbol is flat; sells the whole position when the
// close reaches the highest high of the range.
class RangeReversalStrategy : public IStrategy {
public:
    static constexpr const char* NAME = "Simple Momentum";

    explicit RangeReversalStrategy(size_t lookback = 5,
                                   double cash_fraction = 0.1,
                                   double confidence = 0.7);

    StrategyInfo getInfo() const override;
    size_t lookbackBars() const override { return lookback_; }
    void onStep(StrategyContext& context) override;

private:
    size_t lookback_;
    double cash_fraction_;
    double confidence_;
};

} // namespace strategy
} // namespace adaptiverisk
