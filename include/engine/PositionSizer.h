#pragma once

#include <string>

#include "engine/RiskParameterStore.h"

namespace adaptiverisk {
namespace engine {

// Confidence-scaled share count bounded by the per-position and aggregate
// exposure caps held in the parameter store.
//
// The per-position cap is applied to this order alone; shares already held
// in the same symbol are not netted against it.
class PositionSizer {
public:
    explicit PositionSizer(const RiskParameterStore& store);

    // current_exposure_fraction is committed value / account value (0.25 == 25%).
    long long size(const std::string& symbol,
                   double confidence,
                   double account_value,
                   double price,
                   double current_exposure_fraction) const;

    static double exposureFraction(double positions_value, double account_value);

private:
    const RiskParameterStore& store_;
};

} // namespace engine
} // namespace adaptiverisk
