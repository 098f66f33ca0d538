#include "engine/PositionSizer.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "common/Logger.h"

namespace adaptiverisk {
namespace engine {

PositionSizer::PositionSizer(const RiskParameterStore& store)
    : store_(store) {}

long long PositionSizer::size(const std::string& symbol,
                              double confidence,
                              double account_value,
                              double price,
                              double current_exposure_fraction) const {
    if (!(price > 0.0) || !(account_value > 0.0) || !std::isfinite(price) || !std::isfinite(account_value)) {
        return 0;
    }
    if (!std::isfinite(current_exposure_fraction)) {
        LOG_WARN("{}: exposure is not a number, size 0", symbol);
        return 0;
    }

    const double clamped_confidence = std::clamp(std::isfinite(confidence) ? confidence : 0.0, 0.0, 1.0);
    const double max_position = store_.get(params::MAX_POSITION_SIZE_PCT) / 100.0;
    const double max_exposure = store_.get(params::MAX_PORTFOLIO_EXPOSURE_PCT) / 100.0;

    const double target_fraction = max_position * clamped_confidence;
    const double available_fraction = max_exposure - current_exposure_fraction;
    if (available_fraction <= 0.0) {
        LOG_DEBUG("{}: exposure {:.4f} at cap {:.4f}, size 0", symbol, current_exposure_fraction, max_exposure);
        return 0;
    }

    const double actual_fraction = std::min(target_fraction, available_fraction);
    const double shares = std::floor(account_value * actual_fraction / price);
    // Casting a double past the long long range is undefined
    if (shares >= static_cast<double>(std::numeric_limits<long long>::max())) {
        return std::numeric_limits<long long>::max();
    }
    return std::max(0LL, static_cast<long long>(shares));
}

double PositionSizer::exposureFraction(double positions_value, double account_value) {
    if (!(account_value > 0.0)) {
        return 0.0;
    }
    return positions_value / account_value;
}

} // namespace engine
} // namespace adaptiverisk
