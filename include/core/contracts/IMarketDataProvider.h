#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace adaptiverisk {
namespace core {

class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    // Bars for one symbol between two "YYYY-MM-DD" days (inclusive).
    // An empty result means no data; providers log their own failures.
    virtual std::vector<PriceBar> fetchBars(
        const std::string& symbol,
        const std::string& start_date,
        const std::string& end_date
    ) = 0;
};

} // namespace core
} // namespace adaptiverisk
