#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace adaptiverisk {
namespace engine {

struct LotReplay {
    std::vector<ClosedTrade> closed_trades;
    std::map<std::string, std::deque<Lot>> open_lots;   // FIFO per symbol, oldest first
    int unmatched_sells = 0;
};

// FIFO reconstruction of round trips from a trade stream. Stateless: the
// same stream always yields the same result.
class LotMatcher {
public:
    static std::vector<ClosedTrade> closeTrades(const std::vector<SimulatedTrade>& trades);
    static LotReplay replay(const std::vector<SimulatedTrade>& trades);
};

} // namespace engine
} // namespace adaptiverisk
