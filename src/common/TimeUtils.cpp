#include "common/TimeUtils.h"

#include <chrono>
#include <cstdio>

namespace adaptiverisk {
namespace utils {

namespace {
// Proleptic Gregorian day count (H. Hinnant's civil calendar algorithms).
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era * 400) + (m <= 2 ? 1 : 0);
}

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}
}

TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string formatDate(TimestampMs ts) {
    int y = 1970;
    unsigned m = 1;
    unsigned d = 1;
    civilFromDays(floorDiv(ts, MS_PER_DAY), y, m, d);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", y, m, d);
    return buffer;
}

bool parseDate(const std::string& date, TimestampMs& out) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (date.size() != 10 || std::sscanf(date.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return false;
    }
    out = daysFromCivil(y, m, d) * MS_PER_DAY;
    return true;
}

TimestampMs startOfDay(TimestampMs ts) {
    return floorDiv(ts, MS_PER_DAY) * MS_PER_DAY;
}

TimestampMs toMsTimestamp(long long ts) {
    // Anything below ~1973 in ms is assumed to be seconds.
    if (ts > 0 && ts < 100000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

} // namespace utils
} // namespace adaptiverisk
