/**
 * Exchange trading session check
 */

#include <cstdint>

#include "market_signals/orchestrator/market_session.h"

namespace market_signals {
namespace orchestrator {

bool isSessionOpen(common::WallTime now, const common::SessionConfig& session) {
    constexpr int64_t kSecondsPerDay = 86400;

    int64_t utc_seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    int64_t local_seconds = utc_seconds + static_cast<int64_t>(session.utc_offset_minutes) * 60;

    int64_t day = local_seconds / kSecondsPerDay;
    int64_t second_of_day = local_seconds % kSecondsPerDay;
    if (second_of_day < 0) {
        second_of_day += kSecondsPerDay;
        --day;
    }

    // 1970-01-01 was a Thursday; 0 = Sunday
    int weekday = static_cast<int>(((day + 4) % 7 + 7) % 7);
    if (weekday == 0 || weekday == 6) {
        return false;
    }

    int minute = static_cast<int>(second_of_day / 60);
    return minute >= session.open_minute && minute < session.close_minute;
}

} // namespace orchestrator
} // namespace market_signals
