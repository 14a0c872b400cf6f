/**
 * Exchange trading session check
 */

#pragma once

#include "market_signals/common/clock.h"
#include "market_signals/common/config.h"

namespace market_signals {
namespace orchestrator {

// True on a weekday between open (inclusive) and close (exclusive) in the
// session's local time
bool isSessionOpen(common::WallTime now, const common::SessionConfig& session);

} // namespace orchestrator
} // namespace market_signals
