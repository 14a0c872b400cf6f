/**
 * Directional call shared by the option analyzer and the signal aggregator
 */

#pragma once

#include <string>

namespace market_signals {
namespace signals {

// Direction
enum class Direction {
    NEUTRAL,
    BULLISH,
    BEARISH
};

// Convert direction to string
std::string directionToString(Direction direction);

// Convert string to direction; unknown names map to NEUTRAL
Direction stringToDirection(const std::string& str);

} // namespace signals
} // namespace market_signals
