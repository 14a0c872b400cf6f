/**
 * Trading signals
 */

#include <algorithm>
#include <cctype>

#include "market_signals/signals/direction.h"

namespace market_signals {
namespace signals {

std::string directionToString(Direction direction) {
    switch (direction) {
        case Direction::BULLISH: return "BULLISH";
        case Direction::BEARISH: return "BEARISH";
        case Direction::NEUTRAL: return "NEUTRAL";
        default: return "UNKNOWN";
    }
}

Direction stringToDirection(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "BULLISH" || upper == "UP" || upper == "BUY") {
        return Direction::BULLISH;
    } else if (upper == "BEARISH" || upper == "DOWN" || upper == "SELL") {
        return Direction::BEARISH;
    }
    return Direction::NEUTRAL;
}

} // namespace signals
} // namespace market_signals
