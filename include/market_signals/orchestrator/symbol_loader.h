/**
 * Symbol list parsing and validation
 */

#pragma once

#include <string>
#include <vector>

namespace market_signals {
namespace orchestrator {

// Trim, upper-case, strip an "EXCH:" prefix and a "-EQ" suffix
std::string normalizeSymbol(const std::string& raw);

// Upper-case letters, digits, '&', '_' and '-', 1 to 20 characters
bool isValidSymbol(const std::string& symbol);

// Split on commas and newlines. Invalid entries are skipped with a warning,
// duplicates keep their first position.
std::vector<std::string> parseSymbolList(const std::string& text);

// Read and parse a symbols file; throws std::runtime_error when unreadable
std::vector<std::string> loadSymbolsFile(const std::string& path);

// Drop the first skip symbols and keep at most limit (0 keeps all)
std::vector<std::string> applySkipLimit(const std::vector<std::string>& symbols, size_t skip, size_t limit);

} // namespace orchestrator
} // namespace market_signals
