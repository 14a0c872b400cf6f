/**
 * Symbol list parsing and validation
 */

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

#include "market_signals/common/logging.h"
#include "market_signals/orchestrator/symbol_loader.h"

namespace market_signals {
namespace orchestrator {

std::string normalizeSymbol(const std::string& raw) {
    size_t begin = raw.find_first_not_of(" \t\r\n\"'");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = raw.find_last_not_of(" \t\r\n\"'");
    std::string symbol = raw.substr(begin, end - begin + 1);

    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    size_t colon = symbol.find(':');
    if (colon != std::string::npos) {
        symbol = symbol.substr(colon + 1);
    }

    const std::string suffix = "-EQ";
    if (symbol.size() > suffix.size() &&
        symbol.compare(symbol.size() - suffix.size(), suffix.size(), suffix) == 0) {
        symbol.erase(symbol.size() - suffix.size());
    }
    return symbol;
}

bool isValidSymbol(const std::string& symbol) {
    static const std::regex pattern("^[A-Z0-9&_-]{1,20}$");
    return std::regex_match(symbol, pattern);
}

std::vector<std::string> parseSymbolList(const std::string& text) {
    std::vector<std::string> symbols;
    std::set<std::string> seen;

    std::string token;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        // Comment lines in symbol files
        size_t first = line.find_first_not_of(" \t");
        if (first != std::string::npos && line[first] == '#') {
            continue;
        }

        std::istringstream fields(line);
        while (std::getline(fields, token, ',')) {
            std::string symbol = normalizeSymbol(token);
            if (symbol.empty()) {
                continue;
            }
            if (!isValidSymbol(symbol)) {
                LOG_WARNING("Skipping invalid symbol: " + token);
                continue;
            }
            if (seen.insert(symbol).second) {
                symbols.push_back(symbol);
            }
        }
    }
    return symbols;
}

std::vector<std::string> loadSymbolsFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open symbols file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::vector<std::string> symbols = parseSymbolList(buffer.str());

    LOG_INFO("Loaded " + std::to_string(symbols.size()) + " symbols from " + path);
    return symbols;
}

std::vector<std::string> applySkipLimit(const std::vector<std::string>& symbols, size_t skip, size_t limit) {
    if (skip >= symbols.size()) {
        return {};
    }
    auto begin = symbols.begin() + skip;
    auto end = symbols.end();
    if (limit > 0 && static_cast<size_t>(end - begin) > limit) {
        end = begin + limit;
    }
    return std::vector<std::string>(begin, end);
}

} // namespace orchestrator
} // namespace market_signals
