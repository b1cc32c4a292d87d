/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for OHLCV market data.

#include "umb/data_loader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace umb::core {

namespace {

std::string_view trim(std::string_view token) noexcept {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

template <typename T>
bool parse_field(std::string_view token, T& out) noexcept {
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc{} && ptr == token.data() + token.size();
}

} // anonymous namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const bridge::MarketBar& bar) noexcept {
    if (!std::isfinite(bar.open)  ||
        !std::isfinite(bar.high)  ||
        !std::isfinite(bar.low)   ||
        !std::isfinite(bar.close) ||
        !std::isfinite(bar.volume)) {
        return false;
    }

    // OHLC consistency.
    if (bar.high < bar.low)   return false;
    if (bar.open  > bar.high) return false;
    if (bar.open  < bar.low)  return false;
    if (bar.close > bar.high) return false;
    if (bar.close < bar.low)  return false;

    return bar.volume >= 0.0;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<bridge::MarketBar>
DataLoader::parse_row(const std::string& line, std::string_view instrument,
                      std::string_view bar_type) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::string_view rest = line;
    std::string_view tokens[6];
    std::size_t n = 0;
    while (n < 6) {
        const auto comma = rest.find(',');
        tokens[n++] = trim(rest.substr(0, comma));
        if (comma == std::string_view::npos) {
            rest = {};
            break;
        }
        rest = rest.substr(comma + 1);
        if (n == 6) {
            return std::nullopt;  // extra columns
        }
    }
    if (n != 6) {
        return std::nullopt;
    }

    bridge::MarketBar bar;
    double prices[5] = {};
    if (!parse_field(tokens[0], bar.ts_event)) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < 5; ++i) {
        if (tokens[i + 1].empty() || !parse_field(tokens[i + 1], prices[i])) {
            return std::nullopt;
        }
    }

    bar.instrument = std::string(instrument);
    bar.bar_type   = std::string(bar_type);
    bar.open   = prices[0];
    bar.high   = prices[1];
    bar.low    = prices[2];
    bar.close  = prices[3];
    bar.volume = prices[4];

    if (!validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<bridge::MarketBar>
DataLoader::parse_csv_string(const std::string& csv_content, std::string_view instrument,
                             std::string_view bar_type) noexcept {
    std::vector<bridge::MarketBar> bars;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto bar = parse_row(line, instrument, bar_type)) {
            bars.push_back(std::move(*bar));
        }
    }
    return bars;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<bridge::MarketBar>>
DataLoader::load_csv(const std::string& filepath, std::string_view instrument,
                     std::string_view bar_type) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str(), instrument, bar_type);
}

}  // namespace umb::core
