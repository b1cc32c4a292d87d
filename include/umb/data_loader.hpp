#pragma once

/// @file include/umb/data_loader.hpp
/// @brief CSV loader producing MarketBars for the trading-side bridge.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of OHLCV market data into `bridge::MarketBar`s for one
/// instrument. Malformed or non-finite rows are skipped; the loader never
/// crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// timestamp,open,high,low,close,volume
/// 1,1.0840,1.0852,1.0831,1.0849,1250
/// 2,1.0849,1.0861,1.0844,1.0858,980
/// ```
/// The first non-comment line is treated as a header and skipped. The
/// timestamp column must be an integer (it becomes the bar's `ts_event`).
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only if the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load

#include "umb/bridge.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace umb::core {

class DataLoader {
public:
    /// Load bars for `instrument` from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    [[nodiscard]] static std::optional<std::vector<bridge::MarketBar>>
    load_csv(const std::string& filepath, std::string_view instrument,
             std::string_view bar_type = "CSV") noexcept;

    /// Same format as `load_csv`, from memory.
    [[nodiscard]] static std::vector<bridge::MarketBar>
    parse_csv_string(const std::string& csv_content, std::string_view instrument,
                     std::string_view bar_type = "CSV") noexcept;

    /// A bar is valid if every price is finite, low <= open, close <= high,
    /// and volume >= 0.
    [[nodiscard]] static bool validate_bar(const bridge::MarketBar& bar) noexcept;

private:
    [[nodiscard]] static std::optional<bridge::MarketBar>
    parse_row(const std::string& line, std::string_view instrument,
              std::string_view bar_type) noexcept;
};

}  // namespace umb::core
