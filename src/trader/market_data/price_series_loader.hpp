#ifndef PRICE_SERIES_LOADER_HPP
#define PRICE_SERIES_LOADER_HPP

#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace HybridTrader {
namespace Core {

/**
 * Reads a daily OHLCV CSV with header Date,Open,High,Low,Close,Volume (any column order).
 * Rows with a malformed date or non-numeric close are skipped and logged.
 * Throws std::runtime_error when the file cannot be opened or has no usable header.
 * The result is already sanitized.
 */
std::vector<PricePoint> load_price_series_from_csv(const std::string& csv_path);

// Sort by date and collapse duplicate dates keeping the last occurrence.
std::vector<PricePoint> sanitize_price_series(const std::vector<PricePoint>& raw_price_points);

} // namespace Core
} // namespace HybridTrader

#endif // PRICE_SERIES_LOADER_HPP
