#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace HybridTrader {
namespace Testing {

std::vector<Core::PricePoint> make_price_series(const std::vector<double>& closes) {
    std::vector<Core::PricePoint> price_series;
    for (size_t close_index = 0; close_index < closes.size(); ++close_index) {
        char date_buffer[11];
        std::snprintf(date_buffer, sizeof(date_buffer), "2024-%02d-%02d",
                      static_cast<int>(1 + close_index / 28), static_cast<int>(1 + close_index % 28));
        double close_value = closes[close_index];
        price_series.emplace_back(date_buffer, close_value, close_value + 1.0, close_value - 1.0, close_value, 1000.0);
    }
    return price_series;
}

std::string write_temp_file(const std::string& file_name, const std::string& contents) {
    std::string file_path = ::testing::TempDir() + "hybrid_trader_" + file_name;
    std::ofstream file_stream(file_path, std::ios::trunc);
    file_stream << contents;
    return file_path;
}

std::vector<double> StubQuoteSource::get_recent_daily_closes(const std::string& ticker) const {
    ++request_count;
    std::map<std::string, std::string>::const_iterator failure_iterator = failing_tickers.find(ticker);
    if (failure_iterator != failing_tickers.end()) {
        throw std::runtime_error(failure_iterator->second);
    }
    std::map<std::string, std::vector<double>>::const_iterator closes_iterator = closes_by_ticker.find(ticker);
    if (closes_iterator == closes_by_ticker.end()) {
        return std::vector<double>();
    }
    return closes_iterator->second;
}

} // namespace Testing
} // namespace HybridTrader
