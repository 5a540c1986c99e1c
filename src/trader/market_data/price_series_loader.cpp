#include "price_series_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace HybridTrader {
namespace Core {

using HybridTrader::Logging::log_message;

namespace {
    std::string trim_field(const std::string& field_value) {
        const char* whitespace_chars = " \t\r\n\"";
        auto begin_position = field_value.find_first_not_of(whitespace_chars);
        auto end_position = field_value.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return field_value.substr(begin_position, end_position - begin_position + 1);
    }

    std::vector<std::string> split_csv_line(const std::string& csv_line) {
        std::vector<std::string> csv_fields;
        std::stringstream csv_line_stream(csv_line);
        std::string csv_field;
        while (std::getline(csv_line_stream, csv_field, ',')) {
            csv_fields.push_back(trim_field(csv_field));
        }
        // getline drops an empty last field
        if (!csv_line.empty() && csv_line.back() == ',') {
            csv_fields.push_back("");
        }
        return csv_fields;
    }

    bool parse_number(const std::string& field_value, double& parsed_value) {
        if (field_value.empty()) {
            return false;
        }
        try {
            size_t parsed_characters = 0;
            parsed_value = std::stod(field_value, &parsed_characters);
            return parsed_characters == field_value.size();
        } catch (const std::exception& number_parse_exception_error) {
            return false;
        }
    }
}

std::vector<PricePoint> load_price_series_from_csv(const std::string& csv_path) {
    std::ifstream price_file_stream(csv_path);
    if (!price_file_stream.is_open()) {
        throw std::runtime_error("Price data file not found: " + csv_path);
    }

    std::string header_line;
    if (!std::getline(price_file_stream, header_line)) {
        throw std::runtime_error("Price data file is empty: " + csv_path);
    }

    std::map<std::string, size_t> column_index_by_name;
    std::vector<std::string> header_fields = split_csv_line(header_line);
    for (size_t column_index = 0; column_index < header_fields.size(); ++column_index) {
        column_index_by_name[header_fields[column_index]] = column_index;
    }

    const char* required_columns[] = {"Date", "Open", "High", "Low", "Close", "Volume"};
    for (const char* required_column : required_columns) {
        if (column_index_by_name.find(required_column) == column_index_by_name.end()) {
            throw std::runtime_error("Price data file " + csv_path + " is missing column " + std::string(required_column));
        }
    }
    const size_t date_column = column_index_by_name["Date"];
    const size_t open_column = column_index_by_name["Open"];
    const size_t high_column = column_index_by_name["High"];
    const size_t low_column = column_index_by_name["Low"];
    const size_t close_column = column_index_by_name["Close"];
    const size_t volume_column = column_index_by_name["Volume"];
    const size_t minimum_field_count = std::max({date_column, open_column, high_column, low_column, close_column, volume_column}) + 1;

    std::vector<PricePoint> raw_price_points;
    std::string price_line;
    int line_number = 1;
    int skipped_row_count = 0;
    while (std::getline(price_file_stream, price_line)) {
        ++line_number;
        if (trim_field(price_line).empty()) continue;

        std::vector<std::string> price_fields = split_csv_line(price_line);
        if (price_fields.size() < minimum_field_count || !TimeUtils::is_iso_date_prefix(price_fields[date_column])) {
            ++skipped_row_count;
            log_message("Skipping malformed price row " + std::to_string(line_number) + ": " + price_line);
            continue;
        }

        double close_value = 0.0;
        if (!parse_number(price_fields[close_column], close_value)) {
            ++skipped_row_count;
            log_message("Skipping price row " + std::to_string(line_number) + " with invalid close: " + price_line);
            continue;
        }

        // Open/high/low/volume are informational; a missing value becomes zero
        double open_value = 0.0, high_value = 0.0, low_value = 0.0, volume_value = 0.0;
        if (!parse_number(price_fields[open_column], open_value)) open_value = 0.0;
        if (!parse_number(price_fields[high_column], high_value)) high_value = 0.0;
        if (!parse_number(price_fields[low_column], low_value)) low_value = 0.0;
        if (!parse_number(price_fields[volume_column], volume_value)) volume_value = 0.0;

        raw_price_points.emplace_back(price_fields[date_column].substr(0, 10), open_value, high_value, low_value, close_value, volume_value);
    }

    if (skipped_row_count > 0) {
        log_message("Skipped " + std::to_string(skipped_row_count) + " malformed rows in " + csv_path);
    }
    return sanitize_price_series(raw_price_points);
}

std::vector<PricePoint> sanitize_price_series(const std::vector<PricePoint>& raw_price_points) {
    std::vector<PricePoint> sorted_price_points = raw_price_points;
    // Stable: equal dates keep file order, so the last one seen is the latest
    std::stable_sort(sorted_price_points.begin(), sorted_price_points.end(),
                     [](const PricePoint& left_point, const PricePoint& right_point) { return left_point.date < right_point.date; });

    std::vector<PricePoint> sanitized_price_points;
    sanitized_price_points.reserve(sorted_price_points.size());
    for (const PricePoint& price_point : sorted_price_points) {
        if (!sanitized_price_points.empty() && sanitized_price_points.back().date == price_point.date) {
            sanitized_price_points.back() = price_point;
        } else {
            sanitized_price_points.push_back(price_point);
        }
    }
    return sanitized_price_points;
}

} // namespace Core
} // namespace HybridTrader
