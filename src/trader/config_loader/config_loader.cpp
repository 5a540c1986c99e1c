#include "config_loader.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

using HybridTrader::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char value_character) { return static_cast<char>(std::tolower(value_character)); });
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    int parse_int(const std::string& config_key, const std::string& config_value) {
        try {
            size_t parsed_characters = 0;
            int parsed_value = std::stoi(config_value, &parsed_characters);
            if (parsed_characters != config_value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed_value;
        } catch (const std::exception& parse_exception_error) {
            throw std::runtime_error("Failed to parse " + config_key + " from value '" + config_value + "': " + std::string(parse_exception_error.what()));
        }
    }

    double parse_double(const std::string& config_key, const std::string& config_value) {
        try {
            size_t parsed_characters = 0;
            double parsed_value = std::stod(config_value, &parsed_characters);
            if (parsed_characters != config_value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed_value;
        } catch (const std::exception& parse_exception_error) {
            throw std::runtime_error("Failed to parse " + config_key + " from value '" + config_value + "': " + std::string(parse_exception_error.what()));
        }
    }

    std::string require_non_empty(const std::string& config_key, const std::string& config_value) {
        if (config_value.empty()) {
            throw std::runtime_error(config_key + " is required but not provided");
        }
        return config_value;
    }

    bool is_percentage(double value) {
        return std::isfinite(value) && value >= 0.0 && value <= 100.0;
    }
}

bool apply_config_value(HybridTrader::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
    // Technical analysis
    if (config_key_string == "technical.lookback_period") cfg.technical.lookback_period = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "technical.zscore_buy_threshold") cfg.technical.zscore_buy_threshold = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "technical.zscore_sell_threshold") cfg.technical.zscore_sell_threshold = parse_double(config_key_string, config_value_string);

    // Macro factor weights
    else if (config_key_string == "macro.weight.policy_rate") cfg.macro.policy_rate_weight = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "macro.weight.capital_flow") cfg.macro.capital_flow_weight = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "macro.weight.global_index") cfg.macro.global_index_weight = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "macro.weight.fx_rate") cfg.macro.fx_rate_weight = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "macro.weight.volatility_index") cfg.macro.volatility_index_weight = parse_int(config_key_string, config_value_string);

    // Macro sentiment thresholds
    else if (config_key_string == "macro.threshold.bullish") cfg.macro.bullish_threshold = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "macro.threshold.bearish") cfg.macro.bearish_threshold = parse_int(config_key_string, config_value_string);

    // Macro factor bands
    else if (config_key_string == "macro.band.capital_flow") cfg.macro.capital_flow_band = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "macro.band.global_index") cfg.macro.global_index_band_pct = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "macro.band.fx_rate") cfg.macro.fx_rate_band_pct = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "macro.band.volatility_index") cfg.macro.volatility_index_band_pct = parse_double(config_key_string, config_value_string);

    // Allocation tiers
    else if (config_key_string == "allocation.high") cfg.allocation.high_allocation_pct = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "allocation.medium") cfg.allocation.medium_allocation_pct = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "allocation.low") cfg.allocation.low_allocation_pct = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "allocation.confidence.high") cfg.allocation.high_confidence_label = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "allocation.confidence.medium") cfg.allocation.medium_confidence_label = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "allocation.confidence.low") cfg.allocation.low_confidence_label = require_non_empty(config_key_string, config_value_string);

    // Trading
    else if (config_key_string == "trading.capital_base") cfg.trading.capital_base = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "trading.symbol") cfg.trading.symbol = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "trading.order_type") cfg.trading.order_type = require_non_empty(config_key_string, config_value_string);

    // Risk
    else if (config_key_string == "risk.stop_loss_pct") cfg.risk.stop_loss_pct = parse_double(config_key_string, config_value_string);
    else if (config_key_string == "risk.exit_time") cfg.risk.exit_time = require_non_empty(config_key_string, config_value_string);

    // Data
    else if (config_key_string == "data.price_csv_path") cfg.data.price_csv_path = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "data.history_display_rows") cfg.data.history_display_rows = parse_int(config_key_string, config_value_string);

    // Quotes
    else if (config_key_string == "quotes.base_url") cfg.quotes.base_url = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "quotes.chart_query") cfg.quotes.chart_query = config_value_string;
    else if (config_key_string == "quotes.global_index_ticker") cfg.quotes.global_index_ticker = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "quotes.fx_rate_ticker") cfg.quotes.fx_rate_ticker = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "quotes.volatility_index_ticker") cfg.quotes.volatility_index_ticker = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "quotes.timeout_seconds") cfg.quotes.timeout_seconds = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "quotes.retries") cfg.quotes.retries = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "quotes.retry_delay_ms") cfg.quotes.retry_delay_ms = parse_int(config_key_string, config_value_string);
    else if (config_key_string == "quotes.enable_ssl_verification") cfg.quotes.enable_ssl_verification = to_bool(config_value_string);

    // Logging
    else if (config_key_string == "logging.log_directory") cfg.logging.log_directory = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "logging.log_file") cfg.logging.log_file = require_non_empty(config_key_string, config_value_string);
    else if (config_key_string == "logging.flush_interval_ms") cfg.logging.flush_interval_ms = parse_int(config_key_string, config_value_string);

    else return false;

    return true;
}

bool load_config_from_csv(HybridTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int config_line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++config_line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) {
            log_message("Config line " + std::to_string(config_line_number) + " has no value: " + config_line_string);
            continue;
        }
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        if (!apply_config_value(cfg, config_key_string, config_value_string)) {
            log_message("Ignoring unknown config key '" + config_key_string + "' in " + csv_path);
        }
    }
    return true;
}

int load_system_config(HybridTrader::Config::SystemConfig& config, const std::string& csv_path) {
    try {
        if (!load_config_from_csv(config, csv_path)) {
            log_message("ERROR: Could not open config file: " + csv_path);
            return 1;
        }
    } catch (const std::exception& config_exception_error) {
        log_message("ERROR: " + std::string(config_exception_error.what()));
        return 1;
    }

    std::string validation_error_message;
    if (!validate_config(config, validation_error_message)) {
        log_message("ERROR: Config error: " + validation_error_message);
        return 1;
    }
    return 0;
}

bool validate_config(const HybridTrader::Config::SystemConfig& config, std::string& error_message) {
    // Technical analysis
    if (config.technical.lookback_period < 2) {
        error_message = "technical.lookback_period must be >= 2, got " + std::to_string(config.technical.lookback_period);
        return false;
    }
    double threshold_magnitude = config.technical.symmetric_threshold();
    if (!std::isfinite(threshold_magnitude) || threshold_magnitude <= 0.0) {
        error_message = "technical.zscore_buy_threshold must be a non-zero finite number";
        return false;
    }
    if (!std::isfinite(config.technical.zscore_sell_threshold)) {
        error_message = "technical.zscore_sell_threshold must be finite";
        return false;
    }
    if (std::abs(std::abs(config.technical.zscore_sell_threshold) - threshold_magnitude) > 1e-12) {
        log_message("WARNING: technical.zscore_sell_threshold magnitude differs from the buy threshold; using symmetric threshold " +
                    std::to_string(threshold_magnitude));
    }

    // Macro
    if (config.macro.bearish_threshold > config.macro.bullish_threshold) {
        error_message = "macro.threshold.bearish (" + std::to_string(config.macro.bearish_threshold) +
                        ") must be <= macro.threshold.bullish (" + std::to_string(config.macro.bullish_threshold) + ")";
        return false;
    }
    if (!std::isfinite(config.macro.capital_flow_band) || config.macro.capital_flow_band < 0.0 ||
        !std::isfinite(config.macro.global_index_band_pct) || config.macro.global_index_band_pct < 0.0 ||
        !std::isfinite(config.macro.fx_rate_band_pct) || config.macro.fx_rate_band_pct < 0.0 ||
        !std::isfinite(config.macro.volatility_index_band_pct) || config.macro.volatility_index_band_pct < 0.0) {
        error_message = "macro.band.* values must be finite and >= 0";
        return false;
    }

    // Allocation tiers
    if (!is_percentage(config.allocation.high_allocation_pct) ||
        !is_percentage(config.allocation.medium_allocation_pct) ||
        !is_percentage(config.allocation.low_allocation_pct)) {
        error_message = "allocation.high/medium/low must be between 0.0 and 100.0";
        return false;
    }
    if (config.allocation.high_allocation_pct < config.allocation.medium_allocation_pct ||
        config.allocation.medium_allocation_pct < config.allocation.low_allocation_pct) {
        error_message = "allocation tiers must satisfy high >= medium >= low";
        return false;
    }
    if (config.allocation.high_confidence_label.empty() || config.allocation.medium_confidence_label.empty() ||
        config.allocation.low_confidence_label.empty()) {
        error_message = "allocation.confidence.high/medium/low cannot be empty";
        return false;
    }

    // Trading
    if (!std::isfinite(config.trading.capital_base) || config.trading.capital_base <= 0.0) {
        error_message = "trading.capital_base must be > 0, got " + std::to_string(config.trading.capital_base);
        return false;
    }
    if (config.trading.symbol.empty()) {
        error_message = "trading.symbol cannot be empty";
        return false;
    }
    if (config.trading.order_type.empty()) {
        error_message = "trading.order_type cannot be empty";
        return false;
    }

    // Risk (a SELL target sits 2 x stop_loss_pct below entry and must stay positive)
    if (!std::isfinite(config.risk.stop_loss_pct) || config.risk.stop_loss_pct <= 0.0 || config.risk.stop_loss_pct >= 50.0) {
        error_message = "risk.stop_loss_pct must be > 0 and < 50, got " + std::to_string(config.risk.stop_loss_pct);
        return false;
    }
    if (config.risk.exit_time.empty()) {
        error_message = "risk.exit_time cannot be empty";
        return false;
    }

    // Data
    if (config.data.history_display_rows < 0) {
        error_message = "data.history_display_rows must be >= 0";
        return false;
    }

    // Quotes
    if (config.quotes.timeout_seconds <= 0) {
        error_message = "quotes.timeout_seconds must be > 0";
        return false;
    }
    if (config.quotes.retries < 1) {
        error_message = "quotes.retries must be >= 1";
        return false;
    }
    if (config.quotes.retry_delay_ms < 0) {
        error_message = "quotes.retry_delay_ms must be >= 0";
        return false;
    }

    // Logging
    if (config.logging.log_file.empty() || config.logging.log_directory.empty()) {
        error_message = "logging.log_directory and logging.log_file cannot be empty";
        return false;
    }
    if (config.logging.flush_interval_ms <= 0) {
        error_message = "logging.flush_interval_ms must be > 0";
        return false;
    }

    return true;
}
