#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/report_layout.hpp"
#include "utils/format_utils.hpp"
#include "utils/time_utils.hpp"

using namespace HybridTrader::Logging;

void SystemLogs::log_startup_banner(const std::string& config_path, const std::string& run_folder) {
    log_section_header("HYBRID TRADER - MEAN REVERSION + MACRO DECISION ENGINE");
    log_section_line("Started: " + TimeUtils::current_log_timestamp());
    log_section_line("Config:  " + config_path);
    log_section_line("Logs:    " + run_folder);
}

void SystemLogs::log_configuration_table(const HybridTrader::Config::SystemConfig& config) {
    const HybridTrader::Config::MacroConfig& macro = config.macro;
    const HybridTrader::Config::AllocationConfig& allocation = config.allocation;

    ReportTable config_table("Configuration", config.trading.symbol);
    config_table.row("Lookback", std::to_string(config.technical.lookback_period));
    config_table.row("Z Threshold", "+/-" + FormatUtils::format_fixed(config.technical.symmetric_threshold(), 2));
    config_table.row("Macro Weights", std::to_string(macro.policy_rate_weight) + "/" + std::to_string(macro.capital_flow_weight) + "/" +
                                      std::to_string(macro.global_index_weight) + "/" + std::to_string(macro.fx_rate_weight) + "/" +
                                      std::to_string(macro.volatility_index_weight));
    config_table.row("Macro Bands", std::to_string(macro.bearish_threshold) + " .. " + std::to_string(macro.bullish_threshold));
    config_table.separator();
    config_table.row(allocation.high_confidence_label, FormatUtils::format_fixed(allocation.high_allocation_pct, 0) + "% of capital");
    config_table.row(allocation.medium_confidence_label, FormatUtils::format_fixed(allocation.medium_allocation_pct, 0) + "% of capital");
    config_table.row(allocation.low_confidence_label, FormatUtils::format_fixed(allocation.low_allocation_pct, 0) + "% of capital");
    config_table.row("Capital Base", FormatUtils::format_currency(config.trading.capital_base));
    config_table.row("Stop Loss", FormatUtils::format_fixed(config.risk.stop_loss_pct, 2) + "% (target x2)");
    config_table.row("Exit Time", config.risk.exit_time);
    config_table.close();
}

void SystemLogs::log_run_complete(bool order_generated) {
    log_section_line(order_generated ? "Run complete - order payload written to stdout" : "Run complete - no order");
    log_section_footer();
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message);
}
