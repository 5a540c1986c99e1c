#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>

/**
 * Specialized logging for process-level events.
 * Handles startup, configuration and shutdown logging in a consistent format.
 */
class SystemLogs {
public:
    // Startup and shutdown
    static void log_startup_banner(const std::string& config_path, const std::string& run_folder);
    static void log_configuration_table(const HybridTrader::Config::SystemConfig& config);
    static void log_run_complete(bool order_generated);

    static void log_fatal_error(const std::string& error_message);
};

#endif // SYSTEM_LOGS_HPP
