// main.cpp
#include "system/system_manager.hpp"
#include "system/command_line.hpp"
#include "logging/logs/system_logs.hpp"
#include <iostream>
#include <optional>

using namespace HybridTrader::System;

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    try {
        CommandLineOptions options = parse_command_line(argc, argv);
        if (options.show_help) {
            std::cout << usage_text(argc > 0 ? argv[0] : "hybrid_trader");
            return 0;
        }

        // Initialize system - config loading, validation, logging
        SystemInitializationResult initialization_result = initialize(options);

        std::optional<nlohmann::json> order_payload;
        try {
            order_payload = run(*initialization_result.system_state, options);
        } catch (const std::exception& run_exception_error) {
            SystemLogs::log_fatal_error(run_exception_error.what());
            shutdown(*initialization_result.system_state);
            throw;
        }

        // Logs go to stderr; stdout carries only the payload
        shutdown(*initialization_result.system_state);
        write_order_payload(std::cout, order_payload);
        return 0;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
