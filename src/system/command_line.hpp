#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <optional>
#include <string>
#include "trader/coordinators/trading_coordinator.hpp"

namespace HybridTrader {
namespace System {

constexpr const char* DEFAULT_CONFIG_PATH = "config/system_config.csv";

struct CommandLineOptions {
    std::string config_path = DEFAULT_CONFIG_PATH;
    std::optional<std::string> price_csv_path;   // overrides data.price_csv_path
    bool offline = false;                        // skip quote fetching
    bool show_help = false;
    HybridTrader::Core::MacroInputs macro_inputs;
};

// Throws Core::InvalidInputError for unknown flags, missing values or non-numeric values.
CommandLineOptions parse_command_line(int argc, const char* const argv[]);

std::string usage_text(const std::string& program_name);

} // namespace System
} // namespace HybridTrader

#endif // COMMAND_LINE_HPP
