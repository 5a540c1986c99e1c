#include "command_line.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include <cmath>
#include <sstream>

namespace HybridTrader {
namespace System {

using HybridTrader::Core::InvalidInputError;

namespace {
    double parse_flag_number(const std::string& flag_name, const std::string& flag_value) {
        try {
            size_t parsed_characters = 0;
            double parsed_value = std::stod(flag_value, &parsed_characters);
            if (parsed_characters != flag_value.size() || !std::isfinite(parsed_value)) {
                throw InvalidInputError(flag_name + " expects a number, got '" + flag_value + "'");
            }
            return parsed_value;
        } catch (const std::logic_error& number_parse_exception_error) {
            throw InvalidInputError(flag_name + " expects a number, got '" + flag_value + "'");
        }
    }
}

CommandLineOptions parse_command_line(int argc, const char* const argv[]) {
    CommandLineOptions options;

    for (int argument_index = 1; argument_index < argc; ++argument_index) {
        const std::string flag_name = argv[argument_index];

        if (flag_name == "--help" || flag_name == "-h") {
            options.show_help = true;
            continue;
        }
        if (flag_name == "--offline") {
            options.offline = true;
            continue;
        }

        if (argument_index + 1 >= argc) {
            throw InvalidInputError(flag_name + " requires a value");
        }
        const std::string flag_value = argv[++argument_index];

        if (flag_name == "--config") options.config_path = flag_value;
        else if (flag_name == "--prices") options.price_csv_path = flag_value;
        else if (flag_name == "--policy-rate") options.macro_inputs.policy_rate = parse_flag_number(flag_name, flag_value);
        else if (flag_name == "--previous-policy-rate") options.macro_inputs.previous_policy_rate = parse_flag_number(flag_name, flag_value);
        else if (flag_name == "--capital-flow") options.macro_inputs.capital_flow = parse_flag_number(flag_name, flag_value);
        else if (flag_name == "--global-index-change") options.macro_inputs.global_index_change_pct = parse_flag_number(flag_name, flag_value);
        else if (flag_name == "--fx-change") options.macro_inputs.fx_rate_change_pct = parse_flag_number(flag_name, flag_value);
        else if (flag_name == "--fx-quote") options.macro_inputs.fx_rate_quote = parse_flag_number(flag_name, flag_value);
        else if (flag_name == "--volatility-change") options.macro_inputs.volatility_index_change_pct = parse_flag_number(flag_name, flag_value);
        else if (flag_name == "--volatility-level") options.macro_inputs.volatility_index_level = parse_flag_number(flag_name, flag_value);
        else throw InvalidInputError("unknown flag " + flag_name);
    }

    if (options.macro_inputs.previous_policy_rate && !options.macro_inputs.policy_rate) {
        throw InvalidInputError("--previous-policy-rate requires --policy-rate");
    }
    return options;
}

std::string usage_text(const std::string& program_name) {
    std::ostringstream usage_stream;
    usage_stream << "Usage: " << program_name << " [options]\n"
                 << "  --config PATH                 key,value config file (default " << DEFAULT_CONFIG_PATH << ")\n"
                 << "  --prices PATH                 daily OHLCV CSV (overrides data.price_csv_path)\n"
                 << "  --policy-rate RATE            current central bank policy rate\n"
                 << "  --previous-policy-rate RATE   previous policy rate\n"
                 << "  --capital-flow AMOUNT         net institutional flow\n"
                 << "  --global-index-change PCT     reference index session change\n"
                 << "  --fx-change PCT               domestic currency quote session change\n"
                 << "  --fx-quote QUOTE              latest currency quote (reporting only)\n"
                 << "  --volatility-change PCT       fear gauge session change\n"
                 << "  --volatility-level LEVEL      latest fear gauge level (reporting only)\n"
                 << "  --offline                     do not fetch quotes; unset auto factors stay neutral\n"
                 << "  --help                        show this text\n";
    return usage_stream.str();
}

} // namespace System
} // namespace HybridTrader
