// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace HybridTrader {
namespace Config {

struct LoggingConfig {
    std::string log_directory = "runtime_logs";
    std::string log_file = "hybrid_trader.log";
    int flush_interval_ms = 200;
};

} // namespace Config
} // namespace HybridTrader

#endif // LOGGING_CONFIG_HPP
