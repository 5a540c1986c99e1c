#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace HybridTrader {
namespace Threads {

/**
 * Writes queued log lines to stderr and the run log file until the logger is stopped
 * and its queue is empty.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<HybridTrader::Logging::AsyncLogger> logger,
                  const HybridTrader::Config::LoggingConfig& logging_config)
        : logger_ptr(logger), flush_interval_ms(logging_config.flush_interval_ms) {}

    void operator()();

private:
    std::shared_ptr<HybridTrader::Logging::AsyncLogger> logger_ptr;
    int flush_interval_ms;
};

} // namespace Threads
} // namespace HybridTrader

#endif // LOGGING_THREAD_HPP
