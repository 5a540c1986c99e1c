#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <memory>
#include <thread>
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"

namespace HybridTrader {
namespace System {

/**
 * Process-wide state of one run: the validated configuration and the logging machinery.
 * Destruction stops the logger and joins the logging thread.
 */
struct SystemState {
    HybridTrader::Config::SystemConfig config;
    std::shared_ptr<HybridTrader::Logging::LoggingContext> logging_context;
    std::shared_ptr<HybridTrader::Logging::AsyncLogger> logger;
    std::thread logging_thread;

    SystemState() = default;
    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;

    ~SystemState() {
        if (logger) {
            logger->stop();
        }
        if (logging_thread.joinable()) {
            logging_thread.join();
        }
    }
};

} // namespace System
} // namespace HybridTrader

#endif // SYSTEM_STATE_HPP
