#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include "configs/logging_config.hpp"

namespace HybridTrader {
namespace Logging {

/**
 * Queue of formatted log lines, written out by the logging thread.
 * Lines go to stderr and the run log file. stdout is left to the order payload.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }

    void start();
    void stop();
    bool is_accepting() const { return accepting.load(); }

    // False once stopped; the caller then writes the line itself.
    bool enqueue(const std::string& formatted_line);

    // Waits up to wait_ms for lines and writes all pending ones.
    // Returns false when the logger is stopped and nothing is left to write.
    bool drain(std::ofstream& log_file, int wait_ms);

private:
    std::string file_path;
    std::mutex queue_mutex;
    std::condition_variable queue_signal;
    std::deque<std::string> pending_lines;
    std::atomic<bool> accepting{false};
};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::string run_folder;
};

// Queues the line when a started logger is installed, otherwise writes it to stderr.
void log_message(const std::string& message);

// Serialized write of one finished line to stderr.
void write_console_line(const std::string& log_line);

// Creates <log_directory>/run_<stamp>/ and installs a logger for <log_file> in the current context.
std::shared_ptr<AsyncLogger> create_run_logger(const HybridTrader::Config::LoggingConfig& logging_config);

// The context pointer is per thread; only the thread that installed it queues to its logger.
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

} // namespace Logging
} // namespace HybridTrader

#endif // ASYNC_LOGGER_HPP
