#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace HybridTrader {
namespace Logging {

namespace {

thread_local LoggingContext* installed_logging_context = nullptr;
std::mutex console_mutex;

} // namespace

LoggingContext* get_logging_context() {
    if (!installed_logging_context) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return installed_logging_context;
}

void set_logging_context(LoggingContext& context) {
    installed_logging_context = &context;
}

void clear_logging_context() {
    installed_logging_context = nullptr;
}

void write_console_line(const std::string& log_line) {
    std::lock_guard<std::mutex> console_lock(console_mutex);
    std::cerr << log_line << std::flush;
}

void log_message(const std::string& message) {
    std::string log_line = TimeUtils::current_log_timestamp() + " | " + message + "\n";

    if (installed_logging_context && installed_logging_context->async_logger &&
        installed_logging_context->async_logger->enqueue(log_line)) {
        return;
    }
    write_console_line(log_line);
}

void AsyncLogger::start() {
    accepting.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        accepting.store(false);
    }
    queue_signal.notify_all();
}

bool AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        if (!accepting.load()) {
            return false;
        }
        pending_lines.push_back(formatted_line);
    }
    queue_signal.notify_one();
    return true;
}

bool AsyncLogger::drain(std::ofstream& log_file, int wait_ms) {
    std::deque<std::string> ready_lines;
    {
        std::unique_lock<std::mutex> queue_lock(queue_mutex);
        queue_signal.wait_for(queue_lock, std::chrono::milliseconds(wait_ms),
                              [this] { return !pending_lines.empty() || !accepting.load(); });
        ready_lines.swap(pending_lines);
    }

    for (const std::string& log_line : ready_lines) {
        write_console_line(log_line);
        if (log_file.is_open()) {
            log_file << log_line;
        }
    }
    if (log_file.is_open()) {
        log_file.flush();
    }

    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    return accepting.load() || !pending_lines.empty();
}

std::shared_ptr<AsyncLogger> create_run_logger(const HybridTrader::Config::LoggingConfig& logging_config) {
    LoggingContext* logging_context = get_logging_context();

    std::filesystem::path run_folder = std::filesystem::path(logging_config.log_directory) /
                                       ("run_" + TimeUtils::current_run_folder_stamp());
    std::error_code filesystem_error;
    std::filesystem::create_directories(run_folder, filesystem_error);
    if (filesystem_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder.string() + ": " + filesystem_error.message());
    }

    std::filesystem::path log_file_path = run_folder / std::filesystem::path(logging_config.log_file).filename();
    logging_context->run_folder = run_folder.string();
    logging_context->async_logger = std::make_shared<AsyncLogger>(log_file_path.string());
    return logging_context->async_logger;
}

} // namespace Logging
} // namespace HybridTrader
