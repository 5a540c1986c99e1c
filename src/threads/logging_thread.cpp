#include "logging_thread.hpp"
#include <fstream>

using namespace HybridTrader::Threads;
using namespace HybridTrader::Logging;

void LoggingThread::operator()() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        write_console_line("ERROR: Failed to open log file " + logger_ptr->get_file_path() + ", console only\n");
    }

    // Keeps draining after stop() until the queue is empty
    while (logger_ptr->drain(log_file, flush_interval_ms)) {
    }
}
