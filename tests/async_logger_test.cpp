#include <gtest/gtest.h>
#include "logging/logger/async_logger.hpp"
#include "threads/logging_thread.hpp"
#include <fstream>
#include <sstream>
#include <thread>

using namespace HybridTrader::Logging;
using HybridTrader::Config::LoggingConfig;
using HybridTrader::Threads::LoggingThread;

TEST(AsyncLoggerTest, EnqueueOnlyWhileStarted) {
    AsyncLogger async_logger(::testing::TempDir() + "hybrid_trader_unused.log");
    EXPECT_FALSE(async_logger.enqueue("before start\n"));

    async_logger.start();
    EXPECT_TRUE(async_logger.is_accepting());
    EXPECT_TRUE(async_logger.enqueue("queued line\n"));

    async_logger.stop();
    EXPECT_FALSE(async_logger.enqueue("after stop\n"));

    std::ofstream unopened_file;
    ::testing::internal::CaptureStderr();
    bool more_to_drain = async_logger.drain(unopened_file, 1);
    std::string captured_log = ::testing::internal::GetCapturedStderr();

    EXPECT_FALSE(more_to_drain);
    EXPECT_EQ(captured_log, "queued line\n");
}

TEST(AsyncLoggerTest, LoggingThreadWritesRunFileAndStderr) {
    LoggingConfig logging_config;
    logging_config.log_directory = ::testing::TempDir() + "hybrid_trader_logger_test";
    logging_config.log_file = "nested/engine.log";
    logging_config.flush_interval_ms = 5;

    LoggingContext logging_context;
    set_logging_context(logging_context);
    std::shared_ptr<AsyncLogger> async_logger = create_run_logger(logging_config);
    EXPECT_EQ(logging_context.async_logger, async_logger);
    EXPECT_EQ(logging_context.run_folder.rfind(logging_config.log_directory + "/run_", 0), 0u);
    EXPECT_EQ(async_logger->get_file_path(), logging_context.run_folder + "/engine.log");

    ::testing::internal::CaptureStderr();
    async_logger->start();
    std::thread logging_thread(LoggingThread(async_logger, logging_config));
    log_message("first queued line");
    log_message("second queued line");
    async_logger->stop();
    logging_thread.join();
    clear_logging_context();
    std::string captured_log = ::testing::internal::GetCapturedStderr();

    size_t first_position = captured_log.find("first queued line");
    size_t second_position = captured_log.find("second queued line");
    ASSERT_NE(first_position, std::string::npos);
    ASSERT_NE(second_position, std::string::npos);
    EXPECT_LT(first_position, second_position);

    std::ifstream log_file(async_logger->get_file_path());
    ASSERT_TRUE(log_file.is_open());
    std::stringstream file_contents;
    file_contents << log_file.rdbuf();
    std::string logged_text = file_contents.str();
    first_position = logged_text.find("first queued line");
    second_position = logged_text.find("second queued line");
    ASSERT_NE(first_position, std::string::npos);
    ASSERT_NE(second_position, std::string::npos);
    EXPECT_LT(first_position, second_position);
}
