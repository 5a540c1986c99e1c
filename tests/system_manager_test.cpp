#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "system/system_manager.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

using namespace HybridTrader::System;
using HybridTrader::Testing::write_temp_file;

namespace {
std::string oversold_price_csv() {
    std::ostringstream price_csv;
    price_csv << "Date,Open,High,Low,Close,Volume\n";
    for (int day = 1; day <= 10; ++day) {
        double close_price = day == 10 ? 90.0 : 100.0;
        price_csv << "2024-01-" << (day < 10 ? "0" : "") << day << ","
                  << close_price << "," << close_price + 1.0 << "," << close_price - 1.0 << ","
                  << close_price << ",1000\n";
    }
    return price_csv.str();
}
}

TEST(SystemManagerTest, StdoutCarriesOnlyTheOrderPayload) {
    std::string price_path = write_temp_file("system_prices.csv", oversold_price_csv());
    std::string config_path = write_temp_file("system_config.csv",
        "technical.lookback_period,10\n"
        "logging.log_directory," + ::testing::TempDir() + "hybrid_trader_system_logs\n"
        "logging.flush_interval_ms,5\n"
        "data.price_csv_path," + price_path + "\n");

    CommandLineOptions options;
    options.config_path = config_path;
    options.offline = true;
    options.macro_inputs.policy_rate = 6.25;
    options.macro_inputs.previous_policy_rate = 6.5;

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    SystemInitializationResult initialization_result = initialize(options);
    std::optional<nlohmann::json> order_payload = run(*initialization_result.system_state, options);
    shutdown(*initialization_result.system_state);
    write_order_payload(std::cout, order_payload);
    std::string captured_log = ::testing::internal::GetCapturedStderr();
    std::string captured_stdout = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(captured_log.find("[STEP 4/4] TRADE ORDER"), std::string::npos);

    nlohmann::json parsed_payload;
    ASSERT_NO_THROW(parsed_payload = nlohmann::json::parse(captured_stdout)) << captured_stdout;
    ASSERT_TRUE(parsed_payload.is_object());
    EXPECT_EQ(parsed_payload["action"].get<std::string>(), "BUY");
    EXPECT_EQ(parsed_payload["confidence"].get<std::string>(), "HIGH");
    EXPECT_EQ(parsed_payload["quantity"].get<long long>(), 888);
}

TEST(SystemManagerTest, NoTradeWritesJsonNull) {
    std::ostringstream payload_stream;
    write_order_payload(payload_stream, std::nullopt);
    EXPECT_TRUE(nlohmann::json::parse(payload_stream.str()).is_null());
}
