#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include <stdexcept>

using HybridTrader::Config::SystemConfig;
using HybridTrader::Testing::write_temp_file;

TEST(ConfigLoaderTest, DefaultsAreValid) {
    SystemConfig config;
    std::string validation_error_message;
    EXPECT_TRUE(validate_config(config, validation_error_message)) << validation_error_message;
}

TEST(ConfigLoaderTest, ParsesKeysCommentsAndBlankLines) {
    std::string config_path = write_temp_file("parse.csv",
        "# comment line\n"
        "\n"
        "technical.lookback_period, 30\n"
        "technical.zscore_buy_threshold,-1.5\n"
        "macro.weight.fx_rate,2\n"
        "macro.threshold.bullish,4\n"
        "macro.band.capital_flow,2500\n"
        "allocation.low,10\n"
        "trading.symbol,BANKNIFTY\n"
        "risk.stop_loss_pct,0.75\n"
        "risk.exit_time,15:00\n"
        "quotes.global_index_ticker,^DJI\n"
        "quotes.enable_ssl_verification,false\n"
        "some.unknown_key,42\n");

    SystemConfig config;
    ASSERT_TRUE(load_config_from_csv(config, config_path));

    EXPECT_EQ(config.technical.lookback_period, 30);
    EXPECT_DOUBLE_EQ(config.technical.zscore_buy_threshold, -1.5);
    EXPECT_DOUBLE_EQ(config.technical.symmetric_threshold(), 1.5);
    EXPECT_EQ(config.macro.fx_rate_weight, 2);
    EXPECT_EQ(config.macro.bullish_threshold, 4);
    EXPECT_DOUBLE_EQ(config.macro.capital_flow_band, 2500.0);
    EXPECT_DOUBLE_EQ(config.allocation.low_allocation_pct, 10.0);
    EXPECT_EQ(config.trading.symbol, "BANKNIFTY");
    EXPECT_DOUBLE_EQ(config.risk.stop_loss_pct, 0.75);
    EXPECT_EQ(config.risk.exit_time, "15:00");
    EXPECT_EQ(config.quotes.global_index_ticker, "^DJI");
    EXPECT_FALSE(config.quotes.enable_ssl_verification);
    // untouched keys keep their defaults
    EXPECT_EQ(config.macro.policy_rate_weight, 3);
    EXPECT_DOUBLE_EQ(config.trading.capital_base, 100000.0);
}

TEST(ConfigLoaderTest, UnknownKeyIsReportedByApply) {
    SystemConfig config;
    EXPECT_FALSE(apply_config_value(config, "strategy.atr_period", "14"));
    EXPECT_TRUE(apply_config_value(config, "allocation.high", "90"));
    EXPECT_DOUBLE_EQ(config.allocation.high_allocation_pct, 90.0);
}

TEST(ConfigLoaderTest, MalformedNumberNamesTheKey) {
    SystemConfig config;
    try {
        apply_config_value(config, "technical.lookback_period", "twenty");
        FAIL() << "expected a parse failure";
    } catch (const std::runtime_error& parse_error) {
        EXPECT_NE(std::string(parse_error.what()).find("technical.lookback_period"), std::string::npos);
    }
    EXPECT_THROW(apply_config_value(config, "trading.capital_base", "100k"), std::runtime_error);
    EXPECT_THROW(apply_config_value(config, "trading.symbol", ""), std::runtime_error);
}

TEST(ConfigLoaderTest, MissingFileFailsToLoad) {
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, "/nonexistent/hybrid_trader_config.csv"));
    EXPECT_EQ(load_system_config(config, "/nonexistent/hybrid_trader_config.csv"), 1);
}

TEST(ConfigLoaderTest, LoadSystemConfigRejectsInvalidValues) {
    SystemConfig config;
    std::string config_path = write_temp_file("invalid.csv", "technical.lookback_period,1\n");
    EXPECT_EQ(load_system_config(config, config_path), 1);

    SystemConfig unparsable_config;
    std::string unparsable_path = write_temp_file("unparsable.csv", "macro.weight.policy_rate,three\n");
    EXPECT_EQ(load_system_config(unparsable_config, unparsable_path), 1);
}

TEST(ConfigLoaderTest, LoadSystemConfigAcceptsValidFile) {
    SystemConfig config;
    std::string config_path = write_temp_file("valid.csv", "technical.lookback_period,10\nallocation.high,70\n");
    EXPECT_EQ(load_system_config(config, config_path), 0);
    EXPECT_EQ(config.technical.lookback_period, 10);
}

TEST(ConfigLoaderTest, ShippedConfigurationIsValid) {
    SystemConfig config;
    EXPECT_EQ(load_system_config(config, std::string(HYBRID_TRADER_SOURCE_DIR) + "/config/system_config.csv"), 0);
    EXPECT_EQ(config.technical.lookback_period, 20);
    EXPECT_EQ(config.quotes.fx_rate_ticker, "INR=X");
    EXPECT_EQ(config.quotes.chart_query, "?range=5d&interval=1d");
}

TEST(ConfigLoaderTest, ValidationRejectsEachInvalidSetting) {
    std::string validation_error_message;

    SystemConfig short_lookback;
    short_lookback.technical.lookback_period = 1;
    EXPECT_FALSE(validate_config(short_lookback, validation_error_message));
    EXPECT_NE(validation_error_message.find("lookback_period"), std::string::npos);

    SystemConfig zero_threshold;
    zero_threshold.technical.zscore_buy_threshold = 0.0;
    EXPECT_FALSE(validate_config(zero_threshold, validation_error_message));

    SystemConfig inverted_thresholds;
    inverted_thresholds.macro.bullish_threshold = -3;
    EXPECT_FALSE(validate_config(inverted_thresholds, validation_error_message));

    SystemConfig negative_band;
    negative_band.macro.fx_rate_band_pct = -0.1;
    EXPECT_FALSE(validate_config(negative_band, validation_error_message));

    SystemConfig unordered_tiers;
    unordered_tiers.allocation.low_allocation_pct = 60.0;
    EXPECT_FALSE(validate_config(unordered_tiers, validation_error_message));

    SystemConfig oversized_tier;
    oversized_tier.allocation.high_allocation_pct = 101.0;
    EXPECT_FALSE(validate_config(oversized_tier, validation_error_message));

    SystemConfig no_capital;
    no_capital.trading.capital_base = 0.0;
    EXPECT_FALSE(validate_config(no_capital, validation_error_message));

    SystemConfig wide_stop;
    wide_stop.risk.stop_loss_pct = 50.0;
    EXPECT_FALSE(validate_config(wide_stop, validation_error_message));

    SystemConfig no_retries;
    no_retries.quotes.retries = 0;
    EXPECT_FALSE(validate_config(no_retries, validation_error_message));

    SystemConfig no_flush;
    no_flush.logging.flush_interval_ms = 0;
    EXPECT_FALSE(validate_config(no_flush, validation_error_message));
}

TEST(ConfigLoaderTest, AsymmetricSellThresholdOnlyWarns) {
    SystemConfig config;
    config.technical.zscore_sell_threshold = 1.5;
    std::string validation_error_message;
    EXPECT_TRUE(validate_config(config, validation_error_message));
}

TEST(ConfigLoaderTest, AsymmetricThresholdWarningIsLoggedOnceAtLoad) {
    std::string config_path = write_temp_file("asymmetric.csv",
        "technical.lookback_period,10\n"
        "technical.zscore_buy_threshold,-2.0\n"
        "technical.zscore_sell_threshold,2.5\n");
    const std::string warning_text = "zscore_sell_threshold magnitude differs";

    ::testing::internal::CaptureStderr();
    SystemConfig config;
    int load_result = load_system_config(config, config_path);
    HybridTrader::Core::TradingCoordinator trading_coordinator(config, nullptr);
    std::string captured_log = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(load_result, 0);
    size_t first_warning = captured_log.find(warning_text);
    ASSERT_NE(first_warning, std::string::npos);
    EXPECT_EQ(captured_log.find(warning_text, first_warning + 1), std::string::npos);
}

TEST(ConfigLoaderTest, ConfidenceLabelsAreConfigurable) {
    std::string config_path = write_temp_file("labels.csv",
        "allocation.confidence.high,STRONG\n"
        "allocation.confidence.medium,MODERATE\n"
        "allocation.confidence.low,WEAK\n");

    SystemConfig config;
    ASSERT_EQ(load_system_config(config, config_path), 0);
    EXPECT_EQ(config.allocation.high_confidence_label, "STRONG");
    EXPECT_EQ(config.allocation.medium_confidence_label, "MODERATE");
    EXPECT_EQ(config.allocation.low_confidence_label, "WEAK");

    EXPECT_THROW(apply_config_value(config, "allocation.confidence.high", ""), std::runtime_error);

    SystemConfig blank_label;
    blank_label.allocation.low_confidence_label = "";
    std::string validation_error_message;
    EXPECT_FALSE(validate_config(blank_label, validation_error_message));
}

TEST(ConfigLoaderTest, BooleanValuesIgnoreCaseAndNonAsciiBytes) {
    SystemConfig config;
    ASSERT_TRUE(apply_config_value(config, "quotes.enable_ssl_verification", "No"));
    EXPECT_FALSE(config.quotes.enable_ssl_verification);
    ASSERT_TRUE(apply_config_value(config, "quotes.enable_ssl_verification", "TRUE"));
    EXPECT_TRUE(config.quotes.enable_ssl_verification);
    ASSERT_TRUE(apply_config_value(config, "quotes.enable_ssl_verification", "Yes"));
    EXPECT_TRUE(config.quotes.enable_ssl_verification);
    ASSERT_TRUE(apply_config_value(config, "quotes.enable_ssl_verification", "\xC3\xA9t\xC3\xA9"));
    EXPECT_FALSE(config.quotes.enable_ssl_verification);
}
