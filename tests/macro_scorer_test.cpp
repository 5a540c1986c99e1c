#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "trader/strategy_analysis/macro_scorer.hpp"
#include "trader/strategy_analysis/decision_matrix.hpp"
#include "trader/market_data/macro_data_fetcher.hpp"
#include "trader/data_structures/trader_errors.hpp"

using namespace HybridTrader::Core;
using HybridTrader::Config::MacroConfig;
using HybridTrader::Config::QuotesConfig;
using HybridTrader::Testing::StubQuoteSource;

TEST(MacroScorerTest, FreshScorerIsNeutralWithFullBreakdown) {
    MacroScorer scorer{MacroConfig()};
    MacroSentiment sentiment = scorer.sentiment();

    EXPECT_EQ(sentiment.score, 0);
    EXPECT_EQ(sentiment.category, MacroCategory::NEUTRAL);
    ASSERT_EQ(sentiment.breakdown.size(), MACRO_FACTOR_COUNT);
    EXPECT_EQ(sentiment.breakdown[0].name, "policy_rate");
    EXPECT_EQ(sentiment.breakdown[1].name, "capital_flow");
    EXPECT_EQ(sentiment.breakdown[2].name, "global_index");
    EXPECT_EQ(sentiment.breakdown[3].name, "fx_rate");
    EXPECT_EQ(sentiment.breakdown[4].name, "volatility_index");
    for (const MacroFactorBreakdown& factor_breakdown : sentiment.breakdown) {
        EXPECT_FALSE(factor_breakdown.has_raw_value);
        EXPECT_EQ(factor_breakdown.polarity, "Neutral");
        EXPECT_EQ(factor_breakdown.contribution, 0);
    }
}

TEST(MacroScorerTest, PolicyRateCutIsBullishAndHikeBearish) {
    MacroScorer scorer{MacroConfig()};

    scorer.set_policy_rate(6.25, 6.5);
    EXPECT_EQ(scorer.factor(MacroFactorId::POLICY_RATE).directional_change, 1);
    EXPECT_EQ(scorer.score(), 3);

    scorer.set_policy_rate(6.75, 6.5);
    EXPECT_EQ(scorer.factor(MacroFactorId::POLICY_RATE).directional_change, -1);
    EXPECT_EQ(scorer.score(), -3);

    scorer.set_policy_rate(6.5, 6.5);
    EXPECT_EQ(scorer.score(), 0);
}

TEST(MacroScorerTest, PolicyRateWithoutPreviousIsNeutralButRecorded) {
    MacroScorer scorer{MacroConfig()};
    scorer.set_policy_rate(6.5);

    const MacroFactor& policy_factor = scorer.factor(MacroFactorId::POLICY_RATE);
    EXPECT_TRUE(policy_factor.has_raw_value);
    EXPECT_DOUBLE_EQ(policy_factor.raw_value, 6.5);
    EXPECT_EQ(policy_factor.directional_change, 0);
}

TEST(MacroScorerTest, CapitalFlowBandEdgesAreNeutral) {
    MacroScorer scorer{MacroConfig()};

    scorer.set_capital_flow(1500.0);
    EXPECT_EQ(scorer.factor(MacroFactorId::CAPITAL_FLOW).directional_change, 1);
    scorer.set_capital_flow(1000.0);
    EXPECT_EQ(scorer.factor(MacroFactorId::CAPITAL_FLOW).directional_change, 0);
    scorer.set_capital_flow(-1000.0);
    EXPECT_EQ(scorer.factor(MacroFactorId::CAPITAL_FLOW).directional_change, 0);
    scorer.set_capital_flow(-1000.01);
    EXPECT_EQ(scorer.factor(MacroFactorId::CAPITAL_FLOW).directional_change, -1);
}

TEST(MacroScorerTest, CurrencyAndFearGaugeAreInverted) {
    MacroScorer scorer{MacroConfig()};

    scorer.set_global_index_change(0.6);
    EXPECT_EQ(scorer.factor(MacroFactorId::GLOBAL_INDEX).directional_change, 1);
    EXPECT_DOUBLE_EQ(scorer.factor(MacroFactorId::GLOBAL_INDEX).raw_value, 0.6);

    scorer.set_fx_rate_change(0.31, 83.456);
    EXPECT_EQ(scorer.factor(MacroFactorId::FX_RATE).directional_change, -1);
    EXPECT_DOUBLE_EQ(scorer.factor(MacroFactorId::FX_RATE).raw_value, 83.46);
    scorer.set_fx_rate_change(-0.5);
    EXPECT_EQ(scorer.factor(MacroFactorId::FX_RATE).directional_change, 1);

    scorer.set_volatility_index_change(6.0, 14.2);
    EXPECT_EQ(scorer.factor(MacroFactorId::VOLATILITY_INDEX).directional_change, -1);
    scorer.set_volatility_index_change(-5.5, 12.9);
    EXPECT_EQ(scorer.factor(MacroFactorId::VOLATILITY_INDEX).directional_change, 1);
    scorer.set_volatility_index_change(5.0, 13.0);
    EXPECT_EQ(scorer.factor(MacroFactorId::VOLATILITY_INDEX).directional_change, 0);
}

TEST(MacroScorerTest, ScoreIsWeightedSumAndIdempotent) {
    MacroConfig macro_config;
    macro_config.fx_rate_weight = -2;
    MacroScorer scorer(macro_config);

    scorer.set_policy_rate(6.25, 6.5);      // +1 x 3
    scorer.set_capital_flow(-2500.0);       // -1 x 2
    scorer.set_fx_rate_change(-0.4);        // +1 x -2
    EXPECT_EQ(scorer.score(), 3 - 2 - 2);
    EXPECT_EQ(scorer.score(), scorer.score());

    MacroSentiment sentiment = scorer.sentiment();
    EXPECT_EQ(sentiment.breakdown[3].polarity, "Positive");
    EXPECT_EQ(sentiment.breakdown[3].contribution, -2);
    EXPECT_EQ(sentiment.breakdown[1].polarity, "Negative");
}

TEST(MacroScorerTest, CategoryThresholdsAreStrict) {
    MacroScorer scorer{MacroConfig()};
    EXPECT_EQ(scorer.categorize(3), MacroCategory::BULLISH);
    EXPECT_EQ(scorer.categorize(2), MacroCategory::NEUTRAL);
    EXPECT_EQ(scorer.categorize(-2), MacroCategory::NEUTRAL);
    EXPECT_EQ(scorer.categorize(-3), MacroCategory::BEARISH);
}

TEST(MacroScorerTest, BullishMacroWithBuySignalGivesHighConfidenceBuy) {
    MacroConfig macro_config;
    macro_config.bullish_threshold = 3;
    MacroScorer scorer(macro_config);
    scorer.set_policy_rate(6.25, 6.5);
    scorer.set_capital_flow(1500.0);

    MacroSentiment sentiment = scorer.sentiment();
    EXPECT_EQ(sentiment.score, 5);
    EXPECT_EQ(sentiment.category, MacroCategory::BULLISH);

    TechnicalSignal technical_signal;
    technical_signal.kind = SignalKind::BUY;
    technical_signal.has_statistics = true;
    technical_signal.zscore = -2.3;

    DecisionMatrix decision_matrix{HybridTrader::Config::AllocationConfig()};
    TradingDecision decision = decision_matrix.evaluate(technical_signal, sentiment);
    EXPECT_EQ(decision.action, TradeAction::BUY);
    EXPECT_EQ(decision.confidence, ConfidenceTier::HIGH);
}

TEST(MacroScorerTest, RejectsBearishAboveBullish) {
    MacroConfig macro_config;
    macro_config.bullish_threshold = -1;
    macro_config.bearish_threshold = 1;
    EXPECT_THROW(MacroScorer{macro_config}, ConfigurationError);
}

TEST(MacroScorerTest, FetchFailureLeavesFactorNeutralAndOthersScored) {
    QuotesConfig quotes_config;
    StubQuoteSource quote_source;
    quote_source.closes_by_ticker[quotes_config.global_index_ticker] = {5000.0, 5050.0};       // +1%
    quote_source.failing_tickers[quotes_config.fx_rate_ticker] = "connection refused";
    quote_source.closes_by_ticker[quotes_config.volatility_index_ticker] = {20.0, 22.0};     // +10%
    MacroDataFetcher data_fetcher(quote_source, quotes_config);

    MacroScorer scorer{MacroConfig()};
    scorer.set_fx_rate_change(-1.0, 82.0);
    std::vector<FactorFetchResult> fetch_results;
    int successful_fetch_count = scorer.fetch_all_auto_factors(data_fetcher, fetch_results);

    EXPECT_EQ(successful_fetch_count, 2);
    ASSERT_EQ(fetch_results.size(), 3u);
    EXPECT_TRUE(fetch_results[0].success);
    EXPECT_FALSE(fetch_results[1].success);
    EXPECT_NE(fetch_results[1].error_message.find("connection refused"), std::string::npos);
    EXPECT_TRUE(fetch_results[2].success);

    EXPECT_EQ(scorer.factor(MacroFactorId::GLOBAL_INDEX).directional_change, 1);
    EXPECT_DOUBLE_EQ(scorer.factor(MacroFactorId::GLOBAL_INDEX).raw_value, 1.0);
    EXPECT_EQ(scorer.factor(MacroFactorId::FX_RATE).directional_change, 0);
    EXPECT_FALSE(scorer.factor(MacroFactorId::FX_RATE).has_raw_value);
    EXPECT_EQ(scorer.factor(MacroFactorId::VOLATILITY_INDEX).directional_change, -1);
    EXPECT_DOUBLE_EQ(scorer.factor(MacroFactorId::VOLATILITY_INDEX).raw_value, 22.0);
    EXPECT_EQ(scorer.score(), 0);
}
