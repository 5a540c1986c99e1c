#include <gtest/gtest.h>
#include "trader/strategy_analysis/decision_matrix.hpp"
#include "trader/data_structures/trader_errors.hpp"

using namespace HybridTrader::Core;
using HybridTrader::Config::AllocationConfig;

namespace {
TechnicalSignal make_signal(SignalKind kind, double zscore) {
    TechnicalSignal technical_signal;
    technical_signal.kind = kind;
    technical_signal.has_statistics = kind != SignalKind::NO_DATA;
    technical_signal.zscore = zscore;
    return technical_signal;
}

MacroSentiment make_sentiment(MacroCategory category, int score) {
    MacroSentiment macro_sentiment;
    macro_sentiment.category = category;
    macro_sentiment.score = score;
    return macro_sentiment;
}

struct MatrixCase {
    SignalKind kind;
    MacroCategory category;
    TradeAction expected_action;
    ConfidenceTier expected_confidence;
};
}

TEST(DecisionMatrixTest, EveryCombinationMapsToExactlyOneAction) {
    const MatrixCase matrix_cases[] = {
        {SignalKind::BUY, MacroCategory::BULLISH, TradeAction::BUY, ConfidenceTier::HIGH},
        {SignalKind::BUY, MacroCategory::NEUTRAL, TradeAction::BUY, ConfidenceTier::MEDIUM},
        {SignalKind::BUY, MacroCategory::BEARISH, TradeAction::BUY, ConfidenceTier::LOW},
        {SignalKind::SELL, MacroCategory::BEARISH, TradeAction::SELL, ConfidenceTier::HIGH},
        {SignalKind::SELL, MacroCategory::NEUTRAL, TradeAction::SELL, ConfidenceTier::MEDIUM},
        {SignalKind::SELL, MacroCategory::BULLISH, TradeAction::SELL, ConfidenceTier::LOW},
        {SignalKind::NEUTRAL, MacroCategory::BULLISH, TradeAction::NO_TRADE, ConfidenceTier::NONE},
        {SignalKind::NEUTRAL, MacroCategory::NEUTRAL, TradeAction::NO_TRADE, ConfidenceTier::NONE},
        {SignalKind::NEUTRAL, MacroCategory::BEARISH, TradeAction::NO_TRADE, ConfidenceTier::NONE},
        {SignalKind::NO_DATA, MacroCategory::BULLISH, TradeAction::NO_TRADE, ConfidenceTier::NONE},
        {SignalKind::NO_DATA, MacroCategory::NEUTRAL, TradeAction::NO_TRADE, ConfidenceTier::NONE},
        {SignalKind::NO_DATA, MacroCategory::BEARISH, TradeAction::NO_TRADE, ConfidenceTier::NONE},
    };

    DecisionMatrix decision_matrix{AllocationConfig()};
    for (const MatrixCase& matrix_case : matrix_cases) {
        TradingDecision decision = decision_matrix.evaluate(make_signal(matrix_case.kind, 0.0), make_sentiment(matrix_case.category, 0));
        SCOPED_TRACE(to_string(matrix_case.kind) + " x " + to_string(matrix_case.category));
        EXPECT_EQ(decision.action, matrix_case.expected_action);
        EXPECT_EQ(decision.confidence, matrix_case.expected_confidence);
        EXPECT_DOUBLE_EQ(decision.allocation_pct, decision_matrix.allocation_for(matrix_case.expected_confidence));
        EXPECT_FALSE(decision.risk_metrics.is_active);
    }
}

TEST(DecisionMatrixTest, AllocationComesFromConfiguredTiers) {
    AllocationConfig allocation_config;
    allocation_config.high_allocation_pct = 60.0;
    allocation_config.medium_allocation_pct = 40.0;
    allocation_config.low_allocation_pct = 10.0;
    DecisionMatrix decision_matrix(allocation_config);

    EXPECT_DOUBLE_EQ(decision_matrix.evaluate(make_signal(SignalKind::BUY, -2.4), make_sentiment(MacroCategory::BULLISH, 4)).allocation_pct, 60.0);
    EXPECT_DOUBLE_EQ(decision_matrix.evaluate(make_signal(SignalKind::SELL, 2.4), make_sentiment(MacroCategory::NEUTRAL, 0)).allocation_pct, 40.0);
    EXPECT_DOUBLE_EQ(decision_matrix.evaluate(make_signal(SignalKind::SELL, 2.4), make_sentiment(MacroCategory::BULLISH, 3)).allocation_pct, 10.0);
    EXPECT_DOUBLE_EQ(decision_matrix.evaluate(make_signal(SignalKind::NEUTRAL, 0.1), make_sentiment(MacroCategory::BULLISH, 3)).allocation_pct, 0.0);
}

TEST(DecisionMatrixTest, ReasoningCitesTechnicalMacroAndAgreement) {
    DecisionMatrix decision_matrix{AllocationConfig()};

    TradingDecision aligned = decision_matrix.evaluate(make_signal(SignalKind::BUY, -2.3), make_sentiment(MacroCategory::BULLISH, 4));
    ASSERT_EQ(aligned.reasoning.size(), 3u);
    EXPECT_EQ(aligned.reasoning[0], "Technical: Price oversold (Z-score: -2.30)");
    EXPECT_EQ(aligned.reasoning[1], "Macro: Strong bullish sentiment (Score: 4)");
    EXPECT_EQ(aligned.reasoning[2], "Both signals aligned - HIGH confidence trade");

    TradingDecision conflicting = decision_matrix.evaluate(make_signal(SignalKind::SELL, 2.7), make_sentiment(MacroCategory::BULLISH, 3));
    ASSERT_EQ(conflicting.reasoning.size(), 3u);
    EXPECT_EQ(conflicting.reasoning[0], "Technical: Price overbought (Z-score: 2.70)");
    EXPECT_EQ(conflicting.reasoning[1], "Macro: Bullish sentiment (Score: 3)");
    EXPECT_EQ(conflicting.reasoning[2], "Conflicting signals - LOW confidence trade");

    TradingDecision mixed = decision_matrix.evaluate(make_signal(SignalKind::BUY, -2.1), make_sentiment(MacroCategory::NEUTRAL, 1));
    EXPECT_EQ(mixed.reasoning[2], "Mixed signals - MEDIUM confidence trade");
}

TEST(DecisionMatrixTest, NoTradeOmitsMacroLine) {
    DecisionMatrix decision_matrix{AllocationConfig()};
    TradingDecision decision = decision_matrix.evaluate(make_signal(SignalKind::NEUTRAL, 0.5), make_sentiment(MacroCategory::BULLISH, 5));

    ASSERT_EQ(decision.reasoning.size(), 2u);
    EXPECT_EQ(decision.reasoning[0], "Technical: Price near equilibrium - no clear signal");
    EXPECT_EQ(decision.reasoning[1], "No trade opportunity identified");
    EXPECT_EQ(decision.macro_input.score, 5);
}

TEST(DecisionMatrixTest, IdenticalInputsGiveIdenticalDecisions) {
    DecisionMatrix decision_matrix{AllocationConfig()};
    TechnicalSignal signal = make_signal(SignalKind::SELL, 2.2);
    MacroSentiment sentiment = make_sentiment(MacroCategory::BEARISH, -4);

    TradingDecision first_decision = decision_matrix.evaluate(signal, sentiment);
    TradingDecision second_decision = decision_matrix.evaluate(signal, sentiment);
    EXPECT_EQ(first_decision.action, second_decision.action);
    EXPECT_EQ(first_decision.confidence, second_decision.confidence);
    EXPECT_EQ(first_decision.reasoning, second_decision.reasoning);
}

TEST(DecisionMatrixTest, ConfiguredConfidenceLabelsAreAttachedToTiers) {
    AllocationConfig allocation_config;
    allocation_config.high_confidence_label = "STRONG";
    allocation_config.medium_confidence_label = "MODERATE";
    allocation_config.low_confidence_label = "WEAK";
    DecisionMatrix decision_matrix(allocation_config);

    TradingDecision aligned = decision_matrix.evaluate(make_signal(SignalKind::BUY, -2.3), make_sentiment(MacroCategory::BULLISH, 4));
    EXPECT_EQ(aligned.confidence, ConfidenceTier::HIGH);
    EXPECT_EQ(aligned.confidence_label, "STRONG");
    EXPECT_EQ(aligned.reasoning.back(), "Both signals aligned - STRONG confidence trade");

    TradingDecision mixed = decision_matrix.evaluate(make_signal(SignalKind::SELL, 2.3), make_sentiment(MacroCategory::NEUTRAL, 0));
    EXPECT_EQ(mixed.confidence_label, "MODERATE");

    TradingDecision conflicting = decision_matrix.evaluate(make_signal(SignalKind::SELL, 2.3), make_sentiment(MacroCategory::BULLISH, 3));
    EXPECT_EQ(conflicting.confidence_label, "WEAK");

    TradingDecision no_trade = decision_matrix.evaluate(make_signal(SignalKind::NEUTRAL, 0.2), make_sentiment(MacroCategory::BULLISH, 3));
    EXPECT_EQ(no_trade.confidence_label, "NONE");

    EXPECT_EQ(DecisionMatrix{AllocationConfig()}.confidence_label_for(ConfidenceTier::MEDIUM), "MEDIUM");
}

TEST(DecisionMatrixTest, RejectsUnorderedTiers) {
    AllocationConfig allocation_config;
    allocation_config.medium_allocation_pct = 90.0;
    EXPECT_THROW(DecisionMatrix{allocation_config}, ConfigurationError);

    AllocationConfig out_of_range;
    out_of_range.high_allocation_pct = 120.0;
    EXPECT_THROW(DecisionMatrix{out_of_range}, ConfigurationError);

    AllocationConfig unlabeled;
    unlabeled.medium_confidence_label = "";
    EXPECT_THROW(DecisionMatrix{unlabeled}, ConfigurationError);
}
