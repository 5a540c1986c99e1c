#include "decision_matrix.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include "utils/format_utils.hpp"
#include <cmath>
#include <string>

namespace HybridTrader {
namespace Core {

namespace {
    bool is_valid_percentage(double value) {
        return std::isfinite(value) && value >= 0.0 && value <= 100.0;
    }

    std::string score_text(int macro_score) {
        return "(Score: " + std::to_string(macro_score) + ")";
    }

    std::string agreement_line(ConfidenceTier confidence, const std::string& confidence_label) {
        switch (confidence) {
            case ConfidenceTier::HIGH: return "Both signals aligned - " + confidence_label + " confidence trade";
            case ConfidenceTier::MEDIUM: return "Mixed signals - " + confidence_label + " confidence trade";
            case ConfidenceTier::LOW: return "Conflicting signals - " + confidence_label + " confidence trade";
            case ConfidenceTier::NONE: break;
        }
        return "No trade opportunity identified";
    }
}

DecisionMatrix::DecisionMatrix(const Config::AllocationConfig& allocation_config) : allocation(allocation_config) {
    if (!is_valid_percentage(allocation.high_allocation_pct) ||
        !is_valid_percentage(allocation.medium_allocation_pct) ||
        !is_valid_percentage(allocation.low_allocation_pct)) {
        throw ConfigurationError("allocation tiers must be within [0, 100]");
    }
    if (allocation.high_allocation_pct < allocation.medium_allocation_pct ||
        allocation.medium_allocation_pct < allocation.low_allocation_pct) {
        throw ConfigurationError("allocation tiers must satisfy high >= medium >= low");
    }
    if (allocation.high_confidence_label.empty() || allocation.medium_confidence_label.empty() ||
        allocation.low_confidence_label.empty()) {
        throw ConfigurationError("allocation confidence labels cannot be empty");
    }
}

double DecisionMatrix::allocation_for(ConfidenceTier confidence) const {
    switch (confidence) {
        case ConfidenceTier::HIGH: return allocation.high_allocation_pct;
        case ConfidenceTier::MEDIUM: return allocation.medium_allocation_pct;
        case ConfidenceTier::LOW: return allocation.low_allocation_pct;
        case ConfidenceTier::NONE: break;
    }
    return 0.0;
}

std::string DecisionMatrix::confidence_label_for(ConfidenceTier confidence) const {
    switch (confidence) {
        case ConfidenceTier::HIGH: return allocation.high_confidence_label;
        case ConfidenceTier::MEDIUM: return allocation.medium_confidence_label;
        case ConfidenceTier::LOW: return allocation.low_confidence_label;
        case ConfidenceTier::NONE: break;
    }
    return to_string(ConfidenceTier::NONE);
}

TradingDecision DecisionMatrix::evaluate(const TechnicalSignal& technical_signal, const MacroSentiment& macro_sentiment) const {
    TradingDecision trading_decision;
    trading_decision.technical_input = technical_signal;
    trading_decision.macro_input = macro_sentiment;

    const std::string zscore_text = FormatUtils::format_fixed(technical_signal.zscore, 2);
    const MacroCategory macro_category = macro_sentiment.category;

    if (technical_signal.kind == SignalKind::BUY) {
        trading_decision.action = TradeAction::BUY;
        trading_decision.reasoning.push_back("Technical: Price oversold (Z-score: " + zscore_text + ")");
        if (macro_category == MacroCategory::BULLISH) {
            trading_decision.confidence = ConfidenceTier::HIGH;
            trading_decision.reasoning.push_back("Macro: Strong bullish sentiment " + score_text(macro_sentiment.score));
        } else if (macro_category == MacroCategory::NEUTRAL) {
            trading_decision.confidence = ConfidenceTier::MEDIUM;
            trading_decision.reasoning.push_back("Macro: Neutral sentiment " + score_text(macro_sentiment.score));
        } else {
            trading_decision.confidence = ConfidenceTier::LOW;
            trading_decision.reasoning.push_back("Macro: Bearish sentiment " + score_text(macro_sentiment.score));
        }
    } else if (technical_signal.kind == SignalKind::SELL) {
        trading_decision.action = TradeAction::SELL;
        trading_decision.reasoning.push_back("Technical: Price overbought (Z-score: " + zscore_text + ")");
        if (macro_category == MacroCategory::BEARISH) {
            trading_decision.confidence = ConfidenceTier::HIGH;
            trading_decision.reasoning.push_back("Macro: Strong bearish sentiment " + score_text(macro_sentiment.score));
        } else if (macro_category == MacroCategory::NEUTRAL) {
            trading_decision.confidence = ConfidenceTier::MEDIUM;
            trading_decision.reasoning.push_back("Macro: Neutral sentiment " + score_text(macro_sentiment.score));
        } else {
            trading_decision.confidence = ConfidenceTier::LOW;
            trading_decision.reasoning.push_back("Macro: Bullish sentiment " + score_text(macro_sentiment.score));
        }
    } else {
        // NEUTRAL and NO_DATA both end here
        trading_decision.action = TradeAction::NO_TRADE;
        trading_decision.confidence = ConfidenceTier::NONE;
        if (technical_signal.kind == SignalKind::NO_DATA) {
            trading_decision.reasoning.push_back("Technical: Insufficient data - no clear signal");
        } else {
            trading_decision.reasoning.push_back("Technical: Price near equilibrium - no clear signal");
        }
    }

    trading_decision.allocation_pct = allocation_for(trading_decision.confidence);
    trading_decision.confidence_label = confidence_label_for(trading_decision.confidence);
    trading_decision.reasoning.push_back(agreement_line(trading_decision.confidence, trading_decision.confidence_label));
    return trading_decision;
}

} // namespace Core
} // namespace HybridTrader
