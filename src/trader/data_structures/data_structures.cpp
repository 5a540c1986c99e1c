#include "data_structures.hpp"

namespace HybridTrader {
namespace Core {

std::string to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::BUY: return "BUY";
        case SignalKind::SELL: return "SELL";
        case SignalKind::NEUTRAL: return "NEUTRAL";
        case SignalKind::NO_DATA: return "NO_DATA";
    }
    return "NO_DATA";
}

std::string to_string(MacroCategory category) {
    switch (category) {
        case MacroCategory::BULLISH: return "BULLISH";
        case MacroCategory::NEUTRAL: return "NEUTRAL";
        case MacroCategory::BEARISH: return "BEARISH";
    }
    return "NEUTRAL";
}

std::string to_string(TradeAction action) {
    switch (action) {
        case TradeAction::BUY: return "BUY";
        case TradeAction::SELL: return "SELL";
        case TradeAction::NO_TRADE: return "NO_TRADE";
    }
    return "NO_TRADE";
}

std::string to_string(ConfidenceTier confidence) {
    switch (confidence) {
        case ConfidenceTier::HIGH: return "HIGH";
        case ConfidenceTier::MEDIUM: return "MEDIUM";
        case ConfidenceTier::LOW: return "LOW";
        case ConfidenceTier::NONE: return "NONE";
    }
    return "NONE";
}

std::string to_string(MacroFactorId factor_id) {
    switch (factor_id) {
        case MacroFactorId::POLICY_RATE: return "policy_rate";
        case MacroFactorId::CAPITAL_FLOW: return "capital_flow";
        case MacroFactorId::GLOBAL_INDEX: return "global_index";
        case MacroFactorId::FX_RATE: return "fx_rate";
        case MacroFactorId::VOLATILITY_INDEX: return "volatility_index";
    }
    return "unknown";
}

std::string polarity_label(int directional_change) {
    if (directional_change > 0) {
        return "Positive";
    }
    if (directional_change < 0) {
        return "Negative";
    }
    return "Neutral";
}

} // namespace Core
} // namespace HybridTrader
