#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace HybridTrader {
namespace Core {

// ========================================================================
// PRICE SERIES
// ========================================================================

struct PricePoint {
    std::string date;                  // ISO YYYY-MM-DD, lexicographic order is chronological
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;

    PricePoint() : date(""), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0) {}
    PricePoint(const std::string& date_value, double open_value, double high_value, double low_value, double close_value, double volume_value)
        : date(date_value), open_price(open_value), high_price(high_value), low_price(low_value),
          close_price(close_value), volume(volume_value) {}
};

// Rolling statistics for one point. When is_defined is false every numeric field is meaningless.
struct WindowedStat {
    bool is_defined;
    double rolling_mean;
    double rolling_std;
    double zscore;
    double deviation;
    double deviation_pct;
    bool has_deviation_pct;            // false when the rolling mean is zero

    WindowedStat()
        : is_defined(false), rolling_mean(0.0), rolling_std(0.0), zscore(0.0), deviation(0.0),
          deviation_pct(0.0), has_deviation_pct(false) {}

    static WindowedStat undefined() { return WindowedStat(); }
};

// ========================================================================
// TECHNICAL SIGNAL
// ========================================================================

enum class SignalKind { BUY, SELL, NEUTRAL, NO_DATA };

struct TechnicalSignal {
    SignalKind kind;
    bool has_statistics;               // false for NO_DATA: zscore/mean/deviation are null
    double zscore;
    double current_price;
    double mean_price;
    double deviation;
    double deviation_pct;
    bool has_deviation_pct;
    std::string reason;

    TechnicalSignal()
        : kind(SignalKind::NO_DATA), has_statistics(false), zscore(0.0), current_price(0.0),
          mean_price(0.0), deviation(0.0), deviation_pct(0.0), has_deviation_pct(false), reason("") {}
};

// ========================================================================
// MACRO FACTORS
// ========================================================================

enum class MacroFactorId : std::size_t {
    POLICY_RATE = 0,
    CAPITAL_FLOW,
    GLOBAL_INDEX,
    FX_RATE,
    VOLATILITY_INDEX
};

constexpr std::size_t MACRO_FACTOR_COUNT = 5;

constexpr std::array<MacroFactorId, MACRO_FACTOR_COUNT> ALL_MACRO_FACTORS = {{
    MacroFactorId::POLICY_RATE,
    MacroFactorId::CAPITAL_FLOW,
    MacroFactorId::GLOBAL_INDEX,
    MacroFactorId::FX_RATE,
    MacroFactorId::VOLATILITY_INDEX
}};

struct MacroFactor {
    MacroFactorId id;
    std::string name;
    bool has_raw_value;
    double raw_value;
    int directional_change;            // -1, 0 or +1
    int weight;

    MacroFactor() : id(MacroFactorId::POLICY_RATE), name(""), has_raw_value(false), raw_value(0.0), directional_change(0), weight(0) {}

    int contribution() const { return directional_change * weight; }
};

enum class MacroCategory { BULLISH, NEUTRAL, BEARISH };

struct MacroFactorBreakdown {
    std::string name;
    bool has_raw_value;
    double raw_value;
    std::string polarity;              // Positive / Neutral / Negative
    int contribution;

    MacroFactorBreakdown() : name(""), has_raw_value(false), raw_value(0.0), polarity("Neutral"), contribution(0) {}
};

struct MacroSentiment {
    MacroCategory category;
    int score;
    std::vector<MacroFactorBreakdown> breakdown;   // Registry order

    MacroSentiment() : category(MacroCategory::NEUTRAL), score(0), breakdown() {}
};

// Outcome of one auto-fetched factor. A failed fetch leaves the factor neutral.
struct FactorFetchResult {
    MacroFactorId factor_id;
    bool success;
    double percentage_change;          // Latest session vs prior session, in percent
    double latest_close;
    std::string error_message;

    FactorFetchResult() : factor_id(MacroFactorId::GLOBAL_INDEX), success(false), percentage_change(0.0), latest_close(0.0), error_message("") {}
};

// ========================================================================
// DECISION, RISK AND ORDER
// ========================================================================

enum class TradeAction { BUY, SELL, NO_TRADE };

enum class ConfidenceTier { HIGH, MEDIUM, LOW, NONE };

struct RiskMetrics {
    bool is_active;                    // false for NO_TRADE: prices null, amounts zero
    double entry_price;
    double stop_loss;
    double target;
    double capital_allocated;
    double capital_at_risk;
    std::string risk_reward_ratio;

    RiskMetrics() : is_active(false), entry_price(0.0), stop_loss(0.0), target(0.0), capital_allocated(0.0), capital_at_risk(0.0), risk_reward_ratio("") {}
};

struct TradingDecision {
    TradeAction action;
    double allocation_pct;
    ConfidenceTier confidence;
    std::string confidence_label;      // configured label of the tier, "NONE" for NO_TRADE
    std::vector<std::string> reasoning;
    TechnicalSignal technical_input;
    MacroSentiment macro_input;
    RiskMetrics risk_metrics;

    TradingDecision()
        : action(TradeAction::NO_TRADE), allocation_pct(0.0), confidence(ConfidenceTier::NONE),
          confidence_label("NONE"), reasoning(), technical_input(), macro_input(), risk_metrics() {}
};

struct TradeOrder {
    std::string symbol;
    TradeAction action;
    std::string order_type;
    long long quantity;
    double entry_price;
    double stop_loss;
    double target;
    std::string exit_time;
    ConfidenceTier confidence;
    std::string confidence_label;
    double technical_zscore;
    int macro_score;

    TradeOrder()
        : symbol(""), action(TradeAction::NO_TRADE), order_type(""), quantity(0), entry_price(0.0),
          stop_loss(0.0), target(0.0), exit_time(""), confidence(ConfidenceTier::NONE),
          confidence_label("NONE"), technical_zscore(0.0), macro_score(0) {}
};

// Parameter structure for risk calculation
struct RiskCalculationRequest {
    TradeAction action;
    double current_price;
    double allocation_pct;
    double capital_base;
    double stop_loss_pct;

    RiskCalculationRequest(TradeAction action_value, double price_value, double allocation_value, double capital_base_value, double stop_loss_value)
        : action(action_value), current_price(price_value), allocation_pct(allocation_value),
          capital_base(capital_base_value), stop_loss_pct(stop_loss_value) {}
};

// ========================================================================
// LABELS
// ========================================================================

std::string to_string(SignalKind kind);
std::string to_string(MacroCategory category);
std::string to_string(TradeAction action);
std::string to_string(ConfidenceTier confidence);
std::string to_string(MacroFactorId factor_id);
std::string polarity_label(int directional_change);

} // namespace Core
} // namespace HybridTrader

#endif // DATA_STRUCTURES_HPP
