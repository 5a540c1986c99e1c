#ifndef TRADING_COORDINATOR_HPP
#define TRADING_COORDINATOR_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/rolling_statistics.hpp"
#include "trader/strategy_analysis/signal_classifier.hpp"
#include "trader/strategy_analysis/macro_scorer.hpp"
#include "trader/strategy_analysis/decision_matrix.hpp"
#include "trader/strategy_analysis/risk_calculator.hpp"
#include "trader/trading_logic/order_builder.hpp"
#include "trader/market_data/macro_data_fetcher.hpp"
#include <optional>
#include <vector>

namespace HybridTrader {
namespace Core {

using Config::SystemConfig;

// Macro values supplied by the caller. Absent auto factors are fetched when a fetcher is available.
struct MacroInputs {
    std::optional<double> policy_rate;
    std::optional<double> previous_policy_rate;
    std::optional<double> capital_flow;
    std::optional<double> global_index_change_pct;
    std::optional<double> fx_rate_change_pct;
    std::optional<double> fx_rate_quote;
    std::optional<double> volatility_index_change_pct;
    std::optional<double> volatility_index_level;
};

struct AnalysisResult {
    std::vector<WindowedStat> windowed_stats;
    TechnicalSignal technical_signal;
    std::vector<FactorFetchResult> fetch_results;
    MacroSentiment macro_sentiment;
    TradingDecision decision;
    std::optional<TradeOrder> order;
};

/**
 * TradingCoordinator - runs one decision pipeline in data-flow order:
 *   prices -> stats -> technical signal; macro inputs -> sentiment;
 *   (signal, sentiment) -> decision -> risk metrics -> order.
 * Expects a configuration already checked by load_system_config; each stage still
 * rejects values it cannot work with.
 */
class TradingCoordinator {
public:
    // macro_data_fetcher may be null (offline): auto factors then use overrides or stay neutral.
    TradingCoordinator(const SystemConfig& system_config, const MacroDataFetcher* macro_data_fetcher);

    AnalysisResult run_analysis(const std::vector<PricePoint>& price_series, const MacroInputs& macro_inputs) const;

private:
    const SystemConfig& config;
    const MacroDataFetcher* data_fetcher;
    RollingStatEngine rolling_stat_engine;
    SignalClassifier signal_classifier;
    DecisionMatrix decision_matrix;
    RiskCalculator risk_calculator;
    OrderBuilder order_builder;

    TechnicalSignal run_technical_stage(const std::vector<PricePoint>& price_series, AnalysisResult& analysis_result) const;
    MacroSentiment run_macro_stage(const MacroInputs& macro_inputs, AnalysisResult& analysis_result) const;
    void apply_auto_factors(MacroScorer& macro_scorer, const MacroInputs& macro_inputs, AnalysisResult& analysis_result) const;
};

} // namespace Core
} // namespace HybridTrader

#endif // TRADING_COORDINATOR_HPP
