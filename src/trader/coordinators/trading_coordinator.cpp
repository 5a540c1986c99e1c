#include "trading_coordinator.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/report_layout.hpp"
#include "logging/logs/technical_logs.hpp"
#include "logging/logs/macro_logs.hpp"
#include "logging/logs/decision_logs.hpp"

namespace HybridTrader {
namespace Core {

using HybridTrader::Logging::log_message;
using HybridTrader::Logging::log_stage_banner;
using HybridTrader::Logging::TechnicalLogs;
using HybridTrader::Logging::MacroLogs;
using HybridTrader::Logging::DecisionLogs;

namespace {
    constexpr int PIPELINE_STAGE_COUNT = 4;
}

TradingCoordinator::TradingCoordinator(const SystemConfig& system_config, const MacroDataFetcher* macro_data_fetcher)
    : config(system_config),
      data_fetcher(macro_data_fetcher),
      rolling_stat_engine(config.technical),
      signal_classifier(config.technical),
      decision_matrix(config.allocation),
      risk_calculator(config.trading, config.risk),
      order_builder(config.trading, config.risk) {}

AnalysisResult TradingCoordinator::run_analysis(const std::vector<PricePoint>& price_series, const MacroInputs& macro_inputs) const {
    AnalysisResult analysis_result;

    log_stage_banner(1, PIPELINE_STAGE_COUNT, "TECHNICAL ANALYSIS - MEAN REVERSION");
    analysis_result.technical_signal = run_technical_stage(price_series, analysis_result);

    log_stage_banner(2, PIPELINE_STAGE_COUNT, "MACRO ANALYSIS - FACTOR SCORING");
    analysis_result.macro_sentiment = run_macro_stage(macro_inputs, analysis_result);

    log_stage_banner(3, PIPELINE_STAGE_COUNT, "DECISION MATRIX - CAPITAL ALLOCATION");
    analysis_result.decision = decision_matrix.evaluate(analysis_result.technical_signal, analysis_result.macro_sentiment);
    analysis_result.decision.risk_metrics = risk_calculator.calculate(analysis_result.decision, analysis_result.technical_signal.current_price);
    DecisionLogs::log_trading_decision(analysis_result.decision);
    DecisionLogs::log_risk_metrics(analysis_result.decision.risk_metrics);

    log_stage_banner(4, PIPELINE_STAGE_COUNT, "TRADE ORDER");
    analysis_result.order = order_builder.build(analysis_result.decision);
    if (analysis_result.order && analysis_result.order->quantity == 0) {
        DecisionLogs::log_zero_quantity_warning(*analysis_result.order, analysis_result.decision.risk_metrics.capital_allocated);
    }
    DecisionLogs::log_trade_order(analysis_result.order);

    return analysis_result;
}

TechnicalSignal TradingCoordinator::run_technical_stage(const std::vector<PricePoint>& price_series, AnalysisResult& analysis_result) const {
    analysis_result.windowed_stats = rolling_stat_engine.compute(price_series);

    if (price_series.size() < static_cast<size_t>(rolling_stat_engine.get_lookback_period())) {
        TechnicalLogs::log_insufficient_history(price_series.size(), rolling_stat_engine.get_lookback_period());
    }

    WindowedStat latest_stat = analysis_result.windowed_stats.empty() ? WindowedStat::undefined() : analysis_result.windowed_stats.back();
    double current_price = price_series.empty() ? 0.0 : price_series.back().close_price;
    TechnicalSignal technical_signal = signal_classifier.classify(latest_stat, current_price);

    TechnicalLogs::log_indicator_history(price_series, analysis_result.windowed_stats, config.data.history_display_rows);
    TechnicalLogs::log_technical_signal(technical_signal, rolling_stat_engine.get_lookback_period(), signal_classifier.get_threshold());
    return technical_signal;
}

MacroSentiment TradingCoordinator::run_macro_stage(const MacroInputs& macro_inputs, AnalysisResult& analysis_result) const {
    MacroScorer macro_scorer(config.macro);

    if (macro_inputs.policy_rate) {
        if (macro_inputs.previous_policy_rate) {
            macro_scorer.set_policy_rate(*macro_inputs.policy_rate, *macro_inputs.previous_policy_rate);
        } else {
            macro_scorer.set_policy_rate(*macro_inputs.policy_rate);
        }
    }
    if (macro_inputs.capital_flow) {
        macro_scorer.set_capital_flow(*macro_inputs.capital_flow);
    }

    apply_auto_factors(macro_scorer, macro_inputs, analysis_result);

    MacroSentiment macro_sentiment = macro_scorer.sentiment();
    MacroLogs::log_macro_sentiment(macro_sentiment);
    return macro_sentiment;
}

void TradingCoordinator::apply_auto_factors(MacroScorer& macro_scorer, const MacroInputs& macro_inputs, AnalysisResult& analysis_result) const {
    bool has_any_override = macro_inputs.global_index_change_pct || macro_inputs.fx_rate_change_pct || macro_inputs.volatility_index_change_pct;

    if (data_fetcher && !has_any_override) {
        int successful_fetch_count = macro_scorer.fetch_all_auto_factors(*data_fetcher, analysis_result.fetch_results);
        log_message("Auto-fetched " + std::to_string(successful_fetch_count) + " of " +
                    std::to_string(analysis_result.fetch_results.size()) + " macro factors");
        MacroLogs::log_fetch_results(analysis_result.fetch_results);
        return;
    }

    if (!data_fetcher) {
        MacroLogs::log_offline_mode();
    }

    if (macro_inputs.global_index_change_pct) {
        macro_scorer.set_global_index_change(*macro_inputs.global_index_change_pct);
    } else if (data_fetcher) {
        analysis_result.fetch_results.push_back(macro_scorer.fetch_global_index(*data_fetcher));
    }

    if (macro_inputs.fx_rate_change_pct) {
        if (macro_inputs.fx_rate_quote) {
            macro_scorer.set_fx_rate_change(*macro_inputs.fx_rate_change_pct, *macro_inputs.fx_rate_quote);
        } else {
            macro_scorer.set_fx_rate_change(*macro_inputs.fx_rate_change_pct);
        }
    } else if (data_fetcher) {
        analysis_result.fetch_results.push_back(macro_scorer.fetch_fx_rate(*data_fetcher));
    }

    if (macro_inputs.volatility_index_change_pct) {
        if (macro_inputs.volatility_index_level) {
            macro_scorer.set_volatility_index_change(*macro_inputs.volatility_index_change_pct, *macro_inputs.volatility_index_level);
        } else {
            macro_scorer.set_volatility_index_change(*macro_inputs.volatility_index_change_pct);
        }
    } else if (data_fetcher) {
        analysis_result.fetch_results.push_back(macro_scorer.fetch_volatility_index(*data_fetcher));
    }

    if (!analysis_result.fetch_results.empty()) {
        MacroLogs::log_fetch_results(analysis_result.fetch_results);
    }
}

} // namespace Core
} // namespace HybridTrader
