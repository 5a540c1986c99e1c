#include "macro_scorer.hpp"
#include "trader/market_data/macro_data_fetcher.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/format_utils.hpp"
#include <cmath>
#include <string>

namespace HybridTrader {
namespace Core {

using HybridTrader::Logging::log_message;

int band_vote(double value, double band) {
    if (value > band) return 1;
    if (value < -band) return -1;
    return 0;
}

MacroScorer::MacroScorer(const Config::MacroConfig& macro_config)
    : factors(),
      bullish_threshold(macro_config.bullish_threshold),
      bearish_threshold(macro_config.bearish_threshold),
      capital_flow_band(macro_config.capital_flow_band),
      global_index_band_pct(macro_config.global_index_band_pct),
      fx_rate_band_pct(macro_config.fx_rate_band_pct),
      volatility_index_band_pct(macro_config.volatility_index_band_pct) {
    if (bearish_threshold > bullish_threshold) {
        throw ConfigurationError("macro.threshold.bearish (" + std::to_string(bearish_threshold) +
                                 ") must be <= macro.threshold.bullish (" + std::to_string(bullish_threshold) + ")");
    }

    const std::array<int, MACRO_FACTOR_COUNT> factor_weights = {{
        macro_config.policy_rate_weight,
        macro_config.capital_flow_weight,
        macro_config.global_index_weight,
        macro_config.fx_rate_weight,
        macro_config.volatility_index_weight
    }};
    for (MacroFactorId factor_id : ALL_MACRO_FACTORS) {
        MacroFactor& factor_slot = slot(factor_id);
        factor_slot.id = factor_id;
        factor_slot.name = to_string(factor_id);
        factor_slot.weight = factor_weights[static_cast<size_t>(factor_id)];
    }
}

MacroFactor& MacroScorer::slot(MacroFactorId factor_id) {
    return factors[static_cast<size_t>(factor_id)];
}

const MacroFactor& MacroScorer::factor(MacroFactorId factor_id) const {
    return factors[static_cast<size_t>(factor_id)];
}

void MacroScorer::set_factor(MacroFactorId factor_id, double raw_value, int directional_change) {
    MacroFactor& factor_slot = slot(factor_id);
    factor_slot.has_raw_value = true;
    factor_slot.raw_value = raw_value;
    factor_slot.directional_change = directional_change;
}

void MacroScorer::reset_factor(MacroFactorId factor_id) {
    MacroFactor& factor_slot = slot(factor_id);
    factor_slot.has_raw_value = false;
    factor_slot.raw_value = 0.0;
    factor_slot.directional_change = 0;
}

void MacroScorer::set_policy_rate(double current_rate) {
    set_factor(MacroFactorId::POLICY_RATE, current_rate, 0);
}

void MacroScorer::set_policy_rate(double current_rate, double previous_rate) {
    int directional_change = 0;
    if (current_rate < previous_rate) {
        directional_change = 1;
    } else if (current_rate > previous_rate) {
        directional_change = -1;
    }
    set_factor(MacroFactorId::POLICY_RATE, current_rate, directional_change);
}

void MacroScorer::set_capital_flow(double net_flow) {
    set_factor(MacroFactorId::CAPITAL_FLOW, net_flow, band_vote(net_flow, capital_flow_band));
}

void MacroScorer::set_global_index_change(double percentage_change) {
    set_factor(MacroFactorId::GLOBAL_INDEX, FormatUtils::round_to_cents(percentage_change),
               band_vote(percentage_change, global_index_band_pct));
}

void MacroScorer::set_fx_rate_change(double percentage_change) {
    set_fx_rate_change(percentage_change, percentage_change);
}

// A weakening domestic currency (quote rising) is bearish
void MacroScorer::set_fx_rate_change(double percentage_change, double latest_quote) {
    set_factor(MacroFactorId::FX_RATE, FormatUtils::round_to_cents(latest_quote),
               -band_vote(percentage_change, fx_rate_band_pct));
}

void MacroScorer::set_volatility_index_change(double percentage_change) {
    set_volatility_index_change(percentage_change, percentage_change);
}

// A rising fear gauge is bearish
void MacroScorer::set_volatility_index_change(double percentage_change, double latest_level) {
    set_factor(MacroFactorId::VOLATILITY_INDEX, FormatUtils::round_to_cents(latest_level),
               -band_vote(percentage_change, volatility_index_band_pct));
}

FactorFetchResult MacroScorer::fetch_global_index(const MacroDataFetcher& data_fetcher) {
    FactorFetchResult fetch_result = data_fetcher.fetch_global_index_change();
    if (fetch_result.success) {
        set_global_index_change(fetch_result.percentage_change);
    } else {
        reset_factor(MacroFactorId::GLOBAL_INDEX);
        log_message("global_index left neutral: " + fetch_result.error_message);
    }
    return fetch_result;
}

FactorFetchResult MacroScorer::fetch_fx_rate(const MacroDataFetcher& data_fetcher) {
    FactorFetchResult fetch_result = data_fetcher.fetch_fx_rate_change();
    if (fetch_result.success) {
        set_fx_rate_change(fetch_result.percentage_change, fetch_result.latest_close);
    } else {
        reset_factor(MacroFactorId::FX_RATE);
        log_message("fx_rate left neutral: " + fetch_result.error_message);
    }
    return fetch_result;
}

FactorFetchResult MacroScorer::fetch_volatility_index(const MacroDataFetcher& data_fetcher) {
    FactorFetchResult fetch_result = data_fetcher.fetch_volatility_index_change();
    if (fetch_result.success) {
        set_volatility_index_change(fetch_result.percentage_change, fetch_result.latest_close);
    } else {
        reset_factor(MacroFactorId::VOLATILITY_INDEX);
        log_message("volatility_index left neutral: " + fetch_result.error_message);
    }
    return fetch_result;
}

int MacroScorer::fetch_all_auto_factors(const MacroDataFetcher& data_fetcher, std::vector<FactorFetchResult>& fetch_results) {
    fetch_results.clear();
    fetch_results.push_back(fetch_global_index(data_fetcher));
    fetch_results.push_back(fetch_fx_rate(data_fetcher));
    fetch_results.push_back(fetch_volatility_index(data_fetcher));

    int successful_fetch_count = 0;
    for (const FactorFetchResult& fetch_result : fetch_results) {
        if (fetch_result.success) {
            ++successful_fetch_count;
        }
    }
    return successful_fetch_count;
}

int MacroScorer::score() const {
    int macro_score = 0;
    for (const MacroFactor& factor_slot : factors) {
        macro_score += factor_slot.contribution();
    }
    return macro_score;
}

MacroCategory MacroScorer::categorize(int macro_score) const {
    if (macro_score > bullish_threshold) return MacroCategory::BULLISH;
    if (macro_score < bearish_threshold) return MacroCategory::BEARISH;
    return MacroCategory::NEUTRAL;
}

MacroSentiment MacroScorer::sentiment() const {
    MacroSentiment macro_sentiment;
    macro_sentiment.score = score();
    macro_sentiment.category = categorize(macro_sentiment.score);
    macro_sentiment.breakdown.reserve(MACRO_FACTOR_COUNT);
    for (const MacroFactor& factor_slot : factors) {
        MacroFactorBreakdown factor_breakdown;
        factor_breakdown.name = factor_slot.name;
        factor_breakdown.has_raw_value = factor_slot.has_raw_value;
        factor_breakdown.raw_value = factor_slot.raw_value;
        factor_breakdown.polarity = polarity_label(factor_slot.directional_change);
        factor_breakdown.contribution = factor_slot.contribution();
        macro_sentiment.breakdown.push_back(factor_breakdown);
    }
    return macro_sentiment;
}

} // namespace Core
} // namespace HybridTrader
