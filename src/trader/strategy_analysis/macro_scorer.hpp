#ifndef MACRO_SCORER_HPP
#define MACRO_SCORER_HPP

#include <array>
#include <vector>
#include "configs/macro_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace HybridTrader {
namespace Core {

class MacroDataFetcher;

/**
 * MacroScorer - owns the five macro factor slots of one run.
 *
 * Weights are fixed at construction. Factors change only through the setters and
 * fetchers below; unset factors vote 0. score() and sentiment() recompute from the
 * slots on every call.
 */
class MacroScorer {
public:
    explicit MacroScorer(const Config::MacroConfig& macro_config);

    // Policy rate: a cut is bullish, a hike bearish. Without a previous rate the vote is 0.
    void set_policy_rate(double current_rate);
    void set_policy_rate(double current_rate, double previous_rate);

    // Net institutional flow in currency units.
    void set_capital_flow(double net_flow);

    // Session percentage changes computed elsewhere. The raw value reported for fx_rate and
    // volatility_index is the latest quote/level when known, otherwise the change itself.
    void set_global_index_change(double percentage_change);
    void set_fx_rate_change(double percentage_change);
    void set_fx_rate_change(double percentage_change, double latest_quote);
    void set_volatility_index_change(double percentage_change);
    void set_volatility_index_change(double percentage_change, double latest_level);

    // A failed fetch leaves the factor neutral and is reported in the result.
    FactorFetchResult fetch_global_index(const MacroDataFetcher& data_fetcher);
    FactorFetchResult fetch_fx_rate(const MacroDataFetcher& data_fetcher);
    FactorFetchResult fetch_volatility_index(const MacroDataFetcher& data_fetcher);

    // Runs the three fetches; returns the number that succeeded.
    int fetch_all_auto_factors(const MacroDataFetcher& data_fetcher, std::vector<FactorFetchResult>& fetch_results);

    int score() const;
    MacroCategory categorize(int macro_score) const;
    MacroSentiment sentiment() const;

    const MacroFactor& factor(MacroFactorId factor_id) const;

private:
    std::array<MacroFactor, MACRO_FACTOR_COUNT> factors;
    int bullish_threshold;
    int bearish_threshold;
    double capital_flow_band;
    double global_index_band_pct;
    double fx_rate_band_pct;
    double volatility_index_band_pct;

    MacroFactor& slot(MacroFactorId factor_id);
    void set_factor(MacroFactorId factor_id, double raw_value, int directional_change);
    void reset_factor(MacroFactorId factor_id);
};

// +1 above the band, -1 below its negative, 0 inside (band edges are neutral).
int band_vote(double value, double band);

} // namespace Core
} // namespace HybridTrader

#endif // MACRO_SCORER_HPP
