#ifndef MACRO_CONFIG_HPP
#define MACRO_CONFIG_HPP

namespace HybridTrader {
namespace Config {

struct MacroConfig {
    // ========================================================================
    // FACTOR WEIGHTS (signed, fixed for the lifetime of a scorer)
    // ========================================================================

    int policy_rate_weight = 3;                      // Central bank policy rate
    int capital_flow_weight = 2;                     // Net foreign institutional flow
    int global_index_weight = 1;                     // Reference foreign index session change
    int fx_rate_weight = 1;                          // Domestic currency quote session change
    int volatility_index_weight = 1;                 // Fear gauge session change

    // ========================================================================
    // SENTIMENT THRESHOLDS
    // ========================================================================

    int bullish_threshold = 2;                       // score > bullish -> BULLISH
    int bearish_threshold = -2;                      // score < bearish -> BEARISH

    // ========================================================================
    // FACTOR BANDS (absolute magnitudes)
    // ========================================================================

    double capital_flow_band = 1000.0;               // Net flow beyond +/- band votes
    double global_index_band_pct = 0.5;              // Index move beyond +/- band votes
    double fx_rate_band_pct = 0.3;                   // Currency move beyond +/- band votes (inverted)
    double volatility_index_band_pct = 5.0;          // Fear gauge move beyond +/- band votes (inverted)
};

} // namespace Config
} // namespace HybridTrader

#endif // MACRO_CONFIG_HPP
