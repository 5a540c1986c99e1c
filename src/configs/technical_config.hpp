#ifndef TECHNICAL_CONFIG_HPP
#define TECHNICAL_CONFIG_HPP

namespace HybridTrader {
namespace Config {

struct TechnicalConfig {
    // ========================================================================
    // MEAN REVERSION CONFIGURATION
    // ========================================================================

    int lookback_period = 20;                        // Trailing closes used for rolling mean/std
    double zscore_buy_threshold = -2.0;              // Oversold threshold (only its magnitude is used)
    double zscore_sell_threshold = 2.0;              // Overbought threshold (must mirror the buy threshold)

    // Single symmetric magnitude honoured by the signal classifier
    double symmetric_threshold() const {
        return zscore_buy_threshold < 0.0 ? -zscore_buy_threshold : zscore_buy_threshold;
    }
};

} // namespace Config
} // namespace HybridTrader

#endif // TECHNICAL_CONFIG_HPP
