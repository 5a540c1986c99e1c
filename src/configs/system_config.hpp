#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "technical_config.hpp"
#include "macro_config.hpp"
#include "trading_config.hpp"
#include "risk_config.hpp"
#include "data_config.hpp"
#include "logging_config.hpp"

namespace HybridTrader {
namespace Config {

/**
 * Main decision system configuration.
 * Loaded once at startup, validated, then handed by const reference to every component.
 */
struct SystemConfig {
    SystemConfig() {}

    TechnicalConfig technical;         // Rolling window and z-score threshold
    MacroConfig macro;                 // Factor weights, bands and sentiment thresholds
    TradingConfig trading;             // Symbol, capital base, order type
    AllocationConfig allocation;       // Confidence tier -> allocation percentage
    RiskConfig risk;                   // Stop loss percentage and exit time
    DataConfig data;                   // Price history input
    QuotesConfig quotes;               // Quote endpoint for auto-fetched macro factors
    LoggingConfig logging;             // Log folder and file
};

} // namespace Config
} // namespace HybridTrader

#endif // SYSTEM_CONFIG_HPP
