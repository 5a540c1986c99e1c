#ifndef TRADING_CONFIG_HPP
#define TRADING_CONFIG_HPP

#include <string>

namespace HybridTrader {
namespace Config {

struct TradingConfig {
    std::string symbol = "NIFTY50";                  // Instrument identifier carried on orders
    double capital_base = 100000.0;                  // Capital the allocation tiers apply to
    std::string order_type = "MARKET";               // Order type marker carried on orders
};

struct AllocationConfig {
    // Percentages of capital_base, high >= medium >= low, each within [0, 100]
    double high_allocation_pct = 80.0;               // Technical and macro aligned
    double medium_allocation_pct = 50.0;             // Macro neutral
    double low_allocation_pct = 25.0;                // Technical and macro conflicting

    // Labels reported for each tier on decisions and order payloads
    std::string high_confidence_label = "HIGH";
    std::string medium_confidence_label = "MEDIUM";
    std::string low_confidence_label = "LOW";
};

} // namespace Config
} // namespace HybridTrader

#endif // TRADING_CONFIG_HPP
