#ifndef RISK_CONFIG_HPP
#define RISK_CONFIG_HPP

#include <string>

namespace HybridTrader {
namespace Config {

struct RiskConfig {
    double stop_loss_pct = 1.0;                      // Stop distance as percentage of entry; target is twice this
    std::string exit_time = "15:15";                 // Intraday exit time-of-day carried on orders
};

} // namespace Config
} // namespace HybridTrader

#endif // RISK_CONFIG_HPP
