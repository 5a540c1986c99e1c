#ifndef RISK_CALCULATOR_HPP
#define RISK_CALCULATOR_HPP

#include "configs/trading_config.hpp"
#include "configs/risk_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace HybridTrader {
namespace Core {

// Fixed 1:2 risk:reward; the target sits twice the stop distance from entry.
constexpr double REWARD_TO_RISK_MULTIPLE = 2.0;
constexpr const char* RISK_REWARD_RATIO_LABEL = "1:2";

// Throws InvalidInputError for a non-positive or non-finite price, capital base or stop loss
// on a BUY/SELL request. NO_TRADE returns inactive metrics without validation.
RiskMetrics compute_risk_metrics(const RiskCalculationRequest& request);

class RiskCalculator {
public:
    RiskCalculator(const Config::TradingConfig& trading_config, const Config::RiskConfig& risk_config);

    RiskMetrics calculate(const TradingDecision& trading_decision, double current_price) const;

private:
    double capital_base;
    double stop_loss_pct;
};

} // namespace Core
} // namespace HybridTrader

#endif // RISK_CALCULATOR_HPP
