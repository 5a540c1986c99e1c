#ifndef DECISION_LOGS_HPP
#define DECISION_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <optional>

namespace HybridTrader {
namespace Logging {

/**
 * Reporting for the allocation stage: decision, risk metrics and the resulting order.
 */
class DecisionLogs {
public:
    static void log_trading_decision(const Core::TradingDecision& trading_decision);
    static void log_risk_metrics(const Core::RiskMetrics& risk_metrics);
    static void log_trade_order(const std::optional<Core::TradeOrder>& trade_order);
    static void log_zero_quantity_warning(const Core::TradeOrder& trade_order, double capital_allocated);
};

} // namespace Logging
} // namespace HybridTrader

#endif // DECISION_LOGS_HPP
