#ifndef ORDER_BUILDER_HPP
#define ORDER_BUILDER_HPP

#include "configs/trading_config.hpp"
#include "configs/risk_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace HybridTrader {
namespace Core {

/**
 * OrderBuilder - converts a decision with active risk metrics into an order.
 * NO_TRADE yields no order. A zero quantity is returned as-is; callers decide whether to drop it.
 */
class OrderBuilder {
public:
    OrderBuilder(const Config::TradingConfig& trading_config, const Config::RiskConfig& risk_config);

    std::optional<TradeOrder> build(const TradingDecision& trading_decision) const;

private:
    std::string symbol;
    std::string order_type;
    std::string exit_time;
};

// floor(capital_allocated / entry_price), never negative.
long long compute_order_quantity(double capital_allocated, double entry_price);

// Order payload with symbol, action, order_type, quantity, prices, exit_time and audit fields.
nlohmann::json build_order_payload(const TradeOrder& trade_order);

} // namespace Core
} // namespace HybridTrader

#endif // ORDER_BUILDER_HPP
