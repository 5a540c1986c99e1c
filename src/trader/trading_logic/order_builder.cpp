#include "order_builder.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include <cmath>

using json = nlohmann::json;

namespace HybridTrader {
namespace Core {

OrderBuilder::OrderBuilder(const Config::TradingConfig& trading_config, const Config::RiskConfig& risk_config)
    : symbol(trading_config.symbol), order_type(trading_config.order_type), exit_time(risk_config.exit_time) {}

long long compute_order_quantity(double capital_allocated, double entry_price) {
    if (!std::isfinite(capital_allocated) || !std::isfinite(entry_price) || entry_price <= 0.0 || capital_allocated <= 0.0) {
        return 0;
    }
    return static_cast<long long>(std::floor(capital_allocated / entry_price));
}

std::optional<TradeOrder> OrderBuilder::build(const TradingDecision& trading_decision) const {
    if (trading_decision.action == TradeAction::NO_TRADE) {
        return std::nullopt;
    }

    const RiskMetrics& risk_metrics = trading_decision.risk_metrics;
    if (!risk_metrics.is_active) {
        throw InvalidInputError("risk metrics must be calculated before building a " + to_string(trading_decision.action) + " order");
    }

    TradeOrder trade_order;
    trade_order.symbol = symbol;
    trade_order.action = trading_decision.action;
    trade_order.order_type = order_type;
    trade_order.quantity = compute_order_quantity(risk_metrics.capital_allocated, risk_metrics.entry_price);
    trade_order.entry_price = risk_metrics.entry_price;
    trade_order.stop_loss = risk_metrics.stop_loss;
    trade_order.target = risk_metrics.target;
    trade_order.exit_time = exit_time;
    trade_order.confidence = trading_decision.confidence;
    trade_order.confidence_label = trading_decision.confidence_label;
    trade_order.technical_zscore = trading_decision.technical_input.zscore;
    trade_order.macro_score = trading_decision.macro_input.score;
    return trade_order;
}

json build_order_payload(const TradeOrder& trade_order) {
    json order_payload = json::object();
    order_payload["timestamp"] = nullptr;   // filled at execution
    order_payload["symbol"] = trade_order.symbol;
    order_payload["action"] = to_string(trade_order.action);
    order_payload["order_type"] = trade_order.order_type;
    order_payload["quantity"] = trade_order.quantity;
    order_payload["entry_price"] = trade_order.entry_price;
    order_payload["stop_loss"] = trade_order.stop_loss;
    order_payload["target"] = trade_order.target;
    order_payload["exit_time"] = trade_order.exit_time;
    order_payload["confidence"] = trade_order.confidence_label;
    order_payload["technical_zscore"] = trade_order.technical_zscore;
    order_payload["macro_score"] = trade_order.macro_score;
    return order_payload;
}

} // namespace Core
} // namespace HybridTrader
