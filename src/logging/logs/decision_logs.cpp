#include "decision_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/report_layout.hpp"
#include "utils/format_utils.hpp"

namespace HybridTrader {
namespace Logging {

using FormatUtils::format_currency;
using FormatUtils::format_fixed;

void DecisionLogs::log_trading_decision(const Core::TradingDecision& trading_decision) {
    ReportTable decision_table("Decision", Core::to_string(trading_decision.action));
    decision_table.row("Allocation", format_fixed(trading_decision.allocation_pct, 1) + "%");
    decision_table.row("Confidence", trading_decision.confidence_label);
    decision_table.close();

    log_section_line("Reasoning:");
    for (const std::string& reasoning_line : trading_decision.reasoning) {
        log_section_detail(reasoning_line);
    }
}

void DecisionLogs::log_risk_metrics(const Core::RiskMetrics& risk_metrics) {
    if (!risk_metrics.is_active) {
        log_section_line("Risk metrics: not applicable (NO_TRADE)");
        return;
    }
    ReportTable risk_table("Risk Metrics", "Risk:Reward " + risk_metrics.risk_reward_ratio);
    risk_table.row("Entry", format_fixed(risk_metrics.entry_price, 2));
    risk_table.row("Stop Loss", format_fixed(risk_metrics.stop_loss, 2));
    risk_table.row("Target", format_fixed(risk_metrics.target, 2));
    risk_table.row("Capital", format_currency(risk_metrics.capital_allocated));
    risk_table.row("At Risk", format_currency(risk_metrics.capital_at_risk));
    risk_table.close();
}

void DecisionLogs::log_trade_order(const std::optional<Core::TradeOrder>& trade_order) {
    if (!trade_order) {
        log_section_line("No trade order generated (NO_TRADE)");
        return;
    }
    ReportTable order_table("Trade Order", trade_order->symbol + " " + Core::to_string(trade_order->action));
    order_table.row("Order Type", trade_order->order_type);
    order_table.row("Quantity", std::to_string(trade_order->quantity));
    order_table.row("Entry", format_fixed(trade_order->entry_price, 2));
    order_table.row("Stop Loss", format_fixed(trade_order->stop_loss, 2));
    order_table.row("Target", format_fixed(trade_order->target, 2));
    order_table.row("Exit Time", trade_order->exit_time);
    order_table.separator();
    order_table.row("Confidence", trade_order->confidence_label);
    order_table.row("Z-Score", format_fixed(trade_order->technical_zscore, 2));
    order_table.row("Macro Score", FormatUtils::format_signed_integer(trade_order->macro_score));
    order_table.close();
}

void DecisionLogs::log_zero_quantity_warning(const Core::TradeOrder& trade_order, double capital_allocated) {
    log_message("WARNING: " + Core::to_string(trade_order.action) + " order has quantity 0 - allocated " +
                format_currency(capital_allocated) + " is below one unit at " + format_fixed(trade_order.entry_price, 2));
}

} // namespace Logging
} // namespace HybridTrader
