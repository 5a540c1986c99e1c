#include "risk_calculator.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include "utils/format_utils.hpp"
#include <cmath>
#include <string>

namespace HybridTrader {
namespace Core {

RiskMetrics compute_risk_metrics(const RiskCalculationRequest& request) {
    RiskMetrics risk_metrics;
    if (request.action == TradeAction::NO_TRADE) {
        return risk_metrics;
    }

    if (!std::isfinite(request.current_price) || request.current_price <= 0.0) {
        throw InvalidInputError("current_price must be > 0, got " + std::to_string(request.current_price));
    }
    if (!std::isfinite(request.capital_base) || request.capital_base <= 0.0) {
        throw InvalidInputError("capital_base must be > 0, got " + std::to_string(request.capital_base));
    }
    if (!std::isfinite(request.stop_loss_pct) || request.stop_loss_pct <= 0.0) {
        throw InvalidInputError("stop_loss_pct must be > 0, got " + std::to_string(request.stop_loss_pct));
    }
    if (!std::isfinite(request.allocation_pct) || request.allocation_pct < 0.0 || request.allocation_pct > 100.0) {
        throw InvalidInputError("allocation_pct must be within [0, 100], got " + std::to_string(request.allocation_pct));
    }

    const double stop_fraction = request.stop_loss_pct / 100.0;
    double stop_loss_price = 0.0;
    double target_price = 0.0;
    if (request.action == TradeAction::BUY) {
        stop_loss_price = request.current_price * (1.0 - stop_fraction);
        target_price = request.current_price * (1.0 + REWARD_TO_RISK_MULTIPLE * stop_fraction);
    } else {
        stop_loss_price = request.current_price * (1.0 + stop_fraction);
        target_price = request.current_price * (1.0 - REWARD_TO_RISK_MULTIPLE * stop_fraction);
    }

    const double capital_allocated = request.allocation_pct / 100.0 * request.capital_base;
    const double capital_at_risk = capital_allocated * stop_fraction;

    risk_metrics.is_active = true;
    risk_metrics.entry_price = FormatUtils::round_to_cents(request.current_price);
    risk_metrics.stop_loss = FormatUtils::round_to_cents(stop_loss_price);
    risk_metrics.target = FormatUtils::round_to_cents(target_price);
    risk_metrics.capital_allocated = FormatUtils::round_to_cents(capital_allocated);
    risk_metrics.capital_at_risk = FormatUtils::round_to_cents(capital_at_risk);
    risk_metrics.risk_reward_ratio = RISK_REWARD_RATIO_LABEL;
    return risk_metrics;
}

RiskCalculator::RiskCalculator(const Config::TradingConfig& trading_config, const Config::RiskConfig& risk_config)
    : capital_base(trading_config.capital_base), stop_loss_pct(risk_config.stop_loss_pct) {
    if (!std::isfinite(capital_base) || capital_base <= 0.0) {
        throw ConfigurationError("trading.capital_base must be > 0, got " + std::to_string(capital_base));
    }
    if (!std::isfinite(stop_loss_pct) || stop_loss_pct <= 0.0) {
        throw ConfigurationError("risk.stop_loss_pct must be > 0, got " + std::to_string(stop_loss_pct));
    }
}

RiskMetrics RiskCalculator::calculate(const TradingDecision& trading_decision, double current_price) const {
    RiskCalculationRequest risk_request(trading_decision.action, current_price, trading_decision.allocation_pct,
                                        capital_base, stop_loss_pct);
    return compute_risk_metrics(risk_request);
}

} // namespace Core
} // namespace HybridTrader
