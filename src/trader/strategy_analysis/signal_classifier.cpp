#include "signal_classifier.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include "utils/format_utils.hpp"
#include <cmath>
#include <string>

namespace HybridTrader {
namespace Core {

SignalClassifier::SignalClassifier(const Config::TechnicalConfig& technical_config)
    : zscore_threshold(technical_config.symmetric_threshold()) {
    if (!std::isfinite(zscore_threshold) || zscore_threshold <= 0.0) {
        throw ConfigurationError("z-score threshold must be a positive finite number");
    }
}

TechnicalSignal SignalClassifier::classify(const WindowedStat& latest_stat, double current_price) const {
    TechnicalSignal technical_signal;
    technical_signal.current_price = FormatUtils::round_to_cents(current_price);

    if (!latest_stat.is_defined) {
        technical_signal.kind = SignalKind::NO_DATA;
        technical_signal.has_statistics = false;
        technical_signal.reason = "Insufficient data for calculation";
        return technical_signal;
    }

    technical_signal.has_statistics = true;
    technical_signal.zscore = FormatUtils::round_to_cents(latest_stat.zscore);
    technical_signal.mean_price = FormatUtils::round_to_cents(latest_stat.rolling_mean);
    technical_signal.deviation = FormatUtils::round_to_cents(latest_stat.deviation);
    technical_signal.has_deviation_pct = latest_stat.has_deviation_pct;
    if (latest_stat.has_deviation_pct) {
        technical_signal.deviation_pct = FormatUtils::round_to_cents(latest_stat.deviation_pct);
    }

    std::string zscore_text = FormatUtils::format_fixed(latest_stat.zscore, 2);
    if (latest_stat.zscore < -zscore_threshold) {
        technical_signal.kind = SignalKind::BUY;
        technical_signal.reason = "Price is oversold (Z-score: " + zscore_text + ").";
        if (latest_stat.has_deviation_pct) {
            technical_signal.reason += " Price " + FormatUtils::format_fixed(std::abs(latest_stat.deviation_pct), 2) + "% below mean.";
        }
    } else if (latest_stat.zscore > zscore_threshold) {
        technical_signal.kind = SignalKind::SELL;
        technical_signal.reason = "Price is overbought (Z-score: " + zscore_text + ").";
        if (latest_stat.has_deviation_pct) {
            technical_signal.reason += " Price " + FormatUtils::format_fixed(latest_stat.deviation_pct, 2) + "% above mean.";
        }
    } else {
        technical_signal.kind = SignalKind::NEUTRAL;
        technical_signal.reason = "Price is near equilibrium (Z-score: " + zscore_text + ").";
    }
    return technical_signal;
}

} // namespace Core
} // namespace HybridTrader
