#include "rolling_statistics.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include <cmath>
#include <string>

namespace HybridTrader {
namespace Core {

RollingStatEngine::RollingStatEngine(const Config::TechnicalConfig& technical_config)
    : lookback_period(technical_config.lookback_period) {
    if (lookback_period < 2) {
        throw ConfigurationError("technical.lookback_period must be >= 2, got " + std::to_string(lookback_period));
    }
}

std::vector<WindowedStat> RollingStatEngine::compute(const std::vector<PricePoint>& price_series) const {
    std::vector<WindowedStat> windowed_stats;
    windowed_stats.reserve(price_series.size());
    for (size_t point_index = 0; point_index < price_series.size(); ++point_index) {
        windowed_stats.push_back(compute_window(price_series, point_index));
    }
    return windowed_stats;
}

WindowedStat RollingStatEngine::latest(const std::vector<PricePoint>& price_series) const {
    if (price_series.empty()) {
        return WindowedStat::undefined();
    }
    return compute_window(price_series, price_series.size() - 1);
}

WindowedStat RollingStatEngine::compute_window(const std::vector<PricePoint>& price_series, size_t window_end_index) const {
    const size_t window_size = static_cast<size_t>(lookback_period);
    if (window_end_index + 1 < window_size) {
        return WindowedStat::undefined();
    }

    const size_t window_start_index = window_end_index + 1 - window_size;

    double close_sum = 0.0;
    double window_max_close = price_series[window_start_index].close_price;
    double window_min_close = price_series[window_start_index].close_price;
    for (size_t window_index = window_start_index; window_index <= window_end_index; ++window_index) {
        double close_value = price_series[window_index].close_price;
        close_sum += close_value;
        if (close_value > window_max_close) window_max_close = close_value;
        if (close_value < window_min_close) window_min_close = close_value;
    }
    double rolling_mean = close_sum / static_cast<double>(window_size);

    // Flat window: std is zero, z-score has no meaning
    if (window_max_close == window_min_close) {
        return WindowedStat::undefined();
    }

    double squared_deviation_sum = 0.0;
    for (size_t window_index = window_start_index; window_index <= window_end_index; ++window_index) {
        double close_deviation = price_series[window_index].close_price - rolling_mean;
        squared_deviation_sum += close_deviation * close_deviation;
    }
    double rolling_std = std::sqrt(squared_deviation_sum / static_cast<double>(window_size - 1));
    if (!(rolling_std > 0.0) || !std::isfinite(rolling_std)) {
        return WindowedStat::undefined();
    }

    WindowedStat windowed_stat;
    windowed_stat.is_defined = true;
    windowed_stat.rolling_mean = rolling_mean;
    windowed_stat.rolling_std = rolling_std;
    windowed_stat.deviation = price_series[window_end_index].close_price - rolling_mean;
    windowed_stat.zscore = windowed_stat.deviation / rolling_std;
    if (rolling_mean != 0.0) {
        windowed_stat.deviation_pct = windowed_stat.deviation / rolling_mean * 100.0;
        windowed_stat.has_deviation_pct = true;
    }
    return windowed_stat;
}

} // namespace Core
} // namespace HybridTrader
