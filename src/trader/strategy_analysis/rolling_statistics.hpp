#ifndef ROLLING_STATISTICS_HPP
#define ROLLING_STATISTICS_HPP

#include <vector>
#include "configs/technical_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace HybridTrader {
namespace Core {

/**
 * Windowed mean / sample std / z-score over a daily close series.
 * Every window is summed afresh so repeated runs on the same input are bit-identical.
 */
class RollingStatEngine {
public:
    explicit RollingStatEngine(const Config::TechnicalConfig& technical_config);

    // One WindowedStat per input point; the first lookback-1 entries are undefined.
    std::vector<WindowedStat> compute(const std::vector<PricePoint>& price_series) const;

    // Statistics for the most recent point only.
    WindowedStat latest(const std::vector<PricePoint>& price_series) const;

    int get_lookback_period() const { return lookback_period; }

private:
    int lookback_period;

    WindowedStat compute_window(const std::vector<PricePoint>& price_series, size_t window_end_index) const;
};

} // namespace Core
} // namespace HybridTrader

#endif // ROLLING_STATISTICS_HPP
