#ifndef TECHNICAL_LOGS_HPP
#define TECHNICAL_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <vector>

namespace HybridTrader {
namespace Logging {

/**
 * Reporting for the mean-reversion stage: loaded price history, the trailing
 * indicator table and the classified technical signal.
 */
class TechnicalLogs {
public:
    static void log_price_series_loaded(const std::string& csv_path, const std::vector<Core::PricePoint>& price_series);
    static void log_indicator_history(const std::vector<Core::PricePoint>& price_series,
                                      const std::vector<Core::WindowedStat>& windowed_stats, int display_rows);
    static void log_technical_signal(const Core::TechnicalSignal& technical_signal, int lookback_period, double zscore_threshold);
    static void log_insufficient_history(size_t available_points, int lookback_period);
};

} // namespace Logging
} // namespace HybridTrader

#endif // TECHNICAL_LOGS_HPP
