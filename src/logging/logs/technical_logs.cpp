#include "technical_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/report_layout.hpp"
#include "utils/format_utils.hpp"
#include <iomanip>
#include <sstream>

namespace HybridTrader {
namespace Logging {

using FormatUtils::format_fixed;

void TechnicalLogs::log_price_series_loaded(const std::string& csv_path, const std::vector<Core::PricePoint>& price_series) {
    ReportTable price_table("Price Data", csv_path);
    price_table.row("Rows", std::to_string(price_series.size()));
    if (!price_series.empty()) {
        price_table.row("First Date", price_series.front().date);
        price_table.row("Last Date", price_series.back().date);
        price_table.row("Last Close", format_fixed(price_series.back().close_price, 2));
    }
    price_table.close();
}

void TechnicalLogs::log_indicator_history(const std::vector<Core::PricePoint>& price_series,
                                          const std::vector<Core::WindowedStat>& windowed_stats, int display_rows) {
    if (display_rows <= 0 || price_series.empty() || windowed_stats.size() != price_series.size()) {
        return;
    }

    log_section_header("RECENT MEAN REVERSION INDICATORS");
    log_section_line("Date         Close        Mean         Z-Score");
    size_t first_row_index = price_series.size() > static_cast<size_t>(display_rows) ? price_series.size() - display_rows : 0;
    for (size_t row_index = first_row_index; row_index < price_series.size(); ++row_index) {
        const Core::WindowedStat& windowed_stat = windowed_stats[row_index];
        std::ostringstream row_stream;
        row_stream << std::left << std::setw(13) << price_series[row_index].date
                   << std::setw(13) << format_fixed(price_series[row_index].close_price, 2)
                   << std::setw(13) << (windowed_stat.is_defined ? format_fixed(windowed_stat.rolling_mean, 2) : "-")
                   << (windowed_stat.is_defined ? format_fixed(windowed_stat.zscore, 2) : "-");
        log_section_line(row_stream.str());
    }
    log_section_footer();
}

void TechnicalLogs::log_technical_signal(const Core::TechnicalSignal& technical_signal, int lookback_period, double zscore_threshold) {
    ReportTable signal_table("Technical Signal", Core::to_string(technical_signal.kind));
    signal_table.row("Lookback", std::to_string(lookback_period) + " sessions");
    signal_table.row("Threshold", "+/-" + format_fixed(zscore_threshold, 2));
    signal_table.row("Current Price", format_fixed(technical_signal.current_price, 2));
    if (technical_signal.has_statistics) {
        signal_table.row("Mean Price", format_fixed(technical_signal.mean_price, 2));
        signal_table.row("Z-Score", format_fixed(technical_signal.zscore, 2));
        std::string deviation_pct_text = technical_signal.has_deviation_pct ? format_fixed(technical_signal.deviation_pct, 2) + "%" : "N/A";
        signal_table.row("Deviation", format_fixed(technical_signal.deviation, 2) + " (" + deviation_pct_text + ")");
    } else {
        signal_table.row("Z-Score", "N/A");
    }
    signal_table.close();
    log_section_line("Reason: " + technical_signal.reason);
}

void TechnicalLogs::log_insufficient_history(size_t available_points, int lookback_period) {
    log_message("Only " + std::to_string(available_points) + " price points for a lookback of " +
                std::to_string(lookback_period) + " - technical signal is NO_DATA");
}

} // namespace Logging
} // namespace HybridTrader
