#include "macro_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/report_layout.hpp"
#include "utils/format_utils.hpp"

namespace HybridTrader {
namespace Logging {

using FormatUtils::format_fixed;
using FormatUtils::format_signed_integer;

void MacroLogs::log_fetch_results(const std::vector<Core::FactorFetchResult>& fetch_results) {
    ReportTable fetch_table("Macro Fetch", "Auto-fetched factors");
    for (const Core::FactorFetchResult& fetch_result : fetch_results) {
        std::string outcome_text = "FAILED - neutral";
        if (fetch_result.success) {
            outcome_text = "OK " + format_fixed(fetch_result.percentage_change, 2) + "% (last " +
                           format_fixed(fetch_result.latest_close, 2) + ")";
        }
        fetch_table.row(Core::to_string(fetch_result.factor_id), outcome_text);
    }
    fetch_table.close();
}

void MacroLogs::log_offline_mode() {
    log_message("Offline mode: global_index, fx_rate and volatility_index use overrides or stay neutral");
}

void MacroLogs::log_macro_sentiment(const Core::MacroSentiment& macro_sentiment) {
    ReportTable sentiment_table("Macro Sentiment", Core::to_string(macro_sentiment.category));
    sentiment_table.row("Score", format_signed_integer(macro_sentiment.score));
    sentiment_table.separator();
    // factor | raw value | polarity | weighted vote
    for (const Core::MacroFactorBreakdown& factor_breakdown : macro_sentiment.breakdown) {
        std::string raw_value_text = factor_breakdown.has_raw_value ? format_fixed(factor_breakdown.raw_value, 2) : "N/A";
        sentiment_table.row(factor_breakdown.name, raw_value_text + " | " + factor_breakdown.polarity + " | " +
                                                   format_signed_integer(factor_breakdown.contribution));
    }
    sentiment_table.close();
}

} // namespace Logging
} // namespace HybridTrader
