#include "macro_data_fetcher.hpp"
#include "logging/logger/async_logger.hpp"
#include <cmath>
#include <vector>

namespace HybridTrader {
namespace Core {

using HybridTrader::Logging::log_message;

MacroDataFetcher::MacroDataFetcher(const API::QuoteSourceInterface& source, const Config::QuotesConfig& quotes_config)
    : quote_source(source), quotes(quotes_config) {}

FactorFetchResult MacroDataFetcher::fetch_global_index_change() const {
    return fetch_session_change(MacroFactorId::GLOBAL_INDEX, quotes.global_index_ticker);
}

FactorFetchResult MacroDataFetcher::fetch_fx_rate_change() const {
    return fetch_session_change(MacroFactorId::FX_RATE, quotes.fx_rate_ticker);
}

FactorFetchResult MacroDataFetcher::fetch_volatility_index_change() const {
    return fetch_session_change(MacroFactorId::VOLATILITY_INDEX, quotes.volatility_index_ticker);
}

FactorFetchResult MacroDataFetcher::fetch_session_change(MacroFactorId factor_id, const std::string& ticker) const {
    FactorFetchResult fetch_result;
    fetch_result.factor_id = factor_id;

    std::vector<double> daily_closes;
    try {
        daily_closes = quote_source.get_recent_daily_closes(ticker);
    } catch (const std::exception& fetch_exception_error) {
        fetch_result.error_message = "Error fetching " + ticker + " from " + quote_source.get_provider_name() + ": " + std::string(fetch_exception_error.what());
        log_message(fetch_result.error_message);
        return fetch_result;
    }

    if (daily_closes.size() < 2) {
        fetch_result.error_message = "Need two sessions for " + ticker + ", got " + std::to_string(daily_closes.size());
        log_message(fetch_result.error_message);
        return fetch_result;
    }

    double previous_close = daily_closes[daily_closes.size() - 2];
    double latest_close = daily_closes.back();
    if (!std::isfinite(previous_close) || !std::isfinite(latest_close) || previous_close == 0.0) {
        fetch_result.error_message = "Unusable closes for " + ticker;
        log_message(fetch_result.error_message);
        return fetch_result;
    }

    fetch_result.success = true;
    fetch_result.latest_close = latest_close;
    fetch_result.percentage_change = (latest_close - previous_close) / previous_close * 100.0;
    return fetch_result;
}

} // namespace Core
} // namespace HybridTrader
