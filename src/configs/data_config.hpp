#ifndef DATA_CONFIG_HPP
#define DATA_CONFIG_HPP

#include <string>

namespace HybridTrader {
namespace Config {

struct DataConfig {
    std::string price_csv_path = "data/raw/nifty50_daily.csv";   // Daily OHLCV history
    int history_display_rows = 10;                               // Rows of the indicator table to report
};

struct QuotesConfig {
    std::string base_url = "https://query1.finance.yahoo.com/v8/finance/chart/";
    std::string chart_query = "?range=5d&interval=1d";
    std::string global_index_ticker = "^GSPC";       // Reference foreign index
    std::string fx_rate_ticker = "INR=X";            // Domestic currency quote
    std::string volatility_index_ticker = "^INDIAVIX"; // Fear gauge
    int timeout_seconds = 10;
    int retries = 2;
    int retry_delay_ms = 500;
    bool enable_ssl_verification = true;
};

} // namespace Config
} // namespace HybridTrader

#endif // DATA_CONFIG_HPP
