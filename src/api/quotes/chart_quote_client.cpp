#include "api/quotes/chart_quote_client.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/http_utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace HybridTrader {
namespace API {
namespace Quotes {

using HybridTrader::Logging::log_message;

ChartQuoteClient::ChartQuoteClient(const Config::QuotesConfig& quotes_config) : quotes(quotes_config) {}

std::string ChartQuoteClient::build_chart_url(const std::string& ticker) const {
    return quotes.base_url + url_encode_path_segment(ticker) + quotes.chart_query;
}

std::vector<double> ChartQuoteClient::get_recent_daily_closes(const std::string& ticker) const {
    HttpGetRequest chart_request;
    chart_request.url = build_chart_url(ticker);
    chart_request.attempts = quotes.retries;
    chart_request.timeout_seconds = quotes.timeout_seconds;
    chart_request.retry_delay_ms = quotes.retry_delay_ms;
    chart_request.verify_tls = quotes.enable_ssl_verification;
    std::string response_body = http_get(chart_request);

    std::vector<double> daily_closes;
    try {
        daily_closes = parse_chart_response(response_body);
    } catch (const json::exception& parse_exception_error) {
        throw std::runtime_error("Chart response for " + ticker + " could not be parsed: " + std::string(parse_exception_error.what()));
    }

    log_message("Fetched " + std::to_string(daily_closes.size()) + " daily closes for " + ticker);
    return daily_closes;
}

std::vector<double> ChartQuoteClient::parse_chart_response(const std::string& response_body) {
    json chart_json = json::parse(response_body);

    if (!chart_json.contains("chart") || !chart_json["chart"].is_object()) {
        throw std::runtime_error("Chart response missing 'chart' object");
    }
    const json& chart_object = chart_json["chart"];

    if (chart_object.contains("error") && !chart_object["error"].is_null()) {
        std::string error_description = "unknown error";
        if (chart_object["error"].contains("description") && chart_object["error"]["description"].is_string()) {
            error_description = chart_object["error"]["description"].get<std::string>();
        }
        throw std::runtime_error("Chart endpoint returned error: " + error_description);
    }

    if (!chart_object.contains("result") || !chart_object["result"].is_array() || chart_object["result"].empty()) {
        throw std::runtime_error("Chart response has no result");
    }
    const json& chart_result = chart_object["result"][0];

    if (!chart_result.contains("indicators") || !chart_result["indicators"].contains("quote") ||
        !chart_result["indicators"]["quote"].is_array() || chart_result["indicators"]["quote"].empty()) {
        throw std::runtime_error("Chart response has no quote indicators");
    }
    const json& quote_object = chart_result["indicators"]["quote"][0];
    if (!quote_object.contains("close") || !quote_object["close"].is_array()) {
        throw std::runtime_error("Chart response has no close series");
    }

    std::vector<double> daily_closes;
    for (json::const_iterator close_iterator = quote_object["close"].begin(); close_iterator != quote_object["close"].end(); ++close_iterator) {
        if (close_iterator->is_number()) {
            daily_closes.push_back(close_iterator->get<double>());
        }
    }
    return daily_closes;
}

} // namespace Quotes
} // namespace API
} // namespace HybridTrader
