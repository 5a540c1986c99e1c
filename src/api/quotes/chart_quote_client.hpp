#ifndef CHART_QUOTE_CLIENT_HPP
#define CHART_QUOTE_CLIENT_HPP

#include "api/general/quote_source_interface.hpp"
#include "configs/data_config.hpp"
#include <string>
#include <vector>

namespace HybridTrader {
namespace API {
namespace Quotes {

/**
 * Daily closes from a chart endpoint (Yahoo v8 layout):
 *   chart.result[0].indicators.quote[0].close
 * Null closes (holidays, partial sessions) are skipped.
 */
class ChartQuoteClient : public QuoteSourceInterface {
public:
    explicit ChartQuoteClient(const Config::QuotesConfig& quotes_config);

    std::vector<double> get_recent_daily_closes(const std::string& ticker) const override;
    std::string get_provider_name() const override { return "chart"; }

    std::string build_chart_url(const std::string& ticker) const;
    static std::vector<double> parse_chart_response(const std::string& response_body);

private:
    Config::QuotesConfig quotes;
};

} // namespace Quotes
} // namespace API
} // namespace HybridTrader

#endif // CHART_QUOTE_CLIENT_HPP
