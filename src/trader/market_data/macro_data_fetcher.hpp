#ifndef MACRO_DATA_FETCHER_HPP
#define MACRO_DATA_FETCHER_HPP

#include "api/general/quote_source_interface.hpp"
#include "configs/data_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace HybridTrader {
namespace Core {

/**
 * MacroDataFetcher - turns the last two daily closes of a ticker into a session percentage change.
 * Never throws: every failure comes back as FactorFetchResult{success = false}.
 */
class MacroDataFetcher {
public:
    MacroDataFetcher(const API::QuoteSourceInterface& quote_source, const Config::QuotesConfig& quotes_config);

    FactorFetchResult fetch_global_index_change() const;
    FactorFetchResult fetch_fx_rate_change() const;
    FactorFetchResult fetch_volatility_index_change() const;

    FactorFetchResult fetch_session_change(MacroFactorId factor_id, const std::string& ticker) const;

private:
    const API::QuoteSourceInterface& quote_source;
    Config::QuotesConfig quotes;
};

} // namespace Core
} // namespace HybridTrader

#endif // MACRO_DATA_FETCHER_HPP
