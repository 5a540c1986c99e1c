#ifndef MACRO_LOGS_HPP
#define MACRO_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <vector>

namespace HybridTrader {
namespace Logging {

class MacroLogs {
public:
    static void log_fetch_results(const std::vector<Core::FactorFetchResult>& fetch_results);
    static void log_offline_mode();
    static void log_macro_sentiment(const Core::MacroSentiment& macro_sentiment);
};

} // namespace Logging
} // namespace HybridTrader

#endif // MACRO_LOGS_HPP
