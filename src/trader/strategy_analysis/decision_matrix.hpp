#ifndef DECISION_MATRIX_HPP
#define DECISION_MATRIX_HPP

#include "configs/trading_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace HybridTrader {
namespace Core {

/**
 * DecisionMatrix - fuses the technical signal and macro sentiment into an action and tier.
 *
 *               BULLISH        NEUTRAL        BEARISH
 *   BUY         BUY / HIGH     BUY / MEDIUM   BUY / LOW
 *   SELL        SELL / LOW     SELL / MEDIUM  SELL / HIGH
 *   NEUTRAL     NO_TRADE       NO_TRADE       NO_TRADE
 *   NO_DATA     NO_TRADE       NO_TRADE       NO_TRADE
 *
 * Stateless; risk_metrics of the returned decision are left inactive.
 */
class DecisionMatrix {
public:
    explicit DecisionMatrix(const Config::AllocationConfig& allocation_config);

    TradingDecision evaluate(const TechnicalSignal& technical_signal, const MacroSentiment& macro_sentiment) const;

    double allocation_for(ConfidenceTier confidence) const;

    // Configured label of a tier; NONE is always reported as "NONE"
    std::string confidence_label_for(ConfidenceTier confidence) const;

private:
    Config::AllocationConfig allocation;
};

} // namespace Core
} // namespace HybridTrader

#endif // DECISION_MATRIX_HPP
