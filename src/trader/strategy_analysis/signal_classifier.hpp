#ifndef SIGNAL_CLASSIFIER_HPP
#define SIGNAL_CLASSIFIER_HPP

#include "configs/technical_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace HybridTrader {
namespace Core {

class SignalClassifier {
public:
    explicit SignalClassifier(const Config::TechnicalConfig& technical_config);

    // Thresholds are compared against the unrounded z-score; reported values are rounded to 2 dp.
    TechnicalSignal classify(const WindowedStat& latest_stat, double current_price) const;

    double get_threshold() const { return zscore_threshold; }

private:
    double zscore_threshold;
};

} // namespace Core
} // namespace HybridTrader

#endif // SIGNAL_CLASSIFIER_HPP
