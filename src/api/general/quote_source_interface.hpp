#ifndef QUOTE_SOURCE_INTERFACE_HPP
#define QUOTE_SOURCE_INTERFACE_HPP

#include <vector>
#include <string>

namespace HybridTrader {
namespace API {

// Source of recent daily closes for the auto-fetched macro factors.
class QuoteSourceInterface {
public:
    virtual ~QuoteSourceInterface() = default;

    // Oldest first. Implementations throw std::runtime_error when the ticker cannot be fetched.
    virtual std::vector<double> get_recent_daily_closes(const std::string& ticker) const = 0;

    virtual std::string get_provider_name() const = 0;
};

} // namespace API
} // namespace HybridTrader

#endif // QUOTE_SOURCE_INTERFACE_HPP
