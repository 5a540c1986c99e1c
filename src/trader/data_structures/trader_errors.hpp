#ifndef TRADER_ERRORS_HPP
#define TRADER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace HybridTrader {
namespace Core {

// Invalid configuration. Raised before any computation begins.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error("Configuration error: " + message) {}
};

// Invalid value passed across a component boundary.
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& message) : std::runtime_error("Invalid input: " + message) {}
};

} // namespace Core
} // namespace HybridTrader

#endif // TRADER_ERRORS_HPP
