#include "format_utils.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace FormatUtils {

double round_to_decimals(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double round_to_cents(double value) {
    return round_to_decimals(value, 2);
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string format_currency(double amount) {
    std::ostringstream oss;
    oss << "Rs." << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

std::string format_signed_integer(int value) {
    std::ostringstream oss;
    oss << std::showpos << value;
    return oss.str();
}

} // namespace FormatUtils
