#ifndef FORMAT_UTILS_HPP
#define FORMAT_UTILS_HPP

#include <string>

namespace FormatUtils {

// Round half away from zero to the given number of decimals.
double round_to_decimals(double value, int decimals);

// Presentation rounding for prices, amounts and statistics.
double round_to_cents(double value);

std::string format_fixed(double value, int precision);
std::string format_currency(double amount);
std::string format_signed_integer(int value);

} // namespace FormatUtils

#endif // FORMAT_UTILS_HPP
