#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <ctime>
#include <string>

namespace TimeUtils {

constexpr const char* LOG_TIMESTAMP_FORMAT = "%Y-%m-%d %H:%M:%S";
constexpr const char* RUN_FOLDER_FORMAT = "%Y%m%d_%H%M%S";

// strftime-style formatting of a local time
std::string format_local_time(std::time_t epoch_seconds, const char* format);

std::string current_log_timestamp();
std::string current_run_folder_stamp();

// True for "YYYY-MM-DD" (optionally followed by a time part)
bool is_iso_date_prefix(const std::string& date_string);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
