#include "time_utils.hpp"
#include <cctype>
#include <chrono>

namespace TimeUtils {

std::string format_local_time(std::time_t epoch_seconds, const char* format) {
    std::tm local_time{};
    localtime_r(&epoch_seconds, &local_time);

    char formatted_buffer[64];
    size_t written_length = std::strftime(formatted_buffer, sizeof(formatted_buffer), format, &local_time);
    return std::string(formatted_buffer, written_length);
}

std::string current_log_timestamp() {
    return format_local_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()), LOG_TIMESTAMP_FORMAT);
}

std::string current_run_folder_stamp() {
    return format_local_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()), RUN_FOLDER_FORMAT);
}

bool is_iso_date_prefix(const std::string& date_string) {
    static const char ISO_DATE_SHAPE[] = "dddd-dd-dd";
    if (date_string.size() < sizeof(ISO_DATE_SHAPE) - 1) {
        return false;
    }
    for (size_t character_index = 0; character_index + 1 < sizeof(ISO_DATE_SHAPE); ++character_index) {
        unsigned char date_character = static_cast<unsigned char>(date_string[character_index]);
        bool matches_shape = ISO_DATE_SHAPE[character_index] == 'd' ? std::isdigit(date_character) != 0 : date_character == '-';
        if (!matches_shape) {
            return false;
        }
    }
    return true;
}

} // namespace TimeUtils
