#ifndef REPORT_LAYOUT_HPP
#define REPORT_LAYOUT_HPP

#include <cstddef>
#include <string>

namespace HybridTrader {
namespace Logging {

constexpr size_t REPORT_LABEL_WIDTH = 17;
constexpr size_t REPORT_VALUE_WIDTH = 48;

// "[STEP n/count] title" between two rules.
void log_stage_banner(int stage_number, int stage_count, const std::string& title);

// Indented block: "+-- title", "|   line", ..., "+--".
void log_section_header(const std::string& title);
void log_section_line(const std::string& text);
void log_section_detail(const std::string& text);
void log_section_footer();

// Pads or cuts text to exactly width characters.
std::string fit_to_width(const std::string& text, size_t width);

/**
 * Two-column table logged line by line. The constructor logs the title row,
 * close() logs the bottom rule; rows after close() are ignored.
 */
class ReportTable {
public:
    ReportTable(const std::string& title, const std::string& subtitle);

    void row(const std::string& label, const std::string& value);
    void separator();
    void close();

private:
    bool is_open;
};

} // namespace Logging
} // namespace HybridTrader

#endif // REPORT_LAYOUT_HPP
