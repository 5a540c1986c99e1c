#include "report_layout.hpp"
#include "async_logger.hpp"

namespace HybridTrader {
namespace Logging {

namespace {
    const std::string STAGE_RULE(80, '=');

    std::string table_rule() {
        return "|   +" + std::string(REPORT_LABEL_WIDTH + 2, '-') + "+" + std::string(REPORT_VALUE_WIDTH + 2, '-') + "+";
    }

    std::string table_cells(const std::string& label, const std::string& value) {
        return "|   | " + fit_to_width(label, REPORT_LABEL_WIDTH) + " | " + fit_to_width(value, REPORT_VALUE_WIDTH) + " |";
    }
}

std::string fit_to_width(const std::string& text, size_t width) {
    std::string fitted_text = text.substr(0, width);
    fitted_text.resize(width, ' ');
    return fitted_text;
}

void log_stage_banner(int stage_number, int stage_count, const std::string& title) {
    log_message("");
    log_message(STAGE_RULE);
    log_message("  [STEP " + std::to_string(stage_number) + "/" + std::to_string(stage_count) + "] " + title);
    log_message(STAGE_RULE);
}

void log_section_header(const std::string& title) {
    log_message("+-- " + title);
}

void log_section_line(const std::string& text) {
    log_message("|   " + text);
}

void log_section_detail(const std::string& text) {
    log_message("|     " + text);
}

void log_section_footer() {
    log_message("+--");
}

ReportTable::ReportTable(const std::string& title, const std::string& subtitle) : is_open(true) {
    log_message(table_rule());
    log_message(table_cells(title, subtitle));
    log_message(table_rule());
}

void ReportTable::row(const std::string& label, const std::string& value) {
    if (is_open) {
        log_message(table_cells(label, value));
    }
}

void ReportTable::separator() {
    if (is_open) {
        log_message(table_rule());
    }
}

void ReportTable::close() {
    if (is_open) {
        log_message(table_rule());
        is_open = false;
    }
}

} // namespace Logging
} // namespace HybridTrader
