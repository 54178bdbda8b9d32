#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include <string>
#include "async_logger.hpp"

namespace PredictionTrader {
namespace Logging {

constexpr size_t REPORT_LABEL_WIDTH = 17;
constexpr size_t REPORT_VALUE_WIDTH = 48;

// Truncates or right-pads to width bytes.
inline std::string fit_report_cell(const std::string& text, size_t width) {
    std::string cell = text.substr(0, width);
    cell.append(width - cell.size(), ' ');
    return cell;
}

inline std::string report_rule(const char* left, const char* middle, const char* right) {
    std::string rule = left;
    for (size_t i = 0; i < REPORT_LABEL_WIDTH + 2; ++i) rule += "─";
    rule += middle;
    for (size_t i = 0; i < REPORT_VALUE_WIDTH + 2; ++i) rule += "─";
    return rule + right;
}

inline std::string report_row(const std::string& label, const std::string& value) {
    return "│ " + fit_report_cell(label, REPORT_LABEL_WIDTH) + " │ " + fit_report_cell(value, REPORT_VALUE_WIDTH) + " │";
}

} // namespace Logging
} // namespace PredictionTrader

// Report sections
#define LOG_SECTION_HEADER(title) PredictionTrader::Logging::log_message("+-- " + std::string(title))
#define LOG_SECTION_LINE(msg) PredictionTrader::Logging::log_message("|   " + std::string(msg))
#define LOG_SECTION_DETAIL(msg) PredictionTrader::Logging::log_message("|     " + std::string(msg))
#define LOG_SECTION_FOOTER() PredictionTrader::Logging::log_message("+--")

#define LOG_RUN_BANNER(title) do { \
    PredictionTrader::Logging::log_message(std::string(80, '=')); \
    PredictionTrader::Logging::log_message(std::string(25, ' ') + std::string(title)); \
    PredictionTrader::Logging::log_message(std::string(80, '=')); \
} while (0)

// Two-column report tables
#define LOG_TABLE_HEADER(title, subtitle) do { \
    LOG_SECTION_LINE(PredictionTrader::Logging::report_rule("┌", "┬", "┐")); \
    LOG_SECTION_LINE(PredictionTrader::Logging::report_row(title, subtitle)); \
    LOG_SECTION_LINE(PredictionTrader::Logging::report_rule("├", "┼", "┤")); \
} while (0)

#define LOG_TABLE_ROW(label, value) LOG_SECTION_LINE(PredictionTrader::Logging::report_row(label, value))
#define LOG_TABLE_SEPARATOR() LOG_SECTION_LINE(PredictionTrader::Logging::report_rule("├", "┼", "┤"))
#define LOG_TABLE_FOOTER() LOG_SECTION_LINE(PredictionTrader::Logging::report_rule("└", "┴", "┘"))

#endif // LOGGING_MACROS_HPP
