#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <ctime>
#include <string>

namespace TimeUtils {

constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* RUN_LABEL = "%d-%H-%M";

// Local-time strftime formatting of a calendar time.
std::string format_local_time(std::time_t calendar_time, const char* format);

// Log line timestamps.
std::string get_current_human_readable_time();

// Start label for run folders, DD-HH-MM.
std::string get_current_run_label();

// Seconds with millisecond precision, e.g. "1.250s".
std::string format_elapsed_seconds(std::chrono::steady_clock::duration elapsed);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
