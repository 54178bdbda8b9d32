#include "time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace TimeUtils {

std::string format_local_time(std::time_t calendar_time, const char* format) {
    std::tm local_time_info;
    localtime_r(&calendar_time, &local_time_info);

    std::ostringstream formatted_stream;
    formatted_stream << std::put_time(&local_time_info, format);
    return formatted_stream.str();
}

std::string get_current_human_readable_time() {
    return format_local_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()), HUMAN_READABLE);
}

std::string get_current_run_label() {
    return format_local_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()), RUN_LABEL);
}

std::string format_elapsed_seconds(std::chrono::steady_clock::duration elapsed) {
    auto elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    std::ostringstream elapsed_stream;
    elapsed_stream << std::fixed << std::setprecision(3) << static_cast<double>(elapsed_milliseconds) / 1000.0 << "s";
    return elapsed_stream.str();
}

} // namespace TimeUtils
