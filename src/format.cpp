#include "format.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sd {

std::string format_size(uint64_t bytes) {
    if (bytes == 0) return "0 B";

    static const char* const units[] = {"B", "KB", "MB", "GB"};
    constexpr int last_unit = 3;

    // floor(log1024(bytes)) clamped to the table, computed on integers so exact
    // powers of 1024 don't fall into the smaller unit through rounding
    int unit = 0;
    uint64_t scale = 1;
    while (unit < last_unit && bytes / scale >= 1024) {
        scale *= 1024;
        ++unit;
    }

    const double value = static_cast<double>(bytes);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << value / static_cast<double>(scale) << ' ' << units[unit];
    return oss.str();
}

std::string format_local_time(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace sd
