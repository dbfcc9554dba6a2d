#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sd {

// "0 B", "10.0 B", "1.5 KB", ... (base 1024, one decimal, B/KB/MB/GB)
std::string format_size(uint64_t bytes);

// Local time, strftime-style format (default "YYYY-MM-DD HH:MM:SS")
std::string format_local_time(std::chrono::system_clock::time_point tp,
                              const char* fmt = "%Y-%m-%d %H:%M:%S");

} // namespace sd
