#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace livelink::util {

// The open platform reports and displays times in UTC+8.
constexpr std::chrono::hours kBeijingOffset{8};

std::string format_beijing(std::chrono::system_clock::time_point time_point, const char* pattern);

// Returns nullopt when the value does not fit a system_clock time point.
std::optional<std::string> format_unix_beijing(std::int64_t unix_seconds,
                                               const char* pattern = "%Y-%m-%d %H:%M:%S");

// "YYYY-MM-DD HH:MM:SS+08:00"
std::string beijing_with_offset(std::chrono::system_clock::time_point time_point);

}  // namespace livelink::util
