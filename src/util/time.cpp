#include "livelink/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace livelink::util {

std::string format_beijing(std::chrono::system_clock::time_point time_point, const char* pattern) {
    const auto shifted = time_point + kBeijingOffset;
    const std::time_t raw = std::chrono::system_clock::to_time_t(shifted);
    std::tm tm{};
    gmtime_r(&raw, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::optional<std::string> format_unix_beijing(std::int64_t unix_seconds, const char* pattern) {
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    using std::chrono::system_clock;

    // Leave room for the UTC+8 shift applied while formatting.
    constexpr auto kMax = duration_cast<seconds>(system_clock::duration::max()) - kBeijingOffset;
    constexpr auto kMin = duration_cast<seconds>(system_clock::duration::min()) + kBeijingOffset;
    if (unix_seconds > kMax.count() || unix_seconds < kMin.count()) {
        return std::nullopt;
    }
    return format_beijing(system_clock::time_point(seconds(unix_seconds)), pattern);
}

std::string beijing_with_offset(std::chrono::system_clock::time_point time_point) {
    return format_beijing(time_point, "%Y-%m-%d %H:%M:%S") + "+08:00";
}

}  // namespace livelink::util
