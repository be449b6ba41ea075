#include "IClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace devsim {

std::string SystemClock::localTimestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(now());

    std::stringstream ss;

    // Use thread-safe localtime_s on Windows, localtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (localtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (localtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    }
#endif

    return ss.str();
}

} // namespace devsim
