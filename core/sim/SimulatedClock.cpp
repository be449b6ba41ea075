#include "SimulatedClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace devsim::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point startTime)
    : ticks_(startTime.time_since_epoch().count()) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    return std::chrono::system_clock::time_point(std::chrono::system_clock::duration(ticks_.load()));
}

std::string SimulatedClock::localTimestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(now());

    std::tm tm_buf{};
    std::stringstream ss;
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    }
    return ss.str();
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    ticks_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(duration).count();
}

} // namespace devsim::sim
