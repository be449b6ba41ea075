#pragma once

#include "../IClock.hpp"
#include <atomic>
#include <chrono>
#include <string>

namespace devsim::sim {

/**
 * @brief Manually driven clock for tests
 *
 * Time only moves through advance(). Timestamps are rendered in UTC so
 * output does not depend on the machine's time zone.
 */
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point startTime = std::chrono::system_clock::time_point{});
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::system_clock::time_point now() const override;
    std::string localTimestamp() const override;

    void advance(std::chrono::milliseconds duration);

private:
    std::atomic<std::chrono::system_clock::rep> ticks_;
};

} // namespace devsim::sim
