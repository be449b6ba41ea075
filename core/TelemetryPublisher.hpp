/**
 * @file TelemetryPublisher.hpp
 * @brief Two concurrent publish loops, telemetry and log, over one hub session
 *
 * Each loop owns its own sensor and sends one reading per interval, tagged
 * "Stelemetry" or "Slog". The loops stop on the shared cancellation token or
 * on the first publish failure; a failure cancels the token so the sibling
 * loop stops too, and run() rethrows it once both loops have exited.
 */

#pragma once

#include "CancellationToken.hpp"
#include "EnvironmentSensor.hpp"
#include "HubSession.hpp"
#include "IClock.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace devsim {

class TelemetryPublisher {
public:
    /// Called once per loop, concurrently from both loop threads
    using SensorFactory = std::function<std::unique_ptr<EnvironmentSensor>()>;

    static constexpr std::chrono::milliseconds kDefaultInterval{1000};

    /**
     * @param session Open session, owned by the caller and outliving run()
     * @param interval Delay between two sends of the same loop
     * @param clock Source of console timestamps
     * @param sensorFactory Defaults to a randomly seeded sensor
     */
    explicit TelemetryPublisher(Session& session,
                                std::chrono::milliseconds interval = kDefaultInterval,
                                std::shared_ptr<IClock> clock = std::make_shared<SystemClock>(),
                                SensorFactory sensorFactory = {});

    /**
     * @brief Run both loops until cancellation or the first failure
     * @throws PublishError or SessionClosedError raised by either loop
     */
    void run(CancellationToken& cancel);

    std::uint64_t telemetryCount() const { return telemetryCount_.load(); }
    std::uint64_t logCount() const { return logCount_.load(); }

private:
    Session& session_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<IClock> clock_;
    SensorFactory sensorFactory_;

    std::atomic<std::uint64_t> telemetryCount_{0};
    std::atomic<std::uint64_t> logCount_{0};

    void runLoop(SensorType type, std::atomic<std::uint64_t>& counter, CancellationToken& cancel);
};

} // namespace devsim
