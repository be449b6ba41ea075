#include "TelemetryPublisher.hpp"
#include "Console.hpp"
#include "JsonCodec.hpp"
#include <exception>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace devsim {

TelemetryPublisher::TelemetryPublisher(Session& session,
                                       std::chrono::milliseconds interval,
                                       std::shared_ptr<IClock> clock,
                                       SensorFactory sensorFactory)
    : session_(session)
    , interval_(interval)
    , clock_(std::move(clock))
    , sensorFactory_(std::move(sensorFactory)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Publish interval must be positive");
    }
    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }
    if (!sensorFactory_) {
        sensorFactory_ = [] {
            return std::make_unique<EnvironmentSensor>(std::make_shared<StandardRng>());
        };
    }
}

void TelemetryPublisher::run(CancellationToken& cancel) {
    std::mutex failureMutex;
    std::exception_ptr failure;

    auto worker = [&](SensorType type, std::atomic<std::uint64_t>& counter) {
        try {
            runLoop(type, counter, cancel);
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(failureMutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
            cancel.cancel();
        }
    };

    std::thread telemetry(worker, SensorType::Telemetry, std::ref(telemetryCount_));
    std::thread logs;
    try {
        logs = std::thread(worker, SensorType::Log, std::ref(logCount_));
    } catch (const std::system_error&) {
        cancel.cancel();
        telemetry.join();
        throw;
    }

    telemetry.join();
    logs.join();

    if (failure) {
        std::rethrow_exception(failure);
    }
}

void TelemetryPublisher::runLoop(SensorType type, std::atomic<std::uint64_t>& counter,
                                 CancellationToken& cancel) {
    auto sensor = sensorFactory_();

    while (!cancel.isCancelled()) {
        OutboundMessage message = JsonCodec::makeMessage(sensor->read(), type);

        session_.publish(message);
        ++counter;
        console::info(clock_->localTimestamp() + " > Sending " + sensorTypeToString(type) +
                      " message: " + message.payload);

        if (cancel.waitFor(interval_)) {
            break;
        }
    }
}

} // namespace devsim
