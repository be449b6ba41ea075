/**
 * @file DpsProvisioning.hpp
 * @brief Azure Device Provisioning Service (DPS) registration over MQTT with X.509 authentication
 *
 * DPS Workflow:
 * 1. Connect to the global DPS endpoint with the device client certificate
 * 2. Subscribe to the response topic and send the registration request
 * 3. Poll the operation status while DPS reports "assigning"
 * 4. Return the assigned IoT Hub and device ID
 *
 * registerDevice() drives the whole handshake on the calling thread and
 * returns only once a terminal outcome is known. Transport callbacks merely
 * queue events; every subscribe/publish/disconnect is issued by the caller.
 *
 * @note Exactly one registration attempt per call, no internal retry
 */

#pragma once

#include "CancellationToken.hpp"
#include "IMqttClient.hpp"
#include "RegistrationResult.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace devsim {

/**
 * @brief Configuration parameters for Azure Device Provisioning Service
 *
 * @note Timeout should account for network latency and DPS processing time
 */
struct DpsConfig {
    std::string idScope;                    ///< Azure DPS ID Scope (required)
    std::string registrationId;             ///< Certificate common name (required)
    std::string globalEndpoint = "global.azure-devices-provisioning.net"; ///< DPS endpoint
    std::uint16_t port = 8883;              ///< MQTT over TLS port
    TlsConfig tlsConfig;                    ///< X.509 certificate configuration
    std::chrono::seconds timeout{120};      ///< Maximum time for the whole handshake
    std::chrono::milliseconds pollInterval{2000}; ///< Status poll delay when DPS sends no retry-after
};

/**
 * @brief Azure Device Provisioning Service client
 *
 * State Machine:
 * Idle → ConnectingToDps → SendingRegistration → WaitingForAssignment → Completed/Failed
 */
class DpsProvisioning {
public:
    /**
     * @brief Construct DPS provisioning client
     * @param mqttClient MQTT client implementation for DPS communication
     * @throws std::invalid_argument if mqttClient is null
     */
    explicit DpsProvisioning(std::shared_ptr<IMqttClient> mqttClient);

    ~DpsProvisioning();

    DpsProvisioning(const DpsProvisioning&) = delete;
    DpsProvisioning& operator=(const DpsProvisioning&) = delete;

    /**
     * @brief Register the device and wait for the hub assignment
     * @param config DPS configuration parameters
     * @param cancel Checked between transport events; null to never cancel
     * @return Result with status Assigned, assigned hub and device ID
     * @throws std::invalid_argument if idScope or registrationId is empty
     * @throws ProvisioningError if DPS reports failed, disabled or unassigned
     * @throws AuthenticationError if DPS rejects the device certificate
     * @throws TransportError on connection failure, timeout or malformed response
     * @throws CancelledError if @p cancel fires before a terminal outcome
     */
    RegistrationResult registerDevice(const DpsConfig& config, const CancellationToken* cancel = nullptr);

    /// MQTT username DPS expects for a registration
    static std::string buildUsername(const std::string& idScope, const std::string& registrationId);

    /// DPS API version for MQTT communication
    static constexpr const char* kDpsApiVersion = "2019-03-31";

    static constexpr const char* kResponseTopicFilter = "$dps/registrations/res/#";

private:
    enum class State {
        Idle,
        ConnectingToDps,
        SendingRegistration,
        WaitingForAssignment,
        Completed,
        Failed
    };

    /// Transport notification queued for the handshake thread
    struct TransportEvent {
        bool isMessage = false;
        ConnectionStatus status = ConnectionStatus::Disconnected;
        std::string reason;
        MqttMessage message;
    };

    /// Wait slice between processEvents() calls while nothing is queued
    static constexpr std::chrono::milliseconds kEventSlice{50};

    std::shared_ptr<IMqttClient> mqttClient_;
    State state_ = State::Idle;
    DpsConfig config_;
    std::string operationId_;
    int requestId_ = 0;
    std::string pendingRequestId_;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point nextPoll_;

    std::mutex eventMutex_;
    std::condition_variable eventCv_;
    std::deque<TransportEvent> events_;

    void onDpsConnection(ConnectionStatus status, const std::string& reason);
    void onDpsMessage(const MqttMessage& message);

    std::optional<TransportEvent> waitForEvent(std::chrono::steady_clock::time_point until);

    /// @return the terminal result once known
    std::optional<RegistrationResult> handleEvent(const TransportEvent& event);
    void handleConnection(ConnectionStatus status, const std::string& reason);
    std::optional<RegistrationResult> handleResponse(const MqttMessage& message);
    std::optional<RegistrationResult> handleAssignmentResponse(const std::string& payload,
                                                               std::chrono::milliseconds retryAfter);

    void sendRegistration();
    void pollAssignmentStatus();
    void schedulePoll(std::chrono::milliseconds retryAfter);
    void finish(State finalState);

    bool isTimedOut() const;

    std::string nextRequestId();
    std::string buildRegistrationTopic(const std::string& rid) const;
    std::string buildPollingTopic(const std::string& rid) const;
};

} // namespace devsim
