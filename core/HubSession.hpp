/**
 * @file HubSession.hpp
 * @brief Authenticated MQTT session to the assigned Azure IoT Hub
 *
 * State machine:
 * Created → Opening → Open → Closing → Closed
 * Opening/Open → Failed on an unrecoverable transport error (including a
 * lost connection). Failed → Closed only through close(). A session never
 * returns to Open; reconnecting means opening a new Session.
 *
 * @note Publish may be called concurrently; sends are serialized internally
 */

#pragma once

#include "CancellationToken.hpp"
#include "IMqttClient.hpp"
#include "Message.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace devsim {

class X509Credential;

enum class SessionState {
    Created,
    Opening,
    Open,
    Closing,
    Closed,
    Failed
};

std::string sessionStateToString(SessionState state);

class Session {
public:
    /// IoT Hub MQTT API version
    static constexpr const char* kHubApiVersion = "2021-04-12";

    Session(std::shared_ptr<IMqttClient> mqttClient, std::string hub, std::string deviceId);

    /// Closes the session if still open
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Connect to the hub and wait for the CONNACK
     * @throws AuthenticationError if the hub rejects the certificate
     * @throws TransportError on connection failure or timeout
     * @throws CancelledError if @p cancel fires before the CONNACK; the session ends Closed
     * @throws std::logic_error if the session was already opened
     */
    void open(const TlsConfig& tlsConfig, std::uint16_t port, std::chrono::milliseconds timeout,
              const CancellationToken* cancel = nullptr);

    /**
     * @brief Send one device-to-cloud message, fire-and-forget
     * @throws SessionClosedError after close()
     * @throws PublishError if the session is not Open or the transport rejects the send
     */
    void publish(const OutboundMessage& message);

    /// Release transport resources; idempotent
    void close();

    SessionState state() const;

    const std::string& hub() const { return hub_; }
    const std::string& deviceId() const { return deviceId_; }

    static std::string buildUsername(const std::string& hub, const std::string& deviceId);

    /// devices/{id}/messages/events/ with SensorType, content type and encoding as property bag
    static std::string buildEventTopic(const std::string& deviceId, SensorType type);

private:
    static constexpr std::chrono::milliseconds kEventSlice{50};

    std::shared_ptr<IMqttClient> mqttClient_;
    std::string hub_;
    std::string deviceId_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    SessionState state_ = SessionState::Created;
    ConnectionStatus failureStatus_ = ConnectionStatus::TransportFailure;
    std::string failureReason_;

    std::mutex sendMutex_;

    void onConnection(ConnectionStatus status, const std::string& reason);
    void fail(const std::string& reason);
};

/**
 * @brief Builds authenticated sessions to the assigned hub
 *
 * The client factory supplies a fresh transport per session, which lets
 * tests substitute the mock client.
 */
class SessionManager {
public:
    using ClientFactory = std::function<std::shared_ptr<IMqttClient>()>;

    static constexpr std::uint16_t kDefaultPort = 8883;
    static constexpr std::chrono::seconds kConnectTimeout{30};

    explicit SessionManager(ClientFactory clientFactory,
                            std::uint16_t port = kDefaultPort,
                            std::chrono::milliseconds connectTimeout = kConnectTimeout);

    /**
     * @brief Open a session to @p hub as @p deviceId with the X.509 credential
     * @throws AuthenticationError if the hub rejects the certificate
     * @throws TransportError on connection failure or timeout
     * @throws CancelledError if @p cancel fires while connecting
     */
    std::unique_ptr<Session> open(const std::string& hub, const std::string& deviceId,
                                  const X509Credential& credential,
                                  const CancellationToken* cancel = nullptr);

private:
    ClientFactory clientFactory_;
    std::uint16_t port_;
    std::chrono::milliseconds connectTimeout_;
};

} // namespace devsim
