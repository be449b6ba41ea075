/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface for Azure DPS and IoT Hub connectivity
 *
 * Provides a platform-independent MQTT client abstraction for X.509
 * certificate authentication. Both the provisioning handshake and the
 * telemetry session are written against this interface so that tests can
 * substitute the in-memory mock for the Paho implementation.
 *
 * @note Connection outcomes are reported through the connection callback;
 *       connectWithTls only reports whether the attempt could be started
 * @note Callbacks may arrive on a transport thread - implementations of the
 *       domain side must synchronize accordingly
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace devsim {

/**
 * @brief MQTT message structure for device-to-cloud and cloud-to-device traffic
 *
 * @note QoS levels: 0 (at most once), 1 (at least once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g., "devices/{deviceId}/messages/events/")
    std::string payload;            ///< Message payload (typically JSON)
    int qos = 0;                    ///< Quality of Service level
    bool retained = false;          ///< Retain flag
};

/**
 * @brief TLS configuration for X.509 certificate-based authentication
 *
 * @note Certificate and key must be PEM files; see X509Credential for how
 *       an identity loaded from a PKCS#12 bundle is materialized
 */
struct TlsConfig {
    std::string certPath;          ///< Path to client certificate file (.pem)
    std::string keyPath;           ///< Path to private key file (.pem)
    std::string caPath;            ///< Path to root CA file (.pem), empty for system trust store
    bool verifyServer = true;      ///< Enable server certificate validation
};

/// Outcome classes delivered through the connection callback
enum class ConnectionStatus {
    Connected,          ///< CONNACK accepted
    NotAuthorized,      ///< Broker refused the credentials (CONNACK 4 or 5)
    Refused,            ///< Broker refused for another reason
    TransportFailure,   ///< TCP/TLS level failure before CONNACK
    ConnectionLost,     ///< Established connection dropped
    Disconnected        ///< Orderly local disconnect completed
};

std::string connectionStatusToString(ConnectionStatus status);

/**
 * @brief Platform-independent MQTT client interface
 *
 * @note Platform implementations can use Paho MQTT (desktop) or coreMQTT (embedded)
 */
class IMqttClient {
public:
    /// Virtual destructor for proper cleanup in derived classes
    virtual ~IMqttClient() = default;

    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(ConnectionStatus status, const std::string& reason)>;

    /**
     * @brief Connect to MQTT broker using X.509 certificate authentication
     * @param host Broker hostname (e.g., "global.azure-devices-provisioning.net")
     * @param port Broker port (8883 for MQTT over TLS)
     * @param clientId Client identifier (registration ID for DPS, device ID for IoT Hub)
     * @param username MQTT username (scope/hub path with API version)
     * @param tlsConfig Certificate, key and trust configuration
     * @return true if the attempt was initiated, false otherwise
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                               const std::string& clientId,
                               const std::string& username,
                               const TlsConfig& tlsConfig) = 0;

    /**
     * @brief Disconnect from the broker and release transport resources
     * @note Safe to call when not connected
     */
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @return true if the message was accepted for sending, false otherwise
     * @note Fire-and-forget: delivery acknowledgement is not awaited
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos = 0, bool retained = false) = 0;

    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    /**
     * @brief Process pending MQTT events
     * @note Non-blocking; a no-op for implementations with their own thread
     */
    virtual void processEvents() = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace devsim
