/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * Provides the IMqttClient implementation used by the simulated device,
 * built on the asynchronous API of the Eclipse Paho MQTT C library. Only
 * X.509 client certificate authentication over TLS is supported.
 *
 * @note For embedded platforms, replace with coreMQTT or Paho Embedded C
 * @note Paho invokes callbacks on its own thread; processEvents() is a no-op
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <cstdint>

namespace devsim {

/**
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * One instance represents one broker connection at a time. Calling
 * connectWithTls() again releases the previous connection first.
 *
 * @note disconnect() blocks until Paho confirms the disconnect (bounded by
 *       kDisconnectTimeoutMs) and must not be called from a Paho callback
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();

    /// Disconnects if still connected and destroys the Paho handle
    ~PahoMqttClient() override;

    // Disable copy and assignment to prevent resource management issues
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connectWithTls(const std::string& host, std::uint16_t port,
                       const std::string& clientId,
                       const std::string& username,
                       const TlsConfig& tlsConfig) override;

    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                int qos = 0, bool retained = false) override;

    bool subscribe(const std::string& topic, int qos = 0) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    void processEvents() override;

private:
    /// Azure IoT Hub recommended keep-alive interval (seconds)
    static constexpr int kKeepAliveIntervalSeconds = 240;

    /// Connection timeout for Azure services (seconds)
    static constexpr int kConnectionTimeoutSeconds = 30;

    /// Upper bound for an orderly disconnect (milliseconds)
    static constexpr int kDisconnectTimeoutMs = 2000;

    MQTTAsync client_ = nullptr;          ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};  ///< Current connection state

    MessageCallback messageCallback_;     ///< User callback for incoming messages
    ConnectionCallback connectionCallback_; ///< User callback for connection events

    // Connect parameters kept alive for the lifetime of the handle
    std::string username_;
    TlsConfig tlsConfig_;

    std::mutex disconnectMutex_;
    std::condition_variable disconnectCv_;
    bool disconnectDone_ = false;

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    static void onDisconnectFailure(void* context, MQTTAsync_failureData* response);

    void notifyConnection(ConnectionStatus status, const std::string& reason);
    void markDisconnected();

    /// Release the Paho handle, disconnecting first when connected
    void releaseHandle(bool notify);

    /**
     * @brief Validate certificate files exist and are readable
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if all configured files are accessible, false otherwise
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace devsim
