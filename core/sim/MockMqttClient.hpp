#pragma once

#include "../IMqttClient.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace devsim::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos = 0;
    bool retained = false;
    std::chrono::steady_clock::time_point timestamp;
};

struct MockConnectParams {
    std::string host;
    std::uint16_t port = 0;
    std::string clientId;
    std::string username;
    TlsConfig tlsConfig;
};

/**
 * @brief In-memory IMqttClient for tests
 *
 * Connection outcomes are reported synchronously from connectWithTls().
 * Incoming messages are queued and only delivered from processEvents(),
 * on the thread that calls it. A responder can be installed to script a
 * broker: it sees every accepted publish and typically answers with
 * injectMessage(). Publishing is safe from several threads.
 */
class MockMqttClient : public IMqttClient {
public:
    using Responder = std::function<void(MockMqttClient& client, const MockMessage& published)>;

    MockMqttClient();
    ~MockMqttClient() override = default;

    // IMqttClient interface
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

    // Mock-specific methods for testing
    void setConnectOutcome(ConnectionStatus status, const std::string& reason = {});
    void setConnectInitiates(bool initiates) { connectInitiates_ = initiates; }
    void setConnectSilently(bool silent) { connectSilently_ = silent; }
    void setResponder(Responder responder);
    void setFailPublish(bool fail);

    void simulateConnectionLoss(const std::string& reason = "Connection lost");
    void injectMessage(const std::string& topic, const std::string& payload);

    std::vector<MockMessage> publishedMessages() const;
    std::vector<MockMessage> publishedMessagesOn(const std::string& topicPrefix) const;
    std::vector<std::string> subscriptions() const;
    MockConnectParams lastConnect() const;
    int connectCount() const;
    int disconnectCount() const;

private:
    mutable std::mutex mutex_;

    bool connected_ = false;
    bool failPublish_ = false;
    bool connectInitiates_ = true;
    bool connectSilently_ = false;
    ConnectionStatus connectOutcome_ = ConnectionStatus::Connected;
    std::string connectReason_;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    Responder responder_;

    std::vector<MockMessage> publishedMessages_;
    std::queue<MockMessage> incomingMessages_;
    std::vector<std::string> subscriptions_;

    MockConnectParams lastConnect_;
    int connectCount_ = 0;
    int disconnectCount_ = 0;

    void notifyConnection(ConnectionStatus status, const std::string& reason);
};

} // namespace devsim::sim
