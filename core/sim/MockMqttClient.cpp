#include "MockMqttClient.hpp"
#include <algorithm>

namespace devsim::sim {

MockMqttClient::MockMqttClient() = default;

bool MockMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const std::string& username,
                                    const TlsConfig& tlsConfig) {
    ConnectionStatus outcome;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++connectCount_;
        lastConnect_ = MockConnectParams{host, port, clientId, username, tlsConfig};

        if (!connectInitiates_) {
            return false;
        }
        if (connectSilently_) {
            return true;
        }

        outcome = connectOutcome_;
        reason = connectReason_.empty() ? connectionStatusToString(outcome) : connectReason_;
        connected_ = outcome == ConnectionStatus::Connected;
    }

    notifyConnection(outcome, reason);
    return true;
}

void MockMqttClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return;
        }
        connected_ = false;
        ++disconnectCount_;
    }
    notifyConnection(ConnectionStatus::Disconnected, "Disconnected");
}

bool MockMqttClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    MockMessage msg;
    Responder responder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_ || failPublish_) {
            return false;
        }

        msg.topic = topic;
        msg.payload = payload;
        msg.qos = qos;
        msg.retained = retained;
        msg.timestamp = std::chrono::steady_clock::now();

        publishedMessages_.push_back(msg);
        responder = responder_;
    }

    if (responder) {
        responder(*this, msg);
    }
    return true;
}

bool MockMqttClient::subscribe(const std::string& topic, int qos) {
    (void)qos;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return false;
    }

    if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
        subscriptions_.push_back(topic);
    }
    return true;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::processEvents() {
    while (true) {
        MockMessage msg;
        MessageCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (incomingMessages_.empty()) {
                return;
            }
            msg = std::move(incomingMessages_.front());
            incomingMessages_.pop();
            callback = messageCallback_;
        }

        if (callback) {
            callback(MqttMessage{msg.topic, msg.payload, msg.qos, msg.retained});
        }
    }
}

void MockMqttClient::setConnectOutcome(ConnectionStatus status, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectOutcome_ = status;
    connectReason_ = reason;
}

void MockMqttClient::setResponder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
}

void MockMqttClient::setFailPublish(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPublish_ = fail;
}

void MockMqttClient::simulateConnectionLoss(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return;
        }
        connected_ = false;
    }
    notifyConnection(ConnectionStatus::ConnectionLost, reason);
}

void MockMqttClient::injectMessage(const std::string& topic, const std::string& payload) {
    MockMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = 0;
    msg.timestamp = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    incomingMessages_.push(msg);
}

std::vector<MockMessage> MockMqttClient::publishedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishedMessages_;
}

std::vector<MockMessage> MockMqttClient::publishedMessagesOn(const std::string& topicPrefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MockMessage> matching;
    for (const auto& msg : publishedMessages_) {
        if (msg.topic.compare(0, topicPrefix.size(), topicPrefix) == 0) {
            matching.push_back(msg);
        }
    }
    return matching;
}

std::vector<std::string> MockMqttClient::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

MockConnectParams MockMqttClient::lastConnect() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastConnect_;
}

int MockMqttClient::connectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectCount_;
}

int MockMqttClient::disconnectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnectCount_;
}

void MockMqttClient::notifyConnection(ConnectionStatus status, const std::string& reason) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(status, reason);
    }
}

} // namespace devsim::sim
