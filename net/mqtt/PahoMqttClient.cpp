#include "PahoMqttClient.hpp"
#include "Console.hpp"
#include <chrono>
#include <fstream>

namespace devsim {

PahoMqttClient::PahoMqttClient() = default;

PahoMqttClient::~PahoMqttClient() {
    releaseHandle(false);
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                   const std::string& clientId,
                                   const std::string& username,
                                   const TlsConfig& tlsConfig) {
    console::info("[MQTT] Connecting with TLS to " + host + ":" + std::to_string(port));
    console::info("[MQTT] Client ID: " + clientId);
    console::info("[MQTT] Username: " + username);

    // Validate certificate files before attempting connection
    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }

    releaseHandle(false);

    username_ = username;
    tlsConfig_ = tlsConfig;

    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        console::error("[MQTT] Failed to create client, error code: " + std::to_string(rc));
        client_ = nullptr;
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        console::error("[MQTT] Failed to register callbacks, error code: " + std::to_string(rc));
        MQTTAsync_destroy(&client_);
        return false;
    }

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    conn_opts.username = username_.c_str();
    conn_opts.ssl = &ssl_opts;

    // X.509 client certificate authentication, no password
    ssl_opts.keyStore = tlsConfig_.certPath.c_str();
    ssl_opts.privateKey = tlsConfig_.keyPath.c_str();
    ssl_opts.trustStore = tlsConfig_.caPath.empty() ? nullptr : tlsConfig_.caPath.c_str();
    ssl_opts.enableServerCertAuth = tlsConfig_.verifyServer ? 1 : 0;
    ssl_opts.verify = tlsConfig_.verifyServer ? 1 : 0;
    ssl_opts.enabledCipherSuites = nullptr;
    ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        console::error("[MQTT] Connection attempt failed, error code: " + std::to_string(rc));
        MQTTAsync_destroy(&client_);
        return false;
    }

    return true;
}

void PahoMqttClient::disconnect() {
    releaseHandle(true);
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                           int qos, bool retained) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.data()));
    pubmsg.payloadlen = static_cast<int>(payload.size());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::processEvents() {
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    if (client->messageCallback_) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
        msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
        msg.qos = message->qos;
        msg.retained = message->retained != 0;

        client->messageCallback_(msg);
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    client->notifyConnection(ConnectionStatus::Connected, "Connected successfully");
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    ConnectionStatus status = ConnectionStatus::TransportFailure;
    std::string reason = "Connection failed";
    if (response) {
        // Positive codes are CONNACK return codes, negative ones are local failures
        if (response->code == 4 || response->code == 5) {
            status = ConnectionStatus::NotAuthorized;
        } else if (response->code > 0) {
            status = ConnectionStatus::Refused;
        }
        reason = "return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    client->notifyConnection(status, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    client->notifyConnection(ConnectionStatus::ConnectionLost,
                             cause ? std::string(cause) : "Connection lost");
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;
    static_cast<PahoMqttClient*>(context)->markDisconnected();
}

void PahoMqttClient::onDisconnectFailure(void* context, MQTTAsync_failureData* response) {
    (void)response;
    static_cast<PahoMqttClient*>(context)->markDisconnected();
}

void PahoMqttClient::notifyConnection(ConnectionStatus status, const std::string& reason) {
    if (connectionCallback_) {
        connectionCallback_(status, reason);
    }
}

void PahoMqttClient::markDisconnected() {
    {
        std::lock_guard<std::mutex> lock(disconnectMutex_);
        disconnectDone_ = true;
    }
    connected_ = false;
    disconnectCv_.notify_all();
}

void PahoMqttClient::releaseHandle(bool notify) {
    if (!client_) {
        return;
    }

    if (MQTTAsync_isConnected(client_)) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.timeout = kDisconnectTimeoutMs;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.onFailure = onDisconnectFailure;
        disc_opts.context = this;

        {
            std::lock_guard<std::mutex> lock(disconnectMutex_);
            disconnectDone_ = false;
        }

        if (MQTTAsync_disconnect(client_, &disc_opts) == MQTTASYNC_SUCCESS) {
            std::unique_lock<std::mutex> lock(disconnectMutex_);
            disconnectCv_.wait_for(lock, std::chrono::milliseconds(kDisconnectTimeoutMs),
                                   [this] { return disconnectDone_; });
        }
    }

    connected_ = false;
    MQTTAsync_destroy(&client_);
    client_ = nullptr;

    if (notify) {
        notifyConnection(ConnectionStatus::Disconnected, "Disconnected");
    }
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    std::ifstream certFile(tlsConfig.certPath);
    if (!certFile.good()) {
        console::error("[MQTT] ERROR: Certificate file not found: " + tlsConfig.certPath);
        return false;
    }

    std::ifstream keyFile(tlsConfig.keyPath);
    if (!keyFile.good()) {
        console::error("[MQTT] ERROR: Private key file not found: " + tlsConfig.keyPath);
        return false;
    }

    if (!tlsConfig.caPath.empty()) {
        std::ifstream caFile(tlsConfig.caPath);
        if (!caFile.good()) {
            console::error("[MQTT] ERROR: CA file not found: " + tlsConfig.caPath);
            return false;
        }
    }

    return true;
}

} // namespace devsim
