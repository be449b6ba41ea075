#include "HubSession.hpp"
#include "Console.hpp"
#include "Errors.hpp"
#include "../crypto/X509Credential.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace devsim {

namespace {

// Percent-encoding for property bag names and values (RFC 3986 unreserved set)
std::string urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

} // namespace

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Created: return "Created";
        case SessionState::Opening: return "Opening";
        case SessionState::Open: return "Open";
        case SessionState::Closing: return "Closing";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
        default: return "Unknown";
    }
}

Session::Session(std::shared_ptr<IMqttClient> mqttClient, std::string hub, std::string deviceId)
    : mqttClient_(std::move(mqttClient))
    , hub_(std::move(hub))
    , deviceId_(std::move(deviceId)) {
    if (!mqttClient_) {
        throw std::invalid_argument("Session requires an MQTT client");
    }

    mqttClient_->setConnectionCallback(
        [this](ConnectionStatus status, const std::string& reason) {
            onConnection(status, reason);
        }
    );
}

Session::~Session() {
    close();
    mqttClient_->setConnectionCallback(nullptr);
}

std::string Session::buildUsername(const std::string& hub, const std::string& deviceId) {
    return hub + "/" + deviceId + "/?api-version=" + kHubApiVersion;
}

std::string Session::buildEventTopic(const std::string& deviceId, SensorType type) {
    return "devices/" + deviceId + "/messages/events/" +
           urlEncode("SensorType") + "=" + urlEncode(sensorTypeToString(type)) +
           "&" + urlEncode("$.ct") + "=" + urlEncode("application/json") +
           "&" + urlEncode("$.ce") + "=" + urlEncode("utf-8");
}

void Session::open(const TlsConfig& tlsConfig, std::uint16_t port, std::chrono::milliseconds timeout,
                   const CancellationToken* cancel) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != SessionState::Created) {
            throw std::logic_error("Session can only be opened once (state " +
                                   sessionStateToString(state_) + ")");
        }
        state_ = SessionState::Opening;
    }

    console::info("[Session] DeviceClient OpenAsync: " + deviceId_ + " -> " + hub_ + ":" + std::to_string(port));

    bool initiated = mqttClient_->connectWithTls(hub_, port, deviceId_,
                                                 buildUsername(hub_, deviceId_), tlsConfig);
    if (!initiated) {
        fail("Failed to initiate connection");
        mqttClient_->disconnect();
        throw TransportError("Failed to initiate connection to " + hub_);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    SessionState outcome = SessionState::Opening;
    ConnectionStatus failureStatus = ConnectionStatus::TransportFailure;
    std::string failureReason;

    while (true) {
        mqttClient_->processEvents();

        if (cancel && cancel->isCancelled()) {
            mqttClient_->disconnect();
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                state_ = SessionState::Closed;
            }
            stateCv_.notify_all();
            throw CancelledError("Session open to " + hub_ + " cancelled");
        }

        std::unique_lock<std::mutex> lock(stateMutex_);
        auto wake = std::min(deadline, std::chrono::steady_clock::now() + kEventSlice);
        stateCv_.wait_until(lock, wake, [this] { return state_ != SessionState::Opening; });

        if (state_ != SessionState::Opening) {
            outcome = state_;
            failureStatus = failureStatus_;
            failureReason = failureReason_;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            state_ = SessionState::Failed;
            failureReason_ = "Timed out waiting for the hub to accept the connection";
            outcome = state_;
            failureReason = failureReason_;
            break;
        }
    }

    if (outcome == SessionState::Open) {
        console::success("[Session] Connected to " + hub_ + " as " + deviceId_);
        return;
    }

    mqttClient_->disconnect();

    if (failureStatus == ConnectionStatus::NotAuthorized) {
        throw AuthenticationError("Hub " + hub_ + " rejected the device certificate: " + failureReason);
    }
    throw TransportError("Failed to open session to " + hub_ + ": " + failureReason);
}

void Session::publish(const OutboundMessage& message) {
    std::lock_guard<std::mutex> sendLock(sendMutex_);

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == SessionState::Closing || state_ == SessionState::Closed) {
            throw SessionClosedError("Session to " + hub_ + " is closed");
        }
        if (state_ != SessionState::Open) {
            std::string detail = failureReason_.empty() ? "" : " (" + failureReason_ + ")";
            throw PublishError("Session is not open, state " + sessionStateToString(state_) + detail);
        }
    }

    if (!mqttClient_->publish(buildEventTopic(deviceId_, message.sensorType), message.payload, 0)) {
        throw PublishError("Transport rejected " + sensorTypeToString(message.sensorType) + " message");
    }
}

void Session::close() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == SessionState::Closed || state_ == SessionState::Closing) {
            return;
        }
        if (state_ == SessionState::Created) {
            state_ = SessionState::Closed;
            return;
        }
        state_ = SessionState::Closing;
    }

    console::info("[Session] DeviceClient CloseAsync.");

    {
        // Let an in-flight send finish before tearing the transport down
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        mqttClient_->disconnect();
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = SessionState::Closed;
    }
    stateCv_.notify_all();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

void Session::onConnection(ConnectionStatus status, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        switch (state_) {
            case SessionState::Opening:
                if (status == ConnectionStatus::Connected) {
                    state_ = SessionState::Open;
                } else if (status != ConnectionStatus::Disconnected) {
                    state_ = SessionState::Failed;
                    failureStatus_ = status;
                    failureReason_ = reason;
                }
                break;
            case SessionState::Open:
                if (status == ConnectionStatus::ConnectionLost) {
                    state_ = SessionState::Failed;
                    failureStatus_ = status;
                    failureReason_ = reason;
                }
                break;
            default:
                break;
        }
    }
    stateCv_.notify_all();

    if (status == ConnectionStatus::ConnectionLost) {
        console::error("[Session] Connection to " + hub_ + " lost: " + reason);
    }
}

void Session::fail(const std::string& reason) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = SessionState::Failed;
    failureReason_ = reason;
}

SessionManager::SessionManager(ClientFactory clientFactory, std::uint16_t port,
                               std::chrono::milliseconds connectTimeout)
    : clientFactory_(std::move(clientFactory))
    , port_(port)
    , connectTimeout_(connectTimeout) {
    if (!clientFactory_) {
        throw std::invalid_argument("SessionManager requires a client factory");
    }
}

std::unique_ptr<Session> SessionManager::open(const std::string& hub, const std::string& deviceId,
                                              const X509Credential& credential,
                                              const CancellationToken* cancel) {
    console::info("[Session] Creating X509 DeviceClient authentication.");

    auto session = std::make_unique<Session>(clientFactory_(), hub, deviceId);
    session->open(credential.tlsConfig(), port_, connectTimeout_, cancel);
    return session;
}

} // namespace devsim
