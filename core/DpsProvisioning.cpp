#include "DpsProvisioning.hpp"
#include "Console.hpp"
#include "Errors.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <stdexcept>

namespace devsim {

namespace {

constexpr const char* kResponsePrefix = "$dps/registrations/res/";

/// Parses "$dps/registrations/res/{code}/?$rid=1&retry-after=3"
struct ResponseTopic {
    int statusCode = 0;
    std::map<std::string, std::string> parameters;
};

std::optional<ResponseTopic> parseResponseTopic(const std::string& topic) {
    if (topic.compare(0, std::char_traits<char>::length(kResponsePrefix), kResponsePrefix) != 0) {
        return std::nullopt;
    }

    std::string rest = topic.substr(std::char_traits<char>::length(kResponsePrefix));
    size_t slash = rest.find('/');
    std::string code = rest.substr(0, slash);

    ResponseTopic parsed;
    try {
        size_t consumed = 0;
        parsed.statusCode = std::stoi(code, &consumed);
        if (consumed != code.size()) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    size_t query = rest.find('?');
    if (query == std::string::npos) {
        return parsed;
    }

    std::string params = rest.substr(query + 1);
    size_t start = 0;
    while (start < params.size()) {
        size_t end = params.find('&', start);
        std::string pair = params.substr(start, end == std::string::npos ? std::string::npos : end - start);
        size_t equalPos = pair.find('=');
        if (equalPos != std::string::npos) {
            parsed.parameters[pair.substr(0, equalPos)] = pair.substr(equalPos + 1);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return parsed;
}

std::string stringField(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

DpsProvisioning::DpsProvisioning(std::shared_ptr<IMqttClient> mqttClient)
    : mqttClient_(std::move(mqttClient)) {
    if (!mqttClient_) {
        throw std::invalid_argument("DpsProvisioning requires an MQTT client");
    }

    mqttClient_->setConnectionCallback(
        [this](ConnectionStatus status, const std::string& reason) {
            onDpsConnection(status, reason);
        }
    );

    mqttClient_->setMessageCallback(
        [this](const MqttMessage& message) {
            onDpsMessage(message);
        }
    );
}

DpsProvisioning::~DpsProvisioning() {
    // The client may outlive us; make sure it can no longer reach this object
    mqttClient_->disconnect();
    mqttClient_->setConnectionCallback(nullptr);
    mqttClient_->setMessageCallback(nullptr);
}

std::string DpsProvisioning::buildUsername(const std::string& idScope, const std::string& registrationId) {
    return idScope + "/registrations/" + registrationId + "/api-version=" + kDpsApiVersion;
}

RegistrationResult DpsProvisioning::registerDevice(const DpsConfig& config, const CancellationToken* cancel) {
    if (config.idScope.empty()) {
        throw std::invalid_argument("DPS ID scope must not be empty");
    }
    if (config.registrationId.empty()) {
        throw std::invalid_argument("DPS registration ID must not be empty");
    }

    config_ = config;
    operationId_.clear();
    pendingRequestId_.clear();
    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        events_.clear();
    }

    state_ = State::ConnectingToDps;
    startTime_ = std::chrono::steady_clock::now();
    nextPoll_ = std::chrono::steady_clock::time_point::max();

    console::info("[DPS] Starting provisioning for device: " + config_.registrationId);
    console::info("[DPS] ID Scope: " + config_.idScope);
    console::info("[DPS] Endpoint: " + config_.globalEndpoint + ":" + std::to_string(config_.port));

    bool initiated = mqttClient_->connectWithTls(
        config_.globalEndpoint,
        config_.port,
        config_.registrationId,
        buildUsername(config_.idScope, config_.registrationId),
        config_.tlsConfig
    );

    if (!initiated) {
        finish(State::Failed);
        throw TransportError("Failed to initiate connection to DPS at " + config_.globalEndpoint);
    }

    try {
        while (true) {
            mqttClient_->processEvents();

            auto now = std::chrono::steady_clock::now();
            auto wake = now + kEventSlice;
            if (state_ == State::WaitingForAssignment && nextPoll_ < wake) {
                wake = nextPoll_;
            }

            if (auto event = waitForEvent(wake)) {
                if (auto result = handleEvent(*event)) {
                    finish(State::Completed);
                    return *result;
                }
            }

            if (cancel && cancel->isCancelled()) {
                throw CancelledError("Provisioning cancelled");
            }

            if (isTimedOut()) {
                throw TransportError("Provisioning timed out after " +
                                     std::to_string(config_.timeout.count()) + " s");
            }

            if (state_ == State::WaitingForAssignment &&
                std::chrono::steady_clock::now() >= nextPoll_) {
                pollAssignmentStatus();
            }
        }
    } catch (const DeviceError&) {
        finish(State::Failed);
        throw;
    }
}

void DpsProvisioning::onDpsConnection(ConnectionStatus status, const std::string& reason) {
    TransportEvent event;
    event.status = status;
    event.reason = reason;
    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        events_.push_back(std::move(event));
    }
    eventCv_.notify_one();
}

void DpsProvisioning::onDpsMessage(const MqttMessage& message) {
    TransportEvent event;
    event.isMessage = true;
    event.message = message;
    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        events_.push_back(std::move(event));
    }
    eventCv_.notify_one();
}

std::optional<DpsProvisioning::TransportEvent>
DpsProvisioning::waitForEvent(std::chrono::steady_clock::time_point until) {
    std::unique_lock<std::mutex> lock(eventMutex_);
    if (!eventCv_.wait_until(lock, until, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    TransportEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<RegistrationResult> DpsProvisioning::handleEvent(const TransportEvent& event) {
    if (event.isMessage) {
        return handleResponse(event.message);
    }
    handleConnection(event.status, event.reason);
    return std::nullopt;
}

void DpsProvisioning::handleConnection(ConnectionStatus status, const std::string& reason) {
    if (state_ == State::ConnectingToDps) {
        switch (status) {
            case ConnectionStatus::Connected:
                console::info("[DPS] Connected, sending registration request");
                sendRegistration();
                return;
            case ConnectionStatus::NotAuthorized:
                throw AuthenticationError("DPS rejected the device certificate: " + reason);
            case ConnectionStatus::Disconnected:
                return;
            default:
                throw TransportError("Failed to connect to DPS: " + reason);
        }
    }

    if (status == ConnectionStatus::ConnectionLost) {
        throw TransportError("Connection to DPS lost: " + reason);
    }
}

void DpsProvisioning::sendRegistration() {
    if (!mqttClient_->subscribe(kResponseTopicFilter, 1)) {
        throw TransportError("Failed to subscribe to DPS response topic");
    }

    nlohmann::json body;
    body["registrationId"] = config_.registrationId;

    pendingRequestId_ = nextRequestId();
    if (!mqttClient_->publish(buildRegistrationTopic(pendingRequestId_), body.dump(), 1)) {
        throw TransportError("Failed to send registration request");
    }

    state_ = State::SendingRegistration;
    console::info("[DPS] ProvisioningClient RegisterAsync . . .");
}

std::optional<RegistrationResult> DpsProvisioning::handleResponse(const MqttMessage& message) {
    auto topic = parseResponseTopic(message.topic);
    if (!topic) {
        return std::nullopt;
    }
    if (state_ != State::SendingRegistration && state_ != State::WaitingForAssignment) {
        return std::nullopt;
    }

    auto rid = topic->parameters.find("$rid");
    if (rid != topic->parameters.end() && rid->second != pendingRequestId_) {
        return std::nullopt; // stale answer to an earlier request
    }

    std::chrono::milliseconds retryAfter = config_.pollInterval;
    auto retry = topic->parameters.find("retry-after");
    if (retry != topic->parameters.end()) {
        try {
            retryAfter = std::chrono::seconds(std::stoi(retry->second));
        } catch (const std::exception&) {
            throw TransportError("Malformed retry-after in DPS response: " + retry->second);
        }
    }

    const int code = topic->statusCode;
    if (code == 401) {
        throw AuthenticationError("DPS rejected the device certificate: " + message.payload);
    }
    if (code == 429 && state_ == State::WaitingForAssignment) {
        console::info("[DPS] Throttled, polling again");
        schedulePoll(retryAfter);
        return std::nullopt;
    }
    if (code >= 300) {
        throw TransportError("DPS returned status " + std::to_string(code) + ": " + message.payload);
    }

    return handleAssignmentResponse(message.payload, retryAfter);
}

std::optional<RegistrationResult> DpsProvisioning::handleAssignmentResponse(const std::string& payload,
                                                                            std::chrono::milliseconds retryAfter) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        throw TransportError(std::string("Malformed DPS response: ") + e.what());
    }
    if (!json.is_object()) {
        throw TransportError("Malformed DPS response: " + payload);
    }

    std::string status = stringField(json, "status");
    if (status == "assigning") {
        std::string operationId = stringField(json, "operationId");
        if (operationId.empty()) {
            throw TransportError("DPS response is missing the operation ID");
        }
        if (state_ != State::WaitingForAssignment) {
            console::info("[DPS] Device assignment in progress, operation ID: " + operationId);
        }
        operationId_ = operationId;
        state_ = State::WaitingForAssignment;
        schedulePoll(retryAfter);
        return std::nullopt;
    }

    RegistrationResult result;
    try {
        result.status = stringToRegistrationStatus(status);
    } catch (const std::invalid_argument&) {
        throw TransportError("DPS response has unknown status '" + status + "'");
    }

    nlohmann::json registrationState = json.value("registrationState", nlohmann::json::object());
    if (!registrationState.is_object()) {
        throw TransportError("Malformed registrationState in DPS response");
    }

    if (result.status != RegistrationStatus::Assigned) {
        result.errorMessage = stringField(registrationState, "errorMessage");
        console::error("Device Registration Status: " + registrationStatusToString(result.status));

        std::string message = "Device registration status is " +
                              registrationStatusToString(result.status) + ", not Assigned";
        if (!result.errorMessage.empty()) {
            message += " (" + result.errorMessage + ")";
        }
        throw ProvisioningError(result.status, message);
    }

    result.assignedHub = stringField(registrationState, "assignedHub");
    result.deviceId = stringField(registrationState, "deviceId");
    if (result.assignedHub.empty() || result.deviceId.empty()) {
        throw TransportError("Assignment response missing required fields");
    }

    console::success("Device Registration Status: " + registrationStatusToString(result.status));
    console::success("ProvisioningClient AssignedHub: " + result.assignedHub + "; DeviceID: " + result.deviceId);
    return result;
}

void DpsProvisioning::pollAssignmentStatus() {
    nextPoll_ = std::chrono::steady_clock::time_point::max();

    pendingRequestId_ = nextRequestId();
    if (!mqttClient_->publish(buildPollingTopic(pendingRequestId_), "", 1)) {
        throw TransportError("Failed to send assignment status request");
    }
}

void DpsProvisioning::schedulePoll(std::chrono::milliseconds retryAfter) {
    nextPoll_ = std::chrono::steady_clock::now() + retryAfter;
}

void DpsProvisioning::finish(State finalState) {
    state_ = finalState;
    mqttClient_->disconnect();
}

bool DpsProvisioning::isTimedOut() const {
    if (state_ == State::Idle || state_ == State::Completed || state_ == State::Failed) {
        return false;
    }

    auto now = std::chrono::steady_clock::now();
    return (now - startTime_) > config_.timeout;
}

std::string DpsProvisioning::nextRequestId() {
    return std::to_string(++requestId_);
}

std::string DpsProvisioning::buildRegistrationTopic(const std::string& rid) const {
    return "$dps/registrations/PUT/iotdps-register/?$rid=" + rid;
}

std::string DpsProvisioning::buildPollingTopic(const std::string& rid) const {
    return "$dps/registrations/GET/iotdps-get-operationstatus/?$rid=" + rid +
           "&operationId=" + operationId_;
}

} // namespace devsim
