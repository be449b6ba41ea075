#include "ScriptedDps.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace devsim::sim {

namespace {

constexpr const char* kRegisterPrefix = "$dps/registrations/PUT/iotdps-register/";
constexpr const char* kStatusPrefix = "$dps/registrations/GET/iotdps-get-operationstatus/";

bool startsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string requestId(const std::string& topic) {
    size_t start = topic.find("$rid=");
    if (start == std::string::npos) {
        return {};
    }
    start += 5;
    size_t end = topic.find('&', start);
    return topic.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string responseTopic(int code, const std::string& rid, int retryAfter) {
    return "$dps/registrations/res/" + std::to_string(code) + "/?$rid=" + rid +
           "&retry-after=" + std::to_string(retryAfter);
}

std::string assigningBody(const DpsScript& script) {
    nlohmann::json body;
    body["operationId"] = script.operationId;
    body["status"] = "assigning";
    return body.dump();
}

std::string terminalBody(const DpsScript& script, const std::string& registrationId) {
    nlohmann::json state;
    state["registrationId"] = registrationId;
    state["status"] = script.status;
    if (script.status == "assigned") {
        state["assignedHub"] = script.assignedHub;
        state["deviceId"] = script.deviceId;
    } else if (!script.errorMessage.empty()) {
        state["errorMessage"] = script.errorMessage;
    }

    nlohmann::json body;
    body["operationId"] = script.operationId;
    body["status"] = script.status;
    body["registrationState"] = state;
    return body.dump();
}

} // namespace

MockMqttClient::Responder makeDpsResponder(const DpsScript& script) {
    auto answered = std::make_shared<int>(0);

    return [script, answered](MockMqttClient& client, const MockMessage& published) {
        const bool isRegister = startsWith(published.topic, kRegisterPrefix);
        const bool isStatus = startsWith(published.topic, kStatusPrefix);
        if (!isRegister && !isStatus) {
            return;
        }

        const std::string rid = requestId(published.topic);

        if (isRegister && script.registerStatusCode != 0) {
            client.injectMessage(responseTopic(script.registerStatusCode, rid, script.retryAfterSeconds),
                                 "{\"errorCode\":" + std::to_string(script.registerStatusCode) + "}");
            return;
        }

        if ((*answered)++ < script.assigningPolls) {
            client.injectMessage(responseTopic(202, rid, script.retryAfterSeconds), assigningBody(script));
            return;
        }

        std::string registrationId;
        if (isRegister) {
            registrationId = nlohmann::json::parse(published.payload).value("registrationId", "");
        }
        client.injectMessage(responseTopic(200, rid, script.retryAfterSeconds),
                             terminalBody(script, registrationId));
    };
}

} // namespace devsim::sim
