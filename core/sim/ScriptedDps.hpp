#pragma once

#include "MockMqttClient.hpp"
#include <string>

namespace devsim::sim {

/// Canned behavior of the provisioning service for MockMqttClient
struct DpsScript {
    std::string status = "assigned";    ///< Terminal wire status
    std::string assignedHub = "hub.example.net";
    std::string deviceId = "dev-1";
    std::string errorMessage;           ///< Sent in registrationState for non-assigned outcomes
    int assigningPolls = 1;             ///< 202 "assigning" answers before the terminal one
    int retryAfterSeconds = 0;
    int registerStatusCode = 0;         ///< Non-zero: answer the register request with this code
    std::string operationId = "4.0123456789abcdef.00000000-0000-0000-0000-000000000001";
};

/**
 * @brief Build a responder that answers DPS register and status requests
 *
 * Answers are queued on the client and delivered by its processEvents().
 */
MockMqttClient::Responder makeDpsResponder(const DpsScript& script);

} // namespace devsim::sim
