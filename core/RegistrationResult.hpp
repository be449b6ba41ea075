#pragma once

#include <string>

namespace devsim {

/// Terminal registration states reported by the provisioning service
enum class RegistrationStatus {
    Assigned,
    Failed,
    Disabled,
    Unassigned
};

/**
 * @brief Outcome of one provisioning attempt
 *
 * assignedHub and deviceId are only populated when status is Assigned.
 */
struct RegistrationResult {
    RegistrationStatus status = RegistrationStatus::Unassigned;
    std::string assignedHub;
    std::string deviceId;
    std::string errorMessage;       ///< Service supplied detail for non-Assigned outcomes
};

std::string registrationStatusToString(RegistrationStatus status);

/// Parses the lowercase DPS wire value ("assigned", "disabled", ...)
/// @throws std::invalid_argument for unknown values (including "assigning")
RegistrationStatus stringToRegistrationStatus(const std::string& str);

} // namespace devsim
