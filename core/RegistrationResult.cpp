#include "RegistrationResult.hpp"
#include <stdexcept>

namespace devsim {

std::string registrationStatusToString(RegistrationStatus status) {
    switch (status) {
        case RegistrationStatus::Assigned: return "Assigned";
        case RegistrationStatus::Failed: return "Failed";
        case RegistrationStatus::Disabled: return "Disabled";
        case RegistrationStatus::Unassigned: return "Unassigned";
        default: return "Unknown";
    }
}

RegistrationStatus stringToRegistrationStatus(const std::string& str) {
    if (str == "assigned") return RegistrationStatus::Assigned;
    if (str == "failed") return RegistrationStatus::Failed;
    if (str == "disabled") return RegistrationStatus::Disabled;
    if (str == "unassigned") return RegistrationStatus::Unassigned;
    throw std::invalid_argument("Unknown registration status: " + str);
}

} // namespace devsim
