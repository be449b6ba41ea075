#include "IMqttClient.hpp"

namespace devsim {

std::string connectionStatusToString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected: return "Connected";
        case ConnectionStatus::NotAuthorized: return "NotAuthorized";
        case ConnectionStatus::Refused: return "Refused";
        case ConnectionStatus::TransportFailure: return "TransportFailure";
        case ConnectionStatus::ConnectionLost: return "ConnectionLost";
        case ConnectionStatus::Disconnected: return "Disconnected";
        default: return "Unknown";
    }
}

} // namespace devsim
