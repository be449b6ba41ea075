/**
 * @file Errors.hpp
 * @brief Failure taxonomy for the device lifecycle
 *
 * Every failure surfaced by identity loading, provisioning, session
 * management and publishing derives from DeviceError so the orchestrator
 * can report it with a single handler. Transport adapters below this layer
 * report with bool returns and callbacks; the domain classes translate.
 *
 * @note None of these errors is retried internally
 */

#pragma once

#include "RegistrationResult.hpp"
#include <stdexcept>
#include <string>

namespace devsim {

/// Base class for all fatal device lifecycle failures
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& message) : std::runtime_error(message) {}
};

/// Credential bundle missing, unreadable, undecryptable or without a usable key
class CredentialError : public DeviceError {
public:
    explicit CredentialError(const std::string& message) : DeviceError(message) {}
};

/// Registration handshake completed but the device was not assigned
class ProvisioningError : public DeviceError {
public:
    ProvisioningError(RegistrationStatus status, const std::string& message)
        : DeviceError(message), status_(status) {}

    RegistrationStatus status() const { return status_; }

private:
    RegistrationStatus status_;
};

/// Network or protocol failure at the provisioning or session layer
class TransportError : public DeviceError {
public:
    explicit TransportError(const std::string& message) : DeviceError(message) {}
};

/// Endpoint rejected the device certificate
class AuthenticationError : public DeviceError {
public:
    explicit AuthenticationError(const std::string& message) : DeviceError(message) {}
};

/// Send failed, or the session is not open
class PublishError : public DeviceError {
public:
    explicit PublishError(const std::string& message) : DeviceError(message) {}
};

/// Operation attempted on a session that was closed
class SessionClosedError : public PublishError {
public:
    explicit SessionClosedError(const std::string& message) : PublishError(message) {}
};

/// A blocking setup step was interrupted by the cancellation token
class CancelledError : public DeviceError {
public:
    explicit CancelledError(const std::string& message) : DeviceError(message) {}
};

} // namespace devsim
