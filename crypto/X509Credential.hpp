/**
 * @file X509Credential.hpp
 * @brief TLS client credential derived from the loaded device identity
 *
 * The MQTT transport reads the client certificate and key from PEM files.
 * X509Credential writes the identity once into a private temporary
 * directory (owner-only permissions) and removes it again on destruction.
 * One credential serves both the provisioning connection and the hub
 * session.
 */

#pragma once

#include "Identity.hpp"
#include "../core/IMqttClient.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace devsim {

class X509Credential {
public:
    /**
     * @brief Materialize @p identity for TLS client authentication
     * @param identity Loaded device identity, shared with the orchestrator
     * @param rootCaPath Trust anchor for the server, empty for the system store
     * @param verifyServer Validate the server certificate chain
     * @throws CredentialError if the PEM files cannot be written
     */
    explicit X509Credential(std::shared_ptr<const Identity> identity,
                            std::string rootCaPath = {},
                            bool verifyServer = true);

    ~X509Credential();

    X509Credential(const X509Credential&) = delete;
    X509Credential& operator=(const X509Credential&) = delete;

    const Identity& identity() const { return *identity_; }
    const std::string& registrationId() const { return identity_->registrationId(); }

    /// Paths handed to IMqttClient::connectWithTls
    TlsConfig tlsConfig() const;

    const std::filesystem::path& directory() const { return directory_; }

    static constexpr const char* kCertificateFile = "device.cert.pem";
    static constexpr const char* kPrivateKeyFile = "device.key.pem";

private:
    std::shared_ptr<const Identity> identity_;
    std::filesystem::path directory_;
    std::string rootCaPath_;
    bool verifyServer_;

    void materialize();
    static std::filesystem::path createPrivateDirectory();
    static void writeFile(const std::filesystem::path& path, const std::string& contents);
};

} // namespace devsim
