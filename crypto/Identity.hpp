/**
 * @file Identity.hpp
 * @brief X.509 device identity: certificate plus matching private key
 *
 * An Identity is created once at startup by IdentityLoader and never
 * mutated. It exclusively owns its OpenSSL objects and releases them on
 * destruction.
 *
 * @note The registration ID is the certificate subject common name, which
 *       is what DPS expects for X.509 individual enrollments
 */

#pragma once

#include <openssl/evp.h>
#include <openssl/x509.h>
#include <memory>
#include <string>

namespace devsim {

struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/// SHA-1 fingerprint of the DER encoding as uppercase hex
std::string certificateThumbprint(const X509* cert);

/// Subject distinguished name in RFC 2253 form ("CN=...,O=...")
std::string certificateSubject(const X509* cert);

/// Subject common name, or empty string when absent
std::string certificateCommonName(const X509* cert);

class Identity {
public:
    /**
     * @brief Take ownership of a certificate and its private key
     * @throws CredentialError if either is missing, the key does not match
     *         the certificate, or the subject has no common name
     */
    Identity(X509Ptr certificate, EvpPkeyPtr privateKey);

    Identity(const Identity&) = delete;
    Identity& operator=(const Identity&) = delete;
    Identity(Identity&&) = default;
    Identity& operator=(Identity&&) = default;

    const std::string& thumbprint() const { return thumbprint_; }
    const std::string& subject() const { return subject_; }
    const std::string& registrationId() const { return registrationId_; }

    bool hasPrivateKey() const { return privateKey_ != nullptr; }

    const X509* certificate() const { return certificate_.get(); }
    const EVP_PKEY* privateKey() const { return privateKey_.get(); }

    /// PEM encoding of the certificate
    std::string certificatePem() const;

    /// Unencrypted PKCS#8 PEM encoding of the private key
    std::string privateKeyPem() const;

private:
    X509Ptr certificate_;
    EvpPkeyPtr privateKey_;
    std::string thumbprint_;
    std::string subject_;
    std::string registrationId_;
};

} // namespace devsim
