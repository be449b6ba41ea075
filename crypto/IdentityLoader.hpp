/**
 * @file IdentityLoader.hpp
 * @brief Select the device identity from a password protected PKCS#12 bundle
 *
 * Decodes every certificate and key entry of the bundle and keeps the first
 * certificate, in bundle order, for which the bundle also holds the matching
 * private key. All other entries are released before returning, on success
 * and on every failure path.
 *
 * @note Selection is first-match, not best-match. Bundles should contain
 *       exactly one key-bearing certificate for predictable behavior
 */

#pragma once

#include "Identity.hpp"
#include <functional>
#include <string>

namespace devsim {

/// Diagnostic view of one certificate found in a bundle
struct CertificateEntry {
    std::string thumbprint;
    std::string subject;
    bool hasPrivateKey = false;
};

class IdentityLoader {
public:
    using EntryObserver = std::function<void(const CertificateEntry&)>;

    /**
     * @brief Load the device identity from a PKCS#12 (.pfx/.p12) bundle
     * @param bundlePath Path to the bundle file
     * @param bundlePassword Password protecting MAC, safes and shrouded keys
     * @param observer Optional callback receiving every discovered certificate
     * @return Identity owning the selected certificate and its private key
     * @throws CredentialError if the bundle cannot be opened or decrypted, or
     *         holds no certificate with an associated private key
     */
    static Identity loadIdentity(const std::string& bundlePath,
                                 const std::string& bundlePassword,
                                 const EntryObserver& observer = {});
};

} // namespace devsim
