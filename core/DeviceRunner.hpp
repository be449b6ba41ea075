/**
 * @file DeviceRunner.hpp
 * @brief Device lifecycle: identity, provisioning, hub session, publishing
 *
 * run() performs the whole lifecycle on the calling thread:
 * 1. Load the X.509 identity from the PKCS#12 bundle
 * 2. Register with DPS and obtain the assigned hub and device ID
 * 3. Open the authenticated session to that hub
 * 4. Publish telemetry and log messages until cancelled or a send fails
 * 5. Close the session
 *
 * Every failure is reported with one console line and a non-zero status.
 * No session is created unless registration returned Assigned. Cancellation
 * is observed during provisioning and hub connect as well as while
 * publishing, and always ends with status 0.
 */

#pragma once

#include "CancellationToken.hpp"
#include "HubSession.hpp"
#include "IClock.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace devsim {

/**
 * @brief Configuration for one simulated device
 *
 * @note bundlePassword defaults to the password used when the sample
 *       device bundles are exported
 */
struct DeviceConfig {
    // DPS
    std::string idScope;                      ///< Azure DPS ID Scope (required)
    std::string globalEndpoint = "global.azure-devices-provisioning.net";
    std::uint16_t dpsPort = 8883;
    std::chrono::seconds provisioningTimeout{120};

    // Identity
    std::string bundlePath;                   ///< PKCS#12 bundle with the device certificate (required)
    std::string bundlePassword = "1234";
    std::string rootCaPath;                   ///< Server trust anchor, empty for the system store
    bool verifyServerCert = true;

    // Hub
    std::uint16_t hubPort = 8883;

    // Telemetry
    std::chrono::milliseconds telemetryInterval{1000};

    bool hasRequiredSettings() const {
        return !idScope.empty() && !bundlePath.empty() && telemetryInterval.count() > 0;
    }
};

class DeviceRunner {
public:
    using ClientFactory = SessionManager::ClientFactory;

    /**
     * @param dpsClientFactory Transport for the provisioning connection
     * @param hubClientFactory Transport for the hub session
     * @param clock Source of console timestamps
     */
    DeviceRunner(ClientFactory dpsClientFactory, ClientFactory hubClientFactory,
                 std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    /**
     * @brief Run the device until @p cancel fires or a fatal error occurs
     * @return 0 after an orderly shutdown or cancellation, 1 on any failure
     */
    int run(const DeviceConfig& config, CancellationToken& cancel);

    std::uint64_t telemetrySent() const { return telemetrySent_; }
    std::uint64_t logsSent() const { return logsSent_; }

private:
    ClientFactory dpsClientFactory_;
    ClientFactory hubClientFactory_;
    std::shared_ptr<IClock> clock_;

    std::uint64_t telemetrySent_ = 0;
    std::uint64_t logsSent_ = 0;
};

} // namespace devsim
