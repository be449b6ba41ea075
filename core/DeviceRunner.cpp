#include "DeviceRunner.hpp"
#include "Console.hpp"
#include "DpsProvisioning.hpp"
#include "Errors.hpp"
#include "TelemetryPublisher.hpp"
#include "../crypto/IdentityLoader.hpp"
#include "../crypto/X509Credential.hpp"
#include <stdexcept>

namespace devsim {

DeviceRunner::DeviceRunner(ClientFactory dpsClientFactory, ClientFactory hubClientFactory,
                           std::shared_ptr<IClock> clock)
    : dpsClientFactory_(std::move(dpsClientFactory))
    , hubClientFactory_(std::move(hubClientFactory))
    , clock_(std::move(clock)) {
    if (!dpsClientFactory_ || !hubClientFactory_) {
        throw std::invalid_argument("DeviceRunner requires DPS and hub client factories");
    }
}

int DeviceRunner::run(const DeviceConfig& config, CancellationToken& cancel) {
    if (!config.hasRequiredSettings()) {
        console::error("[Device] Invalid configuration: id_scope and bundle_path are required, "
                       "interval must be positive");
        return 1;
    }

    try {
        auto identity = std::make_shared<const Identity>(
            IdentityLoader::loadIdentity(config.bundlePath, config.bundlePassword));
        X509Credential credential(identity, config.rootCaPath, config.verifyServerCert);

        console::highlight("\nRegistrationID = " + credential.registrationId());

        RegistrationResult registration;
        {
            DpsConfig dpsConfig;
            dpsConfig.idScope = config.idScope;
            dpsConfig.registrationId = credential.registrationId();
            dpsConfig.globalEndpoint = config.globalEndpoint;
            dpsConfig.port = config.dpsPort;
            dpsConfig.tlsConfig = credential.tlsConfig();
            dpsConfig.timeout = config.provisioningTimeout;

            DpsProvisioning provisioning(dpsClientFactory_());
            registration = provisioning.registerDevice(dpsConfig, &cancel);
        }

        if (cancel.isCancelled()) {
            console::info("[Device] Cancelled before opening the hub session");
            return 0;
        }

        SessionManager sessions(hubClientFactory_, config.hubPort);
        std::unique_ptr<Session> session =
            sessions.open(registration.assignedHub, registration.deviceId, credential, &cancel);

        console::info("Simulated Device. Ctrl-C to exit.");
        console::highlight("\nStart reading and sending device telemetry...\n");

        TelemetryPublisher publisher(*session, config.telemetryInterval, clock_);
        try {
            publisher.run(cancel);
        } catch (const std::exception&) {
            telemetrySent_ = publisher.telemetryCount();
            logsSent_ = publisher.logCount();
            session->close();
            throw;
        }

        telemetrySent_ = publisher.telemetryCount();
        logsSent_ = publisher.logCount();
        session->close();

        console::success("[Device] Stopped after " + std::to_string(telemetrySent_) +
                         " telemetry and " + std::to_string(logsSent_) + " log messages");
        return 0;
    } catch (const CancelledError& e) {
        console::info(std::string("[Device] ") + e.what());
        return 0;
    } catch (const DeviceError& e) {
        console::error(std::string("[Device] ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        console::error(std::string("[Device] Unexpected failure: ") + e.what());
        return 1;
    }
}

} // namespace devsim
