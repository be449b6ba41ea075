#include <gtest/gtest.h>
#include "../core/DpsProvisioning.hpp"
#include "../core/Errors.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/sim/ScriptedDps.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <thread>

using namespace devsim;

class DpsProvisioningTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<sim::MockMqttClient>();

        config_.idScope = "0ne00ABCDEF";
        config_.registrationId = "device-01";
        config_.tlsConfig.certPath = "device.cert.pem";
        config_.tlsConfig.keyPath = "device.key.pem";
        config_.timeout = std::chrono::seconds(5);
        config_.pollInterval = std::chrono::milliseconds(10);
    }

    RegistrationResult registerWith(const sim::DpsScript& script) {
        client_->setResponder(sim::makeDpsResponder(script));
        DpsProvisioning provisioning(client_);
        return provisioning.registerDevice(config_);
    }

    std::shared_ptr<sim::MockMqttClient> client_;
    DpsConfig config_;
};

TEST_F(DpsProvisioningTest, AssignedAfterPolling) {
    sim::DpsScript script;
    script.assigningPolls = 2;

    RegistrationResult result = registerWith(script);

    EXPECT_EQ(result.status, RegistrationStatus::Assigned);
    EXPECT_EQ(result.assignedHub, "hub.example.net");
    EXPECT_EQ(result.deviceId, "dev-1");

    auto connect = client_->lastConnect();
    EXPECT_EQ(connect.host, "global.azure-devices-provisioning.net");
    EXPECT_EQ(connect.port, 8883);
    EXPECT_EQ(connect.clientId, "device-01");
    EXPECT_EQ(connect.username, "0ne00ABCDEF/registrations/device-01/api-version=2019-03-31");
    EXPECT_EQ(connect.tlsConfig.certPath, "device.cert.pem");

    auto subscriptions = client_->subscriptions();
    ASSERT_EQ(subscriptions.size(), 1u);
    EXPECT_EQ(subscriptions[0], "$dps/registrations/res/#");

    auto registers = client_->publishedMessagesOn("$dps/registrations/PUT/iotdps-register/");
    ASSERT_EQ(registers.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(registers[0].payload).at("registrationId").get<std::string>(), "device-01");

    auto polls = client_->publishedMessagesOn("$dps/registrations/GET/iotdps-get-operationstatus/");
    ASSERT_EQ(polls.size(), 2u);
    EXPECT_NE(polls[0].topic.find("operationId=" + script.operationId), std::string::npos);

    // Connection is released once the handshake completes
    EXPECT_FALSE(client_->isConnected());
    EXPECT_EQ(client_->disconnectCount(), 1);
}

TEST_F(DpsProvisioningTest, ImmediateAssignmentNeedsNoPolling) {
    sim::DpsScript script;
    script.assigningPolls = 0;

    RegistrationResult result = registerWith(script);

    EXPECT_EQ(result.status, RegistrationStatus::Assigned);
    EXPECT_TRUE(client_->publishedMessagesOn("$dps/registrations/GET/").empty());
}

TEST_F(DpsProvisioningTest, DisabledEnrollmentRaisesProvisioningError) {
    sim::DpsScript script;
    script.status = "disabled";
    script.errorMessage = "Enrollment is disabled";

    try {
        registerWith(script);
        FAIL() << "Expected ProvisioningError";
    } catch (const ProvisioningError& e) {
        EXPECT_EQ(e.status(), RegistrationStatus::Disabled);
        EXPECT_NE(std::string(e.what()).find("Enrollment is disabled"), std::string::npos);
    }
    EXPECT_FALSE(client_->isConnected());
}

TEST_F(DpsProvisioningTest, FailedRegistrationRaisesProvisioningError) {
    sim::DpsScript script;
    script.status = "failed";

    try {
        registerWith(script);
        FAIL() << "Expected ProvisioningError";
    } catch (const ProvisioningError& e) {
        EXPECT_EQ(e.status(), RegistrationStatus::Failed);
    }
}

TEST_F(DpsProvisioningTest, UnknownStatusIsTransportError) {
    sim::DpsScript script;
    script.status = "bogus";
    EXPECT_THROW(registerWith(script), TransportError);
}

TEST_F(DpsProvisioningTest, NotAuthorizedConnackIsAuthenticationError) {
    client_->setConnectOutcome(ConnectionStatus::NotAuthorized, "return code 5");
    DpsProvisioning provisioning(client_);
    EXPECT_THROW(provisioning.registerDevice(config_), AuthenticationError);
}

TEST_F(DpsProvisioningTest, UnauthorizedResponseIsAuthenticationError) {
    sim::DpsScript script;
    script.registerStatusCode = 401;
    EXPECT_THROW(registerWith(script), AuthenticationError);
}

TEST_F(DpsProvisioningTest, ServerErrorIsTransportError) {
    sim::DpsScript script;
    script.registerStatusCode = 500;
    EXPECT_THROW(registerWith(script), TransportError);
}

TEST_F(DpsProvisioningTest, RefusedConnectionIsTransportError) {
    client_->setConnectOutcome(ConnectionStatus::TransportFailure, "TLS handshake failed");
    DpsProvisioning provisioning(client_);
    EXPECT_THROW(provisioning.registerDevice(config_), TransportError);
}

TEST_F(DpsProvisioningTest, ConnectionThatCannotStartIsTransportError) {
    client_->setConnectInitiates(false);
    DpsProvisioning provisioning(client_);
    EXPECT_THROW(provisioning.registerDevice(config_), TransportError);
}

TEST_F(DpsProvisioningTest, SilentServiceTimesOut) {
    client_->setConnectSilently(true);
    config_.timeout = std::chrono::seconds(1);

    DpsProvisioning provisioning(client_);
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(provisioning.registerDevice(config_), TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST_F(DpsProvisioningTest, CancellationInterruptsHandshake) {
    client_->setConnectSilently(true);
    config_.timeout = std::chrono::seconds(30);

    DpsProvisioning provisioning(client_);
    CancellationToken cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(provisioning.registerDevice(config_, &cancel), CancelledError);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(client_->publishedMessages().empty());
}

TEST_F(DpsProvisioningTest, UncancelledTokenDoesNotDisturbRegistration) {
    client_->setResponder(sim::makeDpsResponder(sim::DpsScript{}));
    DpsProvisioning provisioning(client_);
    CancellationToken cancel;

    RegistrationResult result = provisioning.registerDevice(config_, &cancel);

    EXPECT_EQ(result.status, RegistrationStatus::Assigned);
}

TEST_F(DpsProvisioningTest, MalformedResponseIsTransportError) {
    client_->setResponder([](sim::MockMqttClient& client, const sim::MockMessage&) {
        client.injectMessage("$dps/registrations/res/200/?$rid=1", "not json");
    });
    DpsProvisioning provisioning(client_);
    EXPECT_THROW(provisioning.registerDevice(config_), TransportError);
}

TEST_F(DpsProvisioningTest, EmptyScopeIsRejected) {
    config_.idScope.clear();
    DpsProvisioning provisioning(client_);
    EXPECT_THROW(provisioning.registerDevice(config_), std::invalid_argument);
    EXPECT_EQ(client_->connectCount(), 0);
}

TEST(RegistrationStatusTest, WireValues) {
    EXPECT_EQ(stringToRegistrationStatus("assigned"), RegistrationStatus::Assigned);
    EXPECT_EQ(stringToRegistrationStatus("disabled"), RegistrationStatus::Disabled);
    EXPECT_EQ(stringToRegistrationStatus("failed"), RegistrationStatus::Failed);
    EXPECT_EQ(stringToRegistrationStatus("unassigned"), RegistrationStatus::Unassigned);
    EXPECT_THROW(stringToRegistrationStatus("assigning"), std::invalid_argument);
    EXPECT_EQ(registrationStatusToString(RegistrationStatus::Disabled), "Disabled");
}
