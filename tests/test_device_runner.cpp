#include <gtest/gtest.h>
#include "TestCertificates.hpp"
#include "../core/DeviceRunner.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/sim/ScriptedDps.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace devsim;

class DeviceRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dpsClient_ = std::make_shared<sim::MockMqttClient>();
        hubClient_ = std::make_shared<sim::MockMqttClient>();

        config_.idScope = "0ne00ABCDEF";
        config_.bundlePath = test::writeDeviceBundle(dir_, "sim-device-07").string();
        config_.telemetryInterval = std::chrono::milliseconds(1000);
    }

    DeviceRunner makeRunner() {
        return DeviceRunner(
            [this] { return dpsClient_; },
            [this] {
                ++hubClientsCreated_;
                return hubClient_;
            },
            std::make_shared<sim::SimulatedClock>());
    }

    bool waitForHubPublishes(size_t count, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (hubClient_->publishedMessages().size() >= count) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    test::TempDir dir_;
    std::shared_ptr<sim::MockMqttClient> dpsClient_;
    std::shared_ptr<sim::MockMqttClient> hubClient_;
    std::atomic<int> hubClientsCreated_{0};
    DeviceConfig config_;
};

TEST_F(DeviceRunnerTest, AssignedDevicePublishesToAssignedHub) {
    sim::DpsScript script;
    script.assignedHub = "hub.example.net";
    script.deviceId = "dev-1";
    dpsClient_->setResponder(sim::makeDpsResponder(script));

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;
    int exitCode = -1;

    std::thread device([&] { exitCode = runner.run(config_, cancel); });

    // Both loops send immediately, well within one interval tick
    EXPECT_TRUE(waitForHubPublishes(2, std::chrono::seconds(5)));
    cancel.cancel();
    device.join();

    EXPECT_EQ(exitCode, 0);

    auto dpsConnect = dpsClient_->lastConnect();
    EXPECT_EQ(dpsConnect.clientId, "sim-device-07");
    EXPECT_EQ(dpsConnect.username, "0ne00ABCDEF/registrations/sim-device-07/api-version=2019-03-31");

    auto hubConnect = hubClient_->lastConnect();
    EXPECT_EQ(hubConnect.host, "hub.example.net");
    EXPECT_EQ(hubConnect.clientId, "dev-1");
    EXPECT_EQ(hubConnect.username, "hub.example.net/dev-1/?api-version=2021-04-12");
    EXPECT_FALSE(hubConnect.tlsConfig.certPath.empty());
    EXPECT_EQ(hubConnect.tlsConfig.certPath, dpsConnect.tlsConfig.certPath);

    auto published = hubClient_->publishedMessages();
    ASSERT_GE(published.size(), 2u);
    for (const auto& msg : published) {
        EXPECT_EQ(msg.topic.rfind("devices/dev-1/messages/events/", 0), 0u);
    }

    // Orderly close and credential cleanup
    EXPECT_FALSE(hubClient_->isConnected());
    EXPECT_FALSE(std::filesystem::exists(hubConnect.tlsConfig.certPath));
    EXPECT_EQ(runner.telemetrySent() + runner.logsSent(), published.size());
}

TEST_F(DeviceRunnerTest, DisabledRegistrationNeverOpensSession) {
    sim::DpsScript script;
    script.status = "disabled";
    dpsClient_->setResponder(sim::makeDpsResponder(script));

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;

    EXPECT_NE(runner.run(config_, cancel), 0);
    EXPECT_EQ(hubClientsCreated_.load(), 0);
    EXPECT_EQ(hubClient_->connectCount(), 0);
}

TEST_F(DeviceRunnerTest, BadBundleFailsBeforeProvisioning) {
    config_.bundlePassword = "not-the-password";

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;

    EXPECT_EQ(runner.run(config_, cancel), 1);
    EXPECT_EQ(dpsClient_->connectCount(), 0);
    EXPECT_EQ(hubClientsCreated_.load(), 0);
}

TEST_F(DeviceRunnerTest, RejectedHubCertificateFails) {
    dpsClient_->setResponder(sim::makeDpsResponder(sim::DpsScript{}));
    hubClient_->setConnectOutcome(ConnectionStatus::NotAuthorized, "return code 5");

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;

    EXPECT_EQ(runner.run(config_, cancel), 1);
    EXPECT_EQ(hubClientsCreated_.load(), 1);
    EXPECT_TRUE(hubClient_->publishedMessages().empty());
}

TEST_F(DeviceRunnerTest, PublishFailureClosesSessionAndFails) {
    dpsClient_->setResponder(sim::makeDpsResponder(sim::DpsScript{}));
    hubClient_->setFailPublish(true);

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;

    EXPECT_EQ(runner.run(config_, cancel), 1);
    EXPECT_EQ(hubClient_->disconnectCount(), 1);
    EXPECT_FALSE(hubClient_->isConnected());
}

TEST_F(DeviceRunnerTest, MissingScopeIsRejected) {
    config_.idScope.clear();

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;

    EXPECT_EQ(runner.run(config_, cancel), 1);
    EXPECT_EQ(dpsClient_->connectCount(), 0);
}

TEST_F(DeviceRunnerTest, CancelDuringProvisioningExitsCleanly) {
    dpsClient_->setConnectSilently(true);
    config_.provisioningTimeout = std::chrono::seconds(30);

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    int exitCode = runner.run(config_, cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(exitCode, 0);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(hubClientsCreated_.load(), 0);
}

TEST_F(DeviceRunnerTest, CancelDuringHubConnectExitsCleanly) {
    dpsClient_->setResponder(sim::makeDpsResponder(sim::DpsScript{}));
    hubClient_->setConnectSilently(true);

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;
    std::thread canceller([&] {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (hubClient_->connectCount() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        cancel.cancel();
    });

    int exitCode = runner.run(config_, cancel);
    canceller.join();

    EXPECT_EQ(exitCode, 0);
    EXPECT_EQ(hubClient_->connectCount(), 1);
    EXPECT_TRUE(hubClient_->publishedMessages().empty());
}

TEST_F(DeviceRunnerTest, NonPositiveIntervalIsRejectedBeforeConnecting) {
    config_.telemetryInterval = std::chrono::milliseconds(0);
    EXPECT_FALSE(config_.hasRequiredSettings());

    DeviceRunner runner = makeRunner();
    CancellationToken cancel;

    EXPECT_EQ(runner.run(config_, cancel), 1);
    EXPECT_EQ(dpsClient_->connectCount(), 0);
    EXPECT_EQ(hubClientsCreated_.load(), 0);
}

TEST_F(DeviceRunnerTest, UnexpectedExceptionIsReportedAsFailure) {
    dpsClient_->setResponder(sim::makeDpsResponder(sim::DpsScript{}));

    DeviceRunner runner(
        [this] { return dpsClient_; },
        []() -> std::shared_ptr<IMqttClient> { throw std::runtime_error("no transport available"); },
        std::make_shared<sim::SimulatedClock>());
    CancellationToken cancel;

    int exitCode = -1;
    EXPECT_NO_THROW(exitCode = runner.run(config_, cancel));
    EXPECT_EQ(exitCode, 1);
}
