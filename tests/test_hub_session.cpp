#include <gtest/gtest.h>
#include "../core/HubSession.hpp"
#include "../core/Errors.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include <memory>
#include <thread>
#include <vector>

using namespace devsim;

class HubSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<sim::MockMqttClient>();
        tls_.certPath = "device.cert.pem";
        tls_.keyPath = "device.key.pem";
    }

    std::unique_ptr<Session> openSession() {
        auto session = std::make_unique<Session>(client_, "hub.example.net", "dev-1");
        session->open(tls_, 8883, std::chrono::seconds(1));
        return session;
    }

    static OutboundMessage message(SensorType type) {
        return OutboundMessage{"{\"temperature\":21.5}", type};
    }

    std::shared_ptr<sim::MockMqttClient> client_;
    TlsConfig tls_;
};

TEST_F(HubSessionTest, OpenUsesHubIdentity) {
    auto session = openSession();

    EXPECT_EQ(session->state(), SessionState::Open);

    auto connect = client_->lastConnect();
    EXPECT_EQ(connect.host, "hub.example.net");
    EXPECT_EQ(connect.port, 8883);
    EXPECT_EQ(connect.clientId, "dev-1");
    EXPECT_EQ(connect.username, "hub.example.net/dev-1/?api-version=2021-04-12");
    EXPECT_EQ(connect.tlsConfig.keyPath, "device.key.pem");
}

TEST_F(HubSessionTest, PublishCarriesSensorTypeAsProperty) {
    auto session = openSession();

    session->publish(message(SensorType::Telemetry));
    session->publish(message(SensorType::Log));

    auto published = client_->publishedMessages();
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[0].topic,
              "devices/dev-1/messages/events/SensorType=Stelemetry&%24.ct=application%2Fjson&%24.ce=utf-8");
    EXPECT_EQ(published[1].topic,
              "devices/dev-1/messages/events/SensorType=Slog&%24.ct=application%2Fjson&%24.ce=utf-8");
    EXPECT_EQ(published[0].payload, "{\"temperature\":21.5}");
    EXPECT_EQ(published[0].qos, 0);
}

TEST_F(HubSessionTest, PublishAfterCloseRaisesSessionClosedError) {
    auto session = openSession();
    session->close();

    EXPECT_EQ(session->state(), SessionState::Closed);
    EXPECT_THROW(session->publish(message(SensorType::Telemetry)), SessionClosedError);
    EXPECT_TRUE(client_->publishedMessages().empty());
}

TEST_F(HubSessionTest, CloseIsIdempotent) {
    auto session = openSession();
    session->close();
    session->close();

    EXPECT_EQ(session->state(), SessionState::Closed);
    EXPECT_EQ(client_->disconnectCount(), 1);
}

TEST_F(HubSessionTest, RejectedCertificateIsAuthenticationError) {
    client_->setConnectOutcome(ConnectionStatus::NotAuthorized, "return code 5");

    Session session(client_, "hub.example.net", "dev-1");
    EXPECT_THROW(session.open(tls_, 8883, std::chrono::seconds(1)), AuthenticationError);
    EXPECT_EQ(session.state(), SessionState::Failed);

    session.close();
    EXPECT_EQ(session.state(), SessionState::Closed);
}

TEST_F(HubSessionTest, ConnectionFailureIsTransportError) {
    client_->setConnectOutcome(ConnectionStatus::TransportFailure, "connection refused");

    Session session(client_, "hub.example.net", "dev-1");
    EXPECT_THROW(session.open(tls_, 8883, std::chrono::seconds(1)), TransportError);
    EXPECT_THROW(session.publish(message(SensorType::Telemetry)), PublishError);
}

TEST_F(HubSessionTest, ConnectTimeoutIsTransportError) {
    client_->setConnectSilently(true);

    Session session(client_, "hub.example.net", "dev-1");
    EXPECT_THROW(session.open(tls_, 8883, std::chrono::milliseconds(200)), TransportError);
    EXPECT_EQ(session.state(), SessionState::Failed);
}

TEST_F(HubSessionTest, CancellationInterruptsOpen) {
    client_->setConnectSilently(true);

    Session session(client_, "hub.example.net", "dev-1");
    CancellationToken cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(session.open(tls_, 8883, std::chrono::seconds(30), &cancel), CancelledError);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_THROW(session.publish(message(SensorType::Log)), SessionClosedError);
}

TEST_F(HubSessionTest, PublishBeforeOpenIsPublishError) {
    Session session(client_, "hub.example.net", "dev-1");

    try {
        session.publish(message(SensorType::Telemetry));
        FAIL() << "Expected PublishError";
    } catch (const SessionClosedError&) {
        FAIL() << "A session that was never opened is not closed";
    } catch (const PublishError&) {
    }
}

TEST_F(HubSessionTest, LostConnectionFailsSession) {
    auto session = openSession();
    client_->simulateConnectionLoss("keep-alive timeout");

    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_THROW(session->publish(message(SensorType::Log)), PublishError);

    session->close();
    EXPECT_EQ(session->state(), SessionState::Closed);
}

TEST_F(HubSessionTest, TransportRejectionIsPublishError) {
    auto session = openSession();
    client_->setFailPublish(true);

    EXPECT_THROW(session->publish(message(SensorType::Telemetry)), PublishError);
    EXPECT_EQ(session->state(), SessionState::Open);
}

TEST_F(HubSessionTest, OpenTwiceIsLogicError) {
    auto session = openSession();
    EXPECT_THROW(session->open(tls_, 8883, std::chrono::seconds(1)), std::logic_error);
}

TEST_F(HubSessionTest, ConcurrentPublishersAreSerialized) {
    auto session = openSession();
    constexpr int kPerThread = 200;

    auto sender = [&](SensorType type) {
        for (int i = 0; i < kPerThread; ++i) {
            session->publish(message(type));
        }
    };
    std::thread telemetry(sender, SensorType::Telemetry);
    std::thread logs(sender, SensorType::Log);
    telemetry.join();
    logs.join();

    EXPECT_EQ(client_->publishedMessages().size(), static_cast<size_t>(2 * kPerThread));
}
