#include <gtest/gtest.h>
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/MqttTransportAdapter.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <thread>
#include <vector>

using namespace rtsae;

namespace {

// Records what the adapter hands to the MQTT library and lets the test fire callbacks.
class FakeMqttClient : public IMqttClient {
public:
    bool connect(const std::string& host, std::uint16_t port, const std::string& clientId,
                 const std::string&, const std::string&) override {
        lastHost = host;
        lastPort = port;
        lastClientId = clientId;
        usedTls = false;
        connected = true;
        return true;
    }

    bool connectWithTls(const std::string& host, std::uint16_t port, const std::string& clientId,
                        const std::string&, const std::string&, const TlsConfig& tls) override {
        lastHost = host;
        lastPort = port;
        lastClientId = clientId;
        lastTls = tls;
        usedTls = true;
        connected = true;
        return true;
    }

    void disconnect() override { connected = false; }
    bool isConnected() const override { return connected; }

    bool publish(const std::string& topic, const std::string& payload, int qos, bool) override {
        published.push_back(MqttMessage{topic, payload, qos, false});
        return connected;
    }

    bool subscribe(const std::string& topic, int) override {
        subscriptions.push_back(topic);
        return connected;
    }

    bool unsubscribe(const std::string&) override { return connected; }

    void setMessageCallback(MessageCallback callback) override { onMessage = std::move(callback); }
    void setConnectionCallback(ConnectionCallback callback) override { onConnection = std::move(callback); }

    void processEvents() override { ++pumps; }

    std::string lastHost;
    std::uint16_t lastPort = 0;
    std::string lastClientId;
    TlsConfig lastTls;
    bool usedTls = false;
    bool connected = false;
    int pumps = 0;
    std::vector<MqttMessage> published;
    std::vector<std::string> subscriptions;
    MessageCallback onMessage;
    ConnectionCallback onConnection;
};

} // namespace

class CleanArchitectureTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        transport_ = std::make_shared<sim::MockTransport>();
        policyEngine_ = std::make_shared<adapters::DefaultPolicyEngine>();
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine_;
};

TEST_F(CleanArchitectureTest, TransportAbstraction) {
    transport_->setConnected(true);
    EXPECT_TRUE(transport_->isConnected());

    bool success = transport_->publish("fleet/t1/vehicles/V/fix/ack", "{\"status\":\"accepted\"}", 1);
    EXPECT_TRUE(success);

    const auto messages = transport_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].topic, "fleet/t1/vehicles/V/fix/ack");
    EXPECT_EQ(messages[0].payload, "{\"status\":\"accepted\"}");
    EXPECT_EQ(messages[0].qos, 1);

    transport_->setFailPublish(true);
    EXPECT_FALSE(transport_->publish("fleet/t1/vehicles/V/fix/ack", "{}", 1));
}

TEST_F(CleanArchitectureTest, PolicyBasedBehavior) {
    const auto& retryPolicy = policyEngine_->getRetryPolicy();
    const auto& deadlinePolicy = policyEngine_->getDeadlinePolicy();

    EXPECT_TRUE(retryPolicy.shouldRetry(1));
    EXPECT_FALSE(retryPolicy.shouldRetry(10)); // Beyond max attempts

    EXPECT_EQ(retryPolicy.getBackoffDelay(1), std::chrono::milliseconds(1000));
    EXPECT_EQ(retryPolicy.getBackoffDelay(2), std::chrono::milliseconds(2000));
    EXPECT_EQ(retryPolicy.getBackoffDelay(3), std::chrono::milliseconds(4000));
    EXPECT_EQ(retryPolicy.getBackoffDelay(20), std::chrono::minutes(5)); // Capped

    EXPECT_EQ(deadlinePolicy.storeWriteDeadline(), std::chrono::milliseconds(200));
    EXPECT_EQ(deadlinePolicy.logWriteDeadline(), std::chrono::milliseconds(500));
}

TEST_F(CleanArchitectureTest, PoliciesFollowIngestionConfig) {
    IngestionConfig config;
    config.retryBaseDelay = std::chrono::milliseconds(250);
    config.retryMultiplier = 3.0;
    config.retryMaxAttempts = 2;
    config.logWriteDeadline = std::chrono::milliseconds(50);

    adapters::DefaultPolicyEngine engine(config);
    EXPECT_EQ(engine.getRetryPolicy().getBackoffDelay(2), std::chrono::milliseconds(750));
    EXPECT_TRUE(engine.getRetryPolicy().shouldRetry(1));
    EXPECT_FALSE(engine.getRetryPolicy().shouldRetry(2));
    EXPECT_EQ(engine.getDeadlinePolicy().logWriteDeadline(), std::chrono::milliseconds(50));
}

TEST_F(CleanArchitectureTest, DeterministicTimeSimulation) {
    Timestamp startTime{std::chrono::seconds(1700000000)};
    clock_->setCurrentTime(startTime);
    clock_->freezeTime();
    EXPECT_TRUE(clock_->isFrozen());

    EXPECT_EQ(clock_->now(), startTime);

    // Time shouldn't advance when frozen
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(clock_->now(), startTime);

    clock_->advance(std::chrono::hours(1));
    EXPECT_EQ(clock_->now(), startTime + std::chrono::hours(1));
    EXPECT_EQ(clock_->epochMillis(), 1700003600000);
}

TEST_F(CleanArchitectureTest, MqttAdapterChoosesTlsFromCredentials) {
    auto client = std::make_shared<FakeMqttClient>();
    adapters::MqttTransportAdapter adapter(client);

    ports::Credentials plain;
    plain.host = "broker.local";
    plain.port = 1883;
    plain.clientId = "rtsae-server";
    EXPECT_TRUE(adapter.connect(plain));
    EXPECT_FALSE(client->usedTls);
    EXPECT_EQ(client->lastHost, "broker.local");

    ports::Credentials secure = plain;
    secure.port = 8883;
    secure.useTls = true;
    secure.caPath = "/etc/rtsae/ca.pem";
    secure.verifyServer = false;
    EXPECT_TRUE(adapter.connect(secure));
    EXPECT_TRUE(client->usedTls);
    EXPECT_EQ(client->lastPort, 8883);
    EXPECT_EQ(client->lastTls.caPath, "/etc/rtsae/ca.pem");
    EXPECT_FALSE(client->lastTls.verifyServer);
}

TEST_F(CleanArchitectureTest, MqttAdapterRoutesCallbacks) {
    auto client = std::make_shared<FakeMqttClient>();
    adapters::MqttTransportAdapter adapter(client);

    std::vector<std::string> topics;
    std::vector<bool> states;
    adapter.setMessageHandler([&](std::string_view topic, std::string_view) {
        topics.emplace_back(topic);
    });
    adapter.setConnectionHandler([&](bool connected, std::string_view) {
        states.push_back(connected);
    });

    ASSERT_TRUE(client->onMessage);
    ASSERT_TRUE(client->onConnection);
    client->onConnection(true, "connected");
    client->onMessage(MqttMessage{"fleet/t1/vehicles/V/fix", "{}", 1, false});
    client->onConnection(false, "lost");

    EXPECT_EQ(topics, std::vector<std::string>{"fleet/t1/vehicles/V/fix"});
    EXPECT_EQ(states, (std::vector<bool>{true, false}));

    adapter.connect(ports::Credentials{});
    EXPECT_TRUE(adapter.subscribe("fleet/+/vehicles/+/fix", 1));
    EXPECT_TRUE(adapter.publish("rtsae/events/tenant/t1", "{}", 1));
    adapter.processEvents();
    EXPECT_EQ(client->subscriptions.size(), 1u);
    ASSERT_EQ(client->published.size(), 1u);
    EXPECT_EQ(client->published[0].qos, 1);
    EXPECT_EQ(client->pumps, 1);
}
