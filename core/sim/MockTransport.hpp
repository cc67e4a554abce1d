#pragma once

#include "../ports/ITransport.hpp"
#include <chrono>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace rtsae::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos;
    std::chrono::steady_clock::time_point timestamp;
};

class MockTransport : public ports::ITransport {
public:
    MockTransport();
    ~MockTransport() override = default;

    // ITransport interface
    bool connect(const ports::Credentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(std::string_view topic, std::string_view payload, int qos = 0) override;
    bool subscribe(std::string_view topic, int qos = 0) override;
    bool unsubscribe(std::string_view topic) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    void processEvents() override;

    // Mock-specific methods for testing
    void setConnected(bool connected);
    void simulateConnectionLoss();
    void simulateConnectionRestore();
    void injectMessage(std::string_view topic, std::string_view payload);
    // Calls the handler right away on the caller's thread, like a client library callback.
    void deliverMessage(std::string_view topic, std::string_view payload);

    std::vector<MockMessage> getPublishedMessages() const;
    std::vector<MockMessage> getPublishedMessages(const std::string& topic) const;
    void clearPublishedMessages();

    const std::vector<std::string>& getSubscriptions() const { return subscriptions_; }
    const ports::Credentials& getLastCredentials() const { return lastCredentials_; }

    bool shouldFailPublish() const { return failPublish_; }
    void setFailPublish(bool fail) { failPublish_ = fail; }

private:
    bool connected_ = false;
    bool failPublish_ = false;

    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;

    // Sinks may flush from another thread than the test body.
    mutable std::mutex publishedMutex_;
    std::vector<MockMessage> publishedMessages_;
    std::queue<MockMessage> incomingMessages_;
    std::vector<std::string> subscriptions_;

    ports::Credentials lastCredentials_;
};

} // namespace rtsae::sim
