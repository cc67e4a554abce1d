/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 *
 * Connects the engine to a fleet broker. Plain TCP and TLS are both
 * supported; with TLS a client certificate is optional.
 *
 * @note Callbacks run on Paho's internal thread
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <cstdint>

namespace rtsae {

/**
 * @brief Paho MQTT C library implementation
 *
 * Features:
 * - Offline message queuing with a fixed limit (oldest dropped first)
 * - Thread-safe callback handling
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();

    /**
     * @brief Destructor - ensures clean disconnection and resource cleanup
     */
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const std::string& host, std::uint16_t port,
                const std::string& clientId,
                const std::string& username,
                const std::string& password) override;

    bool connectWithTls(const std::string& host, std::uint16_t port,
                       const std::string& clientId,
                       const std::string& username,
                       const std::string& password,
                       const TlsConfig& tlsConfig) override;

    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                int qos = 0, bool retained = false) override;

    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    void processEvents() override;

private:
    /// Maximum number of messages to queue when offline
    static constexpr std::size_t kMaxOfflineQueueSize = 1000;

    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 30;

    MQTTAsync client_;                    ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};  ///< Current connection state

    // Paho keeps pointers into the options until the connect completes.
    std::string username_;
    std::string password_;
    TlsConfig tlsConfig_;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    std::queue<MqttMessage> offlineQueue_; ///< Queue for messages when offline
    std::mutex queueMutex_;               ///< Mutex protecting offline queue

    bool createClient(const std::string& serverURI, const std::string& clientId);
    void fillConnectOptions(MQTTAsync_connectOptions& options);

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);

    /**
     * @brief Send all queued messages when connection is restored
     */
    void flushOfflineQueue();

    void queueMessage(const std::string& topic, const std::string& payload,
                     int qos, bool retained);

    /**
     * @brief Check the configured certificate files exist and are readable
     * @return false if any configured path cannot be opened
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace rtsae
