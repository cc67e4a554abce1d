/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface used by the broker-facing adapters
 *
 * Provides a library-independent MQTT client abstraction. Devices publish
 * fixes and telemetry to the broker; the engine subscribes to them and
 * publishes acknowledgements and fan-out events back.
 *
 * @note Interface supports both plain and TLS broker connections
 * @note Callbacks may arrive on the client library's own thread
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace rtsae {

/**
 * @brief MQTT message structure for inbound and outbound traffic
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g., "fleet/{tenantId}/vehicles/{vehicleId}/fix")
    std::string payload;            ///< Message payload (JSON)
    int qos = 0;                   ///< Quality of Service level (0, 1, or 2)
    bool retained = false;         ///< Retain flag for persistent messages
};

/**
 * @brief TLS configuration for broker connections
 *
 * caPath alone gives server-authenticated TLS. certPath and keyPath add a
 * client certificate for mutual TLS.
 *
 * @note Certificate files must be in PEM format
 */
struct TlsConfig {
    std::string certPath;          ///< Path to client certificate file (.pem), optional
    std::string keyPath;           ///< Path to private key file (.pem), optional
    std::string caPath;            ///< Path to root CA certificate file (.pem)
    bool verifyServer = true;      ///< Enable server certificate validation
};

/**
 * @brief Library-independent MQTT client interface
 *
 * @note Callback-based design; implementations must not block in callbacks
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Connect to an MQTT broker without TLS
     * @param host Broker hostname
     * @param port Broker port (typically 1883)
     * @param clientId Unique client identifier
     * @param username MQTT username, may be empty
     * @param password MQTT password, may be empty
     * @return true if connection initiated successfully, false otherwise
     * @note Asynchronous - use the connection callback for the outcome
     */
    virtual bool connect(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const std::string& username,
                        const std::string& password) = 0;

    /**
     * @brief Connect to an MQTT broker over TLS
     * @param host Broker hostname
     * @param port Broker port (typically 8883)
     * @param clientId Unique client identifier
     * @param username MQTT username, may be empty
     * @param password MQTT password, may be empty
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if connection initiated successfully, false otherwise
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                               const std::string& clientId,
                               const std::string& username,
                               const std::string& password,
                               const TlsConfig& tlsConfig) = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @return true if publish was handed to the client library
     * @note Message may be queued if not currently connected
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos = 0, bool retained = false) = 0;

    /**
     * @brief Subscribe to MQTT topic
     * @param topic Topic filter (supports + and # wildcards)
     * @param qos Maximum Quality of Service level for received messages
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    virtual bool unsubscribe(const std::string& topic) = 0;

    /**
     * @brief Set callback for incoming MQTT messages
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setMessageCallback(MessageCallback callback) = 0;

    /**
     * @brief Set callback for connection state changes
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    /**
     * @brief Process pending MQTT events
     * @note Must be called regularly; implementations must not block
     */
    virtual void processEvents() = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace rtsae
