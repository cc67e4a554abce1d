#include "PahoMqttClient.hpp"
#include <iostream>
#include <cstring>
#include <fstream>

namespace rtsae {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::createClient(const std::string& serverURI, const std::string& clientId) {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    return true;
}

void PahoMqttClient::fillConnectOptions(MQTTAsync_connectOptions& options) {
    options.keepAliveInterval = kKeepAliveIntervalSeconds;
    options.cleansession = 1;
    options.connectTimeout = kConnectionTimeoutSeconds;
    options.retryInterval = 5;        // 5 seconds between retries
    options.automaticReconnect = 1;
    options.minRetryInterval = 1;
    options.maxRetryInterval = 60;
    options.onSuccess = onConnected;
    options.onFailure = onConnectFailure;
    options.context = this;
    if (!username_.empty()) {
        options.username = username_.c_str();
    }
    if (!password_.empty()) {
        options.password = password_.c_str();
    }
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port,
                            const std::string& clientId,
                            const std::string& username,
                            const std::string& password) {
    std::string serverURI = "tcp://" + host + ":" + std::to_string(port);
    std::cout << "[MQTT] Connecting to " << serverURI << " as " << clientId << std::endl;

    if (!createClient(serverURI, clientId)) {
        return false;
    }

    username_ = username;
    password_ = password;

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    fillConnectOptions(conn_opts);

    int rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                   const std::string& clientId,
                                   const std::string& username,
                                   const std::string& password,
                                   const TlsConfig& tlsConfig) {
    std::cout << "[MQTT] Connecting with TLS to " << host << ":" << port << std::endl;
    std::cout << "[MQTT] Client ID: " << clientId << std::endl;
    if (!tlsConfig.caPath.empty()) {
        std::cout << "[MQTT] CA: " << tlsConfig.caPath << std::endl;
    }
    if (!tlsConfig.certPath.empty()) {
        std::cout << "[MQTT] Cert: " << tlsConfig.certPath << std::endl;
    }

    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }

    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);
    if (!createClient(serverURI, clientId)) {
        return false;
    }

    username_ = username;
    password_ = password;
    tlsConfig_ = tlsConfig;

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    fillConnectOptions(conn_opts);
    conn_opts.ssl = &ssl_opts;

    if (!tlsConfig_.caPath.empty()) {
        ssl_opts.trustStore = tlsConfig_.caPath.c_str();
    }
    if (!tlsConfig_.certPath.empty()) {
        ssl_opts.keyStore = tlsConfig_.certPath.c_str();
        ssl_opts.privateKey = tlsConfig_.keyPath.c_str();
    }
    ssl_opts.enableServerCertAuth = tlsConfig_.verifyServer ? 1 : 0;
    ssl_opts.verify = tlsConfig_.verifyServer ? 1 : 0;
    ssl_opts.enabledCipherSuites = nullptr;  // Use default cipher suites
    ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;

    int rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc == MQTTASYNC_SUCCESS) {
        std::cout << "[MQTT] Connection attempt initiated successfully" << std::endl;
        return true;
    } else {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
        connected_ = false;
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                           int qos, bool retained) {
    if (!connected_) {
        queueMessage(topic, payload, qos, retained);
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(payload.length());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = callback;
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = callback;
}

void PahoMqttClient::processEvents() {
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    if (client->messageCallback_) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen))
                                 : std::string(topicName);
        msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
        msg.qos = message->qos;
        msg.retained = message->retained != 0;

        client->messageCallback_(msg);
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;

    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }

    client->flushOfflineQueue();
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    if (client->connectionCallback_) {
        std::string reason = "Connection failed";
        if (response) {
            reason = "CONNACK return code " + std::to_string(response->code);
            if (response->message) {
                reason += " (" + std::string(response->message) + ")";
            }
        }
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    if (client->connectionCallback_) {
        std::string reason = cause ? std::string(cause) : "Connection lost";
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

void PahoMqttClient::flushOfflineQueue() {
    std::queue<MqttMessage> pending;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        std::swap(pending, offlineQueue_);
    }

    while (!pending.empty() && connected_) {
        const auto& msg = pending.front();
        if (!publish(msg.topic, msg.payload, msg.qos, msg.retained)) {
            std::cerr << "[MQTT] Failed to flush queued message on " << msg.topic << std::endl;
        }
        pending.pop();
    }
}

void PahoMqttClient::queueMessage(const std::string& topic, const std::string& payload,
                                int qos, bool retained) {
    std::lock_guard<std::mutex> lock(queueMutex_);

    // Remove oldest message if queue is full (FIFO behavior)
    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        offlineQueue_.pop();
    }

    MqttMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;

    offlineQueue_.push(msg);
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    for (const auto* path : {&tlsConfig.caPath, &tlsConfig.certPath, &tlsConfig.keyPath}) {
        if (path->empty()) continue;
        std::ifstream file(*path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: Certificate file not found: " << *path << std::endl;
            return false;
        }
    }
    if (tlsConfig.certPath.empty() != tlsConfig.keyPath.empty()) {
        std::cerr << "[MQTT] ERROR: Client certificate and key must be given together" << std::endl;
        return false;
    }
    return true;
}

} // namespace rtsae
