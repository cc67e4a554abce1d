#include "MqttIngestGateway.hpp"
#include "../JsonCodec.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <vector>

namespace rtsae::adapters {

namespace {

std::vector<std::string> splitTopic(std::string_view topic) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = topic.find('/', start);
        parts.emplace_back(topic.substr(start, pos == std::string_view::npos ? pos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

// Fills the id from the topic when the payload omits it; false on disagreement.
bool reconcileId(nlohmann::json& body, const char* key, const std::string& fromTopic) {
    if (!body.contains(key) || body[key].is_null()) {
        body[key] = fromTopic;
        return true;
    }
    return body[key].is_string() && body[key].get<std::string>() == fromTopic;
}

} // namespace

MqttIngestGateway::MqttIngestGateway(std::shared_ptr<ports::ITransport> transport,
                                     std::shared_ptr<domain::IngestionCoordinator> coordinator,
                                     MqttConfig config)
    : transport_(std::move(transport)), coordinator_(std::move(coordinator)), config_(std::move(config)) {
}

void MqttIngestGateway::start() {
    running_ = true;

    transport_->setMessageHandler([this](std::string_view topic, std::string_view payload) {
        onMessage(topic, payload);
    });
    transport_->setConnectionHandler([this](bool connected, std::string_view reason) {
        onConnection(connected, reason);
    });

    if (transport_->isConnected()) {
        subscribeAll();
    }
}

void MqttIngestGateway::stop() {
    if (!running_) return;
    running_ = false;

    if (transport_->isConnected()) {
        transport_->unsubscribe(fixFilter());
        transport_->unsubscribe(telemetryFilter());
    }
}

std::string MqttIngestGateway::fixFilter() const {
    return config_.topicRoot + "/+/vehicles/+/fix";
}

std::string MqttIngestGateway::telemetryFilter() const {
    return config_.topicRoot + "/+/vehicles/+/telemetry";
}

void MqttIngestGateway::subscribeAll() {
    if (!transport_->subscribe(fixFilter(), config_.qos)) {
        std::cerr << "[Gateway] Failed to subscribe to " << fixFilter() << std::endl;
    }
    if (!transport_->subscribe(telemetryFilter(), config_.qos)) {
        std::cerr << "[Gateway] Failed to subscribe to " << telemetryFilter() << std::endl;
    }
}

void MqttIngestGateway::onConnection(bool connected, std::string_view reason) {
    std::cout << "[Gateway] Broker " << (connected ? "connected" : "disconnected")
              << ": " << reason << std::endl;
    if (connected && running_) {
        subscribeAll();
    }
}

std::optional<MqttIngestGateway::TopicIds> MqttIngestGateway::parseTopic(const std::string& root,
                                                                         std::string_view topic) {
    auto parts = splitTopic(topic);
    if (parts.size() != 5 || parts[0] != root || parts[2] != "vehicles" ||
        parts[1].empty() || parts[3].empty()) {
        return std::nullopt;
    }

    TopicIds ids;
    ids.tenantId = parts[1];
    ids.vehicleId = parts[3];
    if (parts[4] == "fix") {
        ids.channel = Channel::Fix;
    } else if (parts[4] == "telemetry") {
        ids.channel = Channel::Telemetry;
    } else {
        return std::nullopt;
    }
    return ids;
}

void MqttIngestGateway::onMessage(std::string_view topic, std::string_view payload) {
    if (!running_) return;

    auto ids = parseTopic(config_.topicRoot, topic);
    if (!ids) {
        std::cerr << "[Gateway] Ignoring message on unexpected topic " << topic << std::endl;
        return;
    }

    if (ids->channel == Channel::Fix) {
        handleFix(*ids, payload);
    } else {
        handleTelemetry(*ids, payload);
    }
}

void MqttIngestGateway::handleFix(const TopicIds& ids, std::string_view payload) {
    Fix fix;
    try {
        auto body = nlohmann::json::parse(payload);
        if (!body.is_object()) {
            throw std::invalid_argument("payload is not an object");
        }
        if (!reconcileId(body, "tenantId", ids.tenantId) ||
            !reconcileId(body, "vehicleId", ids.vehicleId)) {
            publishAck(ackTopic(ids), domain::IngestStatus::Rejected, "topic_mismatch", std::nullopt);
            return;
        }
        fix = JsonCodec::jsonToFix(body);
    } catch (const std::exception& e) {
        malformed_++;
        std::cerr << "[Gateway] Malformed fix from " << ids.vehicleId << ": " << e.what() << std::endl;
        publishAck(ackTopic(ids), domain::IngestStatus::Rejected, "malformed_payload", std::nullopt);
        return;
    }

    auto outcome = coordinator_->submit(fix);
    std::lock_guard<std::mutex> lock(acksMutex_);
    pendingAcks_.push_back(PendingAck{ackTopic(ids), fix.ts, std::move(outcome)});
}

void MqttIngestGateway::handleTelemetry(const TopicIds& ids, std::string_view payload) {
    Telemetry telemetry;
    try {
        auto body = nlohmann::json::parse(payload);
        if (!body.is_object()) {
            throw std::invalid_argument("payload is not an object");
        }
        if (!reconcileId(body, "tenantId", ids.tenantId) ||
            !reconcileId(body, "vehicleId", ids.vehicleId)) {
            publishAck(ackTopic(ids), domain::IngestStatus::Rejected, "topic_mismatch", std::nullopt);
            return;
        }
        telemetry = JsonCodec::jsonToTelemetry(body);
    } catch (const std::exception& e) {
        malformed_++;
        std::cerr << "[Gateway] Malformed telemetry from " << ids.vehicleId << ": " << e.what() << std::endl;
        publishAck(ackTopic(ids), domain::IngestStatus::Rejected, "malformed_payload", std::nullopt);
        return;
    }

    auto outcome = coordinator_->submitTelemetry(telemetry);

    nlohmann::json ack;
    ack["status"] = domain::ingestStatusToString(outcome.status);
    if (!outcome.reason.empty()) {
        ack["reason"] = outcome.reason;
    }
    ack["ts"] = JsonCodec::timestampToJson(telemetry.ts);
    ack["alarms"] = nlohmann::json::array();
    for (const auto& alarm : outcome.alarms) {
        ack["alarms"].push_back(JsonCodec::alarmToJson(alarm));
    }

    if (!transport_->publish(ackTopic(ids), ack.dump(), config_.qos)) {
        std::cerr << "[Gateway] Failed to publish telemetry ack for " << ids.vehicleId << std::endl;
    }
}

std::string MqttIngestGateway::ackTopic(const TopicIds& ids) const {
    return config_.topicRoot + "/" + ids.tenantId + "/vehicles/" + ids.vehicleId +
           (ids.channel == Channel::Fix ? "/fix/ack" : "/telemetry/ack");
}

void MqttIngestGateway::publishAck(const std::string& topic, domain::IngestStatus status,
                                   const std::string& reason, std::optional<Timestamp> ts) {
    nlohmann::json ack;
    ack["status"] = domain::ingestStatusToString(status);
    if (!reason.empty()) {
        ack["reason"] = reason;
    }
    if (ts) {
        ack["ts"] = JsonCodec::timestampToJson(*ts);
    }

    if (!transport_->publish(topic, ack.dump(), config_.qos)) {
        std::cerr << "[Gateway] Failed to publish ack on " << topic << std::endl;
    }
}

std::size_t MqttIngestGateway::processEvents(std::chrono::milliseconds wait) {
    transport_->processEvents();

    // Wait with the lock released so broker callbacks can keep queueing acks.
    std::list<PendingAck> waiting;
    {
        std::lock_guard<std::mutex> lock(acksMutex_);
        waiting.splice(waiting.end(), pendingAcks_);
    }

    std::list<PendingAck> ready;
    auto deadline = std::chrono::steady_clock::now() + wait;
    for (auto it = waiting.begin(); it != waiting.end();) {
        if (it->outcome.wait_until(deadline) == std::future_status::ready) {
            auto next = std::next(it);
            ready.splice(ready.end(), waiting, it);
            it = next;
        } else {
            ++it;
        }
    }

    if (!waiting.empty()) {
        std::lock_guard<std::mutex> lock(acksMutex_);
        pendingAcks_.splice(pendingAcks_.begin(), waiting);
    }

    for (auto& ack : ready) {
        auto outcome = ack.outcome.get();
        publishAck(ack.topic, outcome.status, outcome.reason, ack.ts);
    }
    return ready.size();
}

std::size_t MqttIngestGateway::pendingAcks() const {
    std::lock_guard<std::mutex> lock(acksMutex_);
    return pendingAcks_.size();
}

} // namespace rtsae::adapters
