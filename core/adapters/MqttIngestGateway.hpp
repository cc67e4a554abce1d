#pragma once

#include "../ports/ITransport.hpp"
#include "../domain/IngestionCoordinator.hpp"
#include "../EngineConfig.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace rtsae::adapters {

// Device-facing ingestion over MQTT.
//
//   <root>/<tenantId>/vehicles/<vehicleId>/fix        -> coordinator.submit
//   <root>/<tenantId>/vehicles/<vehicleId>/telemetry  -> coordinator.submitTelemetry
//
// Every message is answered on <...>/fix/ack or <...>/telemetry/ack.
class MqttIngestGateway {
public:
    enum class Channel {
        Fix,
        Telemetry
    };

    struct TopicIds {
        Channel channel = Channel::Fix;
        std::string tenantId;
        std::string vehicleId;
    };

    MqttIngestGateway(std::shared_ptr<ports::ITransport> transport,
                      std::shared_ptr<domain::IngestionCoordinator> coordinator,
                      MqttConfig config);

    void start();
    void stop();

    // Pumps the transport and publishes acknowledgements for fixes whose
    // processing finished, waiting at most `wait` for outstanding ones.
    std::size_t processEvents(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    std::size_t pendingAcks() const;
    std::size_t malformedCount() const { return malformed_.load(); }

    std::string fixFilter() const;
    std::string telemetryFilter() const;

    static std::optional<TopicIds> parseTopic(const std::string& root, std::string_view topic);

private:
    struct PendingAck {
        std::string topic;
        Timestamp ts;
        std::future<domain::IngestOutcome> outcome;
    };

    void onMessage(std::string_view topic, std::string_view payload);
    void onConnection(bool connected, std::string_view reason);
    void subscribeAll();

    void handleFix(const TopicIds& ids, std::string_view payload);
    void handleTelemetry(const TopicIds& ids, std::string_view payload);

    std::string ackTopic(const TopicIds& ids) const;
    void publishAck(const std::string& topic, domain::IngestStatus status,
                    const std::string& reason, std::optional<Timestamp> ts);

    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<domain::IngestionCoordinator> coordinator_;
    MqttConfig config_;
    bool running_ = false;

    mutable std::mutex acksMutex_;
    std::list<PendingAck> pendingAcks_;
    std::atomic<std::size_t> malformed_{0};
};

} // namespace rtsae::adapters
