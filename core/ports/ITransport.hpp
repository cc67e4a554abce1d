#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rtsae::ports {

struct Credentials {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;
    std::string password;

    bool useTls = false;
    std::string caPath;
    std::string certPath;
    std::string keyPath;
    bool verifyServer = true;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    using MessageHandler = std::function<void(std::string_view topic, std::string_view payload)>;
    using ConnectionHandler = std::function<void(bool connected, std::string_view reason)>;

    virtual bool connect(const Credentials& credentials) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual bool publish(std::string_view topic, std::string_view payload, int qos = 0) = 0;
    virtual bool subscribe(std::string_view topic, int qos = 0) = 0;
    virtual bool unsubscribe(std::string_view topic) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;

    virtual void processEvents() = 0;
};

} // namespace rtsae::ports
