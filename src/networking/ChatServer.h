#pragma once

#include "chat/ClientRegistry.h"
#include "chat/MessageBroker.h"
#include "common/Config.h"
#include "common/Events.h"
#include "networking/Session.hpp"
#include "security/ConnectionGate.h"

#include <boost/asio/io_context.hpp>

#include <functional>
#include <memory>
#include <string>

namespace termchat::networking {

// TCP chat server: accept loop, per-connection sessions and the graceful
// shutdown sequence. All I/O runs on the caller's io_context.
class ChatServer {
public:
    using OnStopped = std::function<void()>;

    // `events` defaults to a LoggingEventSink.
    ChatServer(boost::asio::io_context& ioc, ServerConfig config,
               std::shared_ptr<EventSink> events = nullptr);
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    // Binds and starts accepting. Throws StartupError.
    void start();

    // Stops accepting, notifies and closes every session, force-closes the
    // ones still open after shutdown_timeout, then calls `on_complete`.
    void stop(OnStopped on_complete = {});

    // "host:port" of the listening socket; valid once LISTENING.
    std::string local_endpoint() const;
    unsigned short port() const;

    ServerState state() const noexcept;
    const ServerConfig& config() const noexcept;

    const chat::ClientRegistry& registry() const noexcept;
    chat::MessageBroker::Stats broker_stats() const;
    security::ConnectionGate::Stats connection_stats() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace termchat::networking
