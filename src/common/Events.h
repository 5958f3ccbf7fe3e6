#pragma once

#include <cstdint>
#include <string>

namespace termchat {

enum class EventKind {
    Connect,
    Disconnect,
    Reject,
    Throttle,
    ProtocolError,
    ValidationError,
    ShutdownError,
};

const char* to_string(EventKind kind) noexcept;

struct ServerEvent {
    EventKind kind;
    std::uint64_t session_id = 0;  // 0 when no session exists yet (rejects)
    std::string address;
    std::string detail;
};

// Structured event output of the server core. Implementations must be
// thread-safe: events are emitted from every worker thread.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const ServerEvent& event) = 0;
};

// Default sink: one log line per event through the shared spdlog logger.
class LoggingEventSink : public EventSink {
public:
    void emit(const ServerEvent& event) override;
};

} // namespace termchat
