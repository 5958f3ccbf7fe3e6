#include "common/Events.h"

#include "common/Logging.h"

namespace termchat {

const char* to_string(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Connect:         return "connect";
        case EventKind::Disconnect:      return "disconnect";
        case EventKind::Reject:          return "reject";
        case EventKind::Throttle:        return "throttle";
        case EventKind::ProtocolError:   return "protocol_error";
        case EventKind::ValidationError: return "validation_error";
        case EventKind::ShutdownError:   return "shutdown_error";
    }
    return "unknown";
}

void LoggingEventSink::emit(const ServerEvent& event) {
    auto level = spdlog::level::info;
    switch (event.kind) {
        case EventKind::Connect:
        case EventKind::Disconnect:
            level = spdlog::level::info;
            break;
        case EventKind::Throttle:
        case EventKind::ValidationError:
            level = spdlog::level::debug;
            break;
        case EventKind::Reject:
        case EventKind::ProtocolError:
            level = spdlog::level::warn;
            break;
        case EventKind::ShutdownError:
            level = spdlog::level::err;
            break;
    }

    logging::get()->log(level, "event={} session={} addr={} {}",
                        to_string(event.kind), event.session_id,
                        event.address.empty() ? "-" : event.address, event.detail);
}

} // namespace termchat
