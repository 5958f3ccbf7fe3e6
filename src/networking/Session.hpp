#pragma once

namespace termchat::networking {

// INIT -> LISTENING -> SHUTTING_DOWN -> STOPPED
enum class ServerState { Init, Listening, ShuttingDown, Stopped };

// ADMITTED: gate slot held, not yet registered.
// AUTHENTICATING: registered under the default display name.
// ACTIVE: username set.
// CLOSING: teardown started.
enum class SessionState { Admitted, Authenticating, Active, Closing };

inline const char* to_string(ServerState state) noexcept {
    switch (state) {
        case ServerState::Init:         return "init";
        case ServerState::Listening:    return "listening";
        case ServerState::ShuttingDown: return "shutting_down";
        case ServerState::Stopped:      return "stopped";
    }
    return "unknown";
}

inline const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Admitted:       return "admitted";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::Active:         return "active";
        case SessionState::Closing:        return "closing";
    }
    return "unknown";
}

} // namespace termchat::networking
