// =============================================================================
// CastLink - Session Events
// =============================================================================
// Typed notifications the Session posts to its EventChannel. The caller drains
// them on its own thread.
// =============================================================================
#pragma once
#include <string>
#include <variant>

#include "frame_codec.hpp"
#include "input_event.hpp"
#include "result.hpp"
#include "transport.hpp"

namespace castlink {

enum class SessionState { Disconnected, Connecting, Connected, Error };

inline const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting:   return "Connecting";
        case SessionState::Connected:    return "Connected";
        case SessionState::Error:        return "Error";
    }
    return "?";
}

struct StateChangedEvent {
    SessionState from = SessionState::Disconnected;
    SessionState to = SessionState::Disconnected;
    std::string cause;
};

struct ConnectedEvent {
    TransportKind kind = TransportKind::WifiSocket;
    std::string target;
};

struct DisconnectedEvent {
    std::string cause;
};

// Video payload is already decrypted
struct DataReceivedEvent {
    FrameType type = FrameType::Video;
    VideoFrame video;
    InputEvent input;
};

struct ErrorEvent {
    ErrorKind kind = ErrorKind::IoError;
    std::string message;
};

using SessionEvent = std::variant<StateChangedEvent, ConnectedEvent, DisconnectedEvent,
                                  DataReceivedEvent, ErrorEvent>;

} // namespace castlink
