#include "domain/Ports.hpp"

namespace domain {

const char* to_string(StreamState state) noexcept {
    switch (state) {
    case StreamState::Idle:
        return "idle";
    case StreamState::Connecting:
        return "connecting";
    case StreamState::Connected:
        return "connected";
    case StreamState::Reconnecting:
        return "reconnecting";
    case StreamState::Disconnected:
        return "disconnected";
    }
    return "unknown";
}

}  // namespace domain
