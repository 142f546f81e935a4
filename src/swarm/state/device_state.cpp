/**
 * @file device_state.cpp
 * @brief Phase labels for logs and observability.
 */
#include "swarm/state/device_state.hpp"

namespace swarm::state {

std::string_view to_string(ConnectionPhase phase) noexcept {
    switch (phase) {
        case ConnectionPhase::Discovered:   return "DISCOVERED";
        case ConnectionPhase::Connecting:   return "CONNECTING";
        case ConnectionPhase::Connected:    return "CONNECTED";
        case ConnectionPhase::Error:        return "ERROR";
        case ConnectionPhase::Disconnected: return "DISCONNECTED";
    }
    return "UNKNOWN";
}

} // namespace swarm::state
