/**
 * @file transport.cpp
 * @brief Labels for transport error codes.
 */
#include "swarm/transport/transport.hpp"

namespace swarm::transport {

    std::string_view to_string(ConnectError e) noexcept {
        switch (e) {
            case ConnectError::AlreadyConnected: return "already_connected";
            case ConnectError::Busy:             return "busy";
            case ConnectError::Unreachable:      return "unreachable";
            case ConnectError::NotRunning:       return "not_running";
        }
        return "unknown";
    }

} // namespace swarm::transport
