#pragma once

#include <expected>
#include <string>

namespace plexwatch {
namespace services {

enum class PresenceError {
    NotConnected,
    IpcError
};

// Receives the one-line status text
class PresenceSink {
public:
    virtual ~PresenceSink() = default;
    virtual std::expected<void, PresenceError> set_presence(const std::string& text) = 0;
};

inline std::string to_string(PresenceError error) {
    switch (error) {
        case PresenceError::NotConnected: return "not connected";
        case PresenceError::IpcError: return "IPC error";
    }
    return "unknown";
}

} // namespace services
} // namespace plexwatch
