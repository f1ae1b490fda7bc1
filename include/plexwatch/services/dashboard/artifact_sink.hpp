#pragma once

#include <expected>
#include <string>

namespace plexwatch {
namespace services {

enum class SinkError {
    NotFound,
    Unauthorized,
    RateLimited,
    NetworkFailure,
    BadResponse
};

// Destination for the rendered dashboard, one persistent message
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;

    // Returns the id of the new artifact
    virtual std::expected<std::string, SinkError> create(const std::string& body) = 0;
    virtual std::expected<void, SinkError> update(const std::string& artifact_id, const std::string& body) = 0;
};

inline std::string to_string(SinkError error) {
    switch (error) {
        case SinkError::NotFound: return "not found";
        case SinkError::Unauthorized: return "unauthorized";
        case SinkError::RateLimited: return "rate limited";
        case SinkError::NetworkFailure: return "network failure";
        case SinkError::BadResponse: return "bad response";
    }
    return "unknown";
}

} // namespace services
} // namespace plexwatch
