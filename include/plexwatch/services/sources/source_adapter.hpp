#pragma once

#include "plexwatch/core/models.hpp"
#include "plexwatch/services/network/http_types.hpp"
#include <chrono>

namespace plexwatch {
namespace services {

/**
 * @brief One external system polled once per tick
 *
 * fetch() never throws; every failure is reported through the snapshot's
 * error. A disabled adapter answers with a Disabled failure and makes no
 * network call.
 */
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    virtual core::SourceKind kind() const = 0;
    virtual bool enabled() const = 0;
    virtual core::SourceSnapshot fetch(std::chrono::milliseconds timeout) = 0;
};

inline core::SourceError source_error_from_network(NetworkError error) {
    return error == NetworkError::Timeout ? core::SourceError::Timeout
                                          : core::SourceError::Unavailable;
}

inline core::SourceError source_error_from_status(int status) {
    if (status == 401 || status == 403) {
        return core::SourceError::Unauthorized;
    }
    return core::SourceError::Unavailable;
}

} // namespace services
} // namespace plexwatch
