#pragma once

#include "plexwatch/services/sources/source_adapter.hpp"
#include "plexwatch/services/network/http_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace plexwatch {
namespace services {

// Active playback sessions from /status/sessions
class PlexStreamSource : public SourceAdapter {
public:
    PlexStreamSource(std::shared_ptr<HttpClient> http_client, core::PlexConfig config);

    core::SourceKind kind() const override { return core::SourceKind::PlexStreams; }
    bool enabled() const override;
    core::SourceSnapshot fetch(std::chrono::milliseconds timeout) override;

    // Exposed for tests
    static core::StreamSession parse_session(const nlohmann::json& metadata);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::PlexConfig m_config;
};

} // namespace services
} // namespace plexwatch
