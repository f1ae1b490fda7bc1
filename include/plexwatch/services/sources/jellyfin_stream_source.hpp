#pragma once

#include "plexwatch/services/sources/source_adapter.hpp"
#include "plexwatch/services/network/http_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>

namespace plexwatch {
namespace services {

class JellyfinStreamSource : public SourceAdapter {
public:
    JellyfinStreamSource(std::shared_ptr<HttpClient> http_client, core::JellyfinConfig config);

    core::SourceKind kind() const override { return core::SourceKind::JellyfinStreams; }
    bool enabled() const override;
    core::SourceSnapshot fetch(std::chrono::milliseconds timeout) override;

    // Sessions without a NowPlayingItem are idle clients and yield nullopt
    static std::optional<core::StreamSession> parse_session(const nlohmann::json& session);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::JellyfinConfig m_config;
};

} // namespace services
} // namespace plexwatch
