#pragma once

#include "plexwatch/core/models.hpp"
#include "plexwatch/services/dashboard/artifact_sink.hpp"
#include "plexwatch/services/network/http_client.hpp"
#include <memory>

namespace plexwatch {
namespace services {

// Posts and edits the dashboard message through the Discord REST API
class DiscordMessageSink : public ArtifactSink {
public:
    DiscordMessageSink(std::shared_ptr<HttpClient> http_client, core::DiscordConfig config);

    std::expected<std::string, SinkError> create(const std::string& body) override;
    std::expected<void, SinkError> update(const std::string& artifact_id, const std::string& body) override;

    static SinkError error_from_status(int status);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::DiscordConfig m_config;

    HttpHeaders auth_headers() const;
    std::string messages_url() const;
};

} // namespace services
} // namespace plexwatch
