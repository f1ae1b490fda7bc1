#pragma once

#include "plexwatch/services/sources/source_adapter.hpp"
#include "plexwatch/services/network/http_client.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <memory>

namespace plexwatch {
namespace services {

class SabnzbdQueueSource : public SourceAdapter {
public:
    SabnzbdQueueSource(std::shared_ptr<HttpClient> http_client, core::SabnzbdConfig config);

    core::SourceKind kind() const override { return core::SourceKind::Queue; }
    bool enabled() const override;
    core::SourceSnapshot fetch(std::chrono::milliseconds timeout) override;

    static std::expected<core::QueueList, core::SourceError> parse_queue(const nlohmann::json& body);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::SabnzbdConfig m_config;
};

} // namespace services
} // namespace plexwatch
