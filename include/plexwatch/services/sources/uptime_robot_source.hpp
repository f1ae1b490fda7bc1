#pragma once

#include "plexwatch/services/sources/source_adapter.hpp"
#include "plexwatch/services/network/http_client.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <memory>

namespace plexwatch {
namespace services {

// Uptime ratios for the last 1, 7 and 30 days of one monitor
class UptimeRobotSource : public SourceAdapter {
public:
    UptimeRobotSource(std::shared_ptr<HttpClient> http_client, core::UptimeConfig config);

    core::SourceKind kind() const override { return core::SourceKind::Uptime; }
    bool enabled() const override;
    core::SourceSnapshot fetch(std::chrono::milliseconds timeout) override;

    static std::expected<core::UptimeStats, core::SourceError> parse_monitor(const nlohmann::json& body);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::UptimeConfig m_config;
};

} // namespace services
} // namespace plexwatch
