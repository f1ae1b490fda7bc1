#include "plexwatch/services/sources/uptime_robot_source.hpp"
#include "plexwatch/services/network/request_builder.hpp"
#include "plexwatch/utils/json_helper.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/url_utils.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

namespace plexwatch {
namespace services {

using json = nlohmann::json;
using utils::JsonHelper;

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;
constexpr int LOG_TYPE_DOWN = 1;

core::UptimeWindow make_window(double percentage, std::int64_t days) {
    core::UptimeWindow window;
    window.percentage = std::clamp(percentage, 0.0, 100.0);
    window.duration_up = std::chrono::seconds(
        static_cast<std::int64_t>(window.percentage / 100.0 * static_cast<double>(days * SECONDS_PER_DAY)));
    return window;
}

// "99.990-99.950-99.900"
std::vector<double> split_ratios(const std::string& text) {
    std::vector<double> ratios;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, '-')) {
        try {
            ratios.push_back(std::stod(part));
        } catch (const std::exception&) {
            return {};
        }
    }
    return ratios;
}

} // namespace

UptimeRobotSource::UptimeRobotSource(std::shared_ptr<HttpClient> http_client, core::UptimeConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {
}

bool UptimeRobotSource::enabled() const {
    return m_config.enabled && !m_config.api_key.empty() && !m_config.monitor_id.empty();
}

core::SourceSnapshot UptimeRobotSource::fetch(std::chrono::milliseconds timeout) {
    const auto now = core::Clock::now();
    if (!enabled()) {
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::Disabled);
    }

    auto request = RequestBuilder(m_config.endpoint)
        .method(HttpMethod::POST)
        .header("Accept", "application/json")
        .header("Cache-Control", "no-cache")
        .form_body(utils::url::query({
            {"api_key", m_config.api_key},
            {"monitors", m_config.monitor_id},
            {"custom_uptime_ratios", "1-7-30"},
            {"logs", "1"},
            {"format", "json"}
        }))
        .timeout(timeout)
        .build();

    auto response = m_http_client->execute(request);
    if (!response) {
        PLEXWATCH_LOG_WARNING("UptimeRobotSource", "Monitor request failed: " + to_string(response.error()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_network(response.error()));
    }
    if (!response->is_success()) {
        PLEXWATCH_LOG_WARNING("UptimeRobotSource", "Monitor request returned HTTP " + std::to_string(response->status()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_status(response->status()));
    }

    auto body = JsonHelper::safe_parse(response->body);
    if (!body) {
        PLEXWATCH_LOG_WARNING("UptimeRobotSource", body.error());
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::MalformedResponse);
    }

    auto stats = parse_monitor(*body);
    if (!stats) {
        return core::SourceSnapshot::failure(kind(), now, stats.error());
    }
    return core::SourceSnapshot::success(kind(), now, std::move(*stats));
}

std::expected<core::UptimeStats, core::SourceError> UptimeRobotSource::parse_monitor(const json& body) {
    const auto stat = JsonHelper::get_optional<std::string>(body, "stat", "");
    if (stat != "ok") {
        std::string message = "unknown error";
        if (JsonHelper::has_field(body, "error")) {
            message = JsonHelper::get_optional<std::string>(body["error"], "message", message);
        }
        PLEXWATCH_LOG_WARNING("UptimeRobotSource", "UptimeRobot returned stat '" + stat + "': " + message);
        return std::unexpected(core::SourceError::Unauthorized);
    }

    if (!JsonHelper::has_array(body, "monitors") || body["monitors"].empty()) {
        PLEXWATCH_LOG_WARNING("UptimeRobotSource", "No monitors in response");
        return std::unexpected(core::SourceError::MalformedResponse);
    }

    const auto& monitor = body["monitors"][0];
    auto ratios = split_ratios(JsonHelper::get_optional<std::string>(monitor, "custom_uptime_ratio", ""));
    if (ratios.size() != 3) {
        PLEXWATCH_LOG_WARNING("UptimeRobotSource", "Unexpected custom_uptime_ratio format");
        return std::unexpected(core::SourceError::MalformedResponse);
    }

    core::UptimeStats stats;
    stats.last_24h = make_window(ratios[0], 1);
    stats.last_7d = make_window(ratios[1], 7);
    stats.last_30d = make_window(ratios[2], 30);

    std::int64_t newest_down = 0;
    JsonHelper::for_each_in_array(monitor, "logs", [&](const json& entry) {
        if (JsonHelper::get_optional<int>(entry, "type", 0) != LOG_TYPE_DOWN) {
            return;
        }
        newest_down = std::max(newest_down, JsonHelper::get_optional<std::int64_t>(entry, "datetime", 0));
    });
    if (newest_down > 0) {
        stats.last_down_at = core::TimePoint(std::chrono::seconds(newest_down));
    }

    return stats;
}

} // namespace services
} // namespace plexwatch
