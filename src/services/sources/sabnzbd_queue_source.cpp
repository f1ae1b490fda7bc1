#include "plexwatch/services/sources/sabnzbd_queue_source.hpp"
#include "plexwatch/utils/json_helper.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/url_utils.hpp"
#include <algorithm>

namespace plexwatch {
namespace services {

using json = nlohmann::json;
using utils::JsonHelper;

namespace {
    constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
    constexpr double BYTES_PER_GB = BYTES_PER_MB * 1024.0;

    std::uint64_t to_bytes(double amount, double unit) {
        return amount > 0.0 ? static_cast<std::uint64_t>(amount * unit) : 0;
    }
}

SabnzbdQueueSource::SabnzbdQueueSource(std::shared_ptr<HttpClient> http_client, core::SabnzbdConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {
}

bool SabnzbdQueueSource::enabled() const {
    return m_config.enabled && !m_config.url.empty() && !m_config.api_key.empty();
}

core::SourceSnapshot SabnzbdQueueSource::fetch(std::chrono::milliseconds timeout) {
    const auto now = core::Clock::now();
    if (!enabled()) {
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::Disabled);
    }

    HttpRequest request;
    request.url = utils::url::with_query(m_config.url, "/api", {
        {"mode", "queue"},
        {"output", "json"},
        {"apikey", m_config.api_key}
    });
    request.headers["Accept"] = "application/json";
    request.timeout = timeout;

    auto response = m_http_client->execute(request);
    if (!response) {
        PLEXWATCH_LOG_WARNING("SabnzbdQueueSource", "Queue request failed: " + to_string(response.error()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_network(response.error()));
    }
    if (!response->is_success()) {
        PLEXWATCH_LOG_WARNING("SabnzbdQueueSource", "Queue request returned HTTP " + std::to_string(response->status()));
        return core::SourceSnapshot::failure(kind(), now, source_error_from_status(response->status()));
    }

    auto body = JsonHelper::safe_parse(response->body);
    if (!body) {
        PLEXWATCH_LOG_WARNING("SabnzbdQueueSource", body.error());
        return core::SourceSnapshot::failure(kind(), now, core::SourceError::MalformedResponse);
    }

    auto queue = parse_queue(*body);
    if (!queue) {
        return core::SourceSnapshot::failure(kind(), now, queue.error());
    }

    PLEXWATCH_LOG_DEBUG("SabnzbdQueueSource", "Queue holds " + std::to_string(queue->items.size()) + " items");
    return core::SourceSnapshot::success(kind(), now, std::move(*queue));
}

std::expected<core::QueueList, core::SourceError> SabnzbdQueueSource::parse_queue(const json& body) {
    // A wrong API key still answers 200, with {"status": false, "error": "..."}
    if (JsonHelper::has_field(body, "error")) {
        PLEXWATCH_LOG_WARNING("SabnzbdQueueSource", "SABnzbd rejected the request: " +
                              JsonHelper::get_optional<std::string>(body, "error", ""));
        return std::unexpected(core::SourceError::Unauthorized);
    }
    if (!JsonHelper::has_field(body, "queue") || !body["queue"].is_object()) {
        PLEXWATCH_LOG_WARNING("SabnzbdQueueSource", "Response has no queue object");
        return std::unexpected(core::SourceError::MalformedResponse);
    }

    const auto& queue = body["queue"];
    core::QueueList result;
    result.paused = JsonHelper::get_optional<bool>(queue, "paused", false);

    if (auto free_gb = JsonHelper::get_number(queue, "diskspace1")) {
        result.disk_free_bytes = to_bytes(*free_gb, BYTES_PER_GB);
    }
    if (auto total_gb = JsonHelper::get_number(queue, "diskspacetotal1")) {
        result.disk_total_bytes = to_bytes(*total_gb, BYTES_PER_GB);
    }

    // The queue reports one aggregate speed; it belongs to the active item
    const double speed = JsonHelper::get_number(queue, "kbpersec").value_or(0.0) * 1024.0;

    try {
        JsonHelper::for_each_in_array(queue, "slots", [&](const json& slot) {
            core::QueueItem item;
            item.raw_title = JsonHelper::get_optional<std::string>(slot, "filename", "");

            const double total_mb = JsonHelper::get_number(slot, "mb").value_or(0.0);
            const double left_mb = JsonHelper::get_number(slot, "mbleft").value_or(0.0);
            item.size_bytes = to_bytes(total_mb, BYTES_PER_MB);
            if (total_mb > 0.0) {
                item.progress_fraction = std::clamp(1.0 - left_mb / total_mb, 0.0, 1.0);
            } else if (auto percentage = JsonHelper::get_number(slot, "percentage")) {
                item.progress_fraction = std::clamp(*percentage / 100.0, 0.0, 1.0);
            }

            if (result.items.empty() && !result.paused) {
                item.speed_bytes_per_sec = speed;
            }
            result.items.push_back(std::move(item));
        });
    } catch (const json::exception& e) {
        PLEXWATCH_LOG_WARNING("SabnzbdQueueSource", "Failed to parse queue slots: " + std::string(e.what()));
        return std::unexpected(core::SourceError::MalformedResponse);
    }

    return result;
}

} // namespace services
} // namespace plexwatch
