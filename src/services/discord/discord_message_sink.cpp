#include "plexwatch/services/discord/discord_message_sink.hpp"
#include "plexwatch/utils/json_helper.hpp"
#include "plexwatch/utils/logger.hpp"
#include "plexwatch/utils/url_utils.hpp"

namespace plexwatch {
namespace services {

DiscordMessageSink::DiscordMessageSink(std::shared_ptr<HttpClient> http_client, core::DiscordConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {
}

std::expected<std::string, SinkError> DiscordMessageSink::create(const std::string& body) {
    auto response = m_http_client->post_json(messages_url(), body, auth_headers());
    if (!response) {
        PLEXWATCH_LOG_WARNING("DiscordMessageSink", "Create request failed: " + to_string(response.error()));
        return std::unexpected(SinkError::NetworkFailure);
    }
    if (!response->is_success()) {
        PLEXWATCH_LOG_WARNING("DiscordMessageSink", "Create returned HTTP " + std::to_string(response->status()) +
                              ": " + response->body);
        return std::unexpected(error_from_status(response->status()));
    }

    auto json = utils::JsonHelper::safe_parse(response->body);
    if (!json) {
        PLEXWATCH_LOG_WARNING("DiscordMessageSink", "Create response is not JSON: " + json.error());
        return std::unexpected(SinkError::BadResponse);
    }

    auto id = utils::JsonHelper::get_maybe<std::string>(*json, "id");
    if (!id || id->empty()) {
        PLEXWATCH_LOG_WARNING("DiscordMessageSink", "Create response carries no message id");
        return std::unexpected(SinkError::BadResponse);
    }
    return *id;
}

std::expected<void, SinkError> DiscordMessageSink::update(const std::string& artifact_id, const std::string& body) {
    const auto url = utils::url::join(messages_url(), artifact_id);
    auto response = m_http_client->patch_json(url, body, auth_headers());
    if (!response) {
        PLEXWATCH_LOG_WARNING("DiscordMessageSink", "Update request failed: " + to_string(response.error()));
        return std::unexpected(SinkError::NetworkFailure);
    }
    if (!response->is_success()) {
        PLEXWATCH_LOG_WARNING("DiscordMessageSink", "Update returned HTTP " + std::to_string(response->status()));
        return std::unexpected(error_from_status(response->status()));
    }
    return {};
}

SinkError DiscordMessageSink::error_from_status(int status) {
    switch (status) {
        case 404: return SinkError::NotFound;
        case 401:
        case 403: return SinkError::Unauthorized;
        case 429: return SinkError::RateLimited;
        default: return SinkError::BadResponse;
    }
}

HttpHeaders DiscordMessageSink::auth_headers() const {
    return HttpHeaders{
        {"Authorization", "Bot " + m_config.bot_token},
        {"Accept", "application/json"}
    };
}

std::string DiscordMessageSink::messages_url() const {
    return utils::url::join(m_config.api_base, "channels/" + m_config.channel_id + "/messages");
}

} // namespace services
} // namespace plexwatch
