#include "plexwatch/services/dashboard/dashboard_renderer.hpp"
#include "plexwatch/utils/content_hash.hpp"
#include "plexwatch/utils/format_utils.hpp"
#include <algorithm>
#include <cstdio>

namespace plexwatch {
namespace services {

using json = nlohmann::json;

namespace {

// Discord rejects embeds beyond these sizes
constexpr std::size_t FIELD_VALUE_LIMIT = 1024;
constexpr std::size_t EMBED_FIELD_LIMIT = 25;
const std::string BLANK = "\u200b";

json field(const std::string& name, const std::string& value, bool inline_field) {
    return json{{"name", name}, {"value", value}, {"inline", inline_field}};
}

std::string code_block(const std::string& text) {
    return "```" + text + "```";
}

std::string plural(std::size_t count) {
    return count == 1 ? "" : "s";
}

std::string or_placeholder(const std::optional<std::string>& value) {
    return value && !value->empty() ? *value : DashboardRenderer::PLACEHOLDER;
}

std::string or_placeholder(const std::string& value) {
    return value.empty() ? DashboardRenderer::PLACEHOLDER : value;
}

} // namespace

DashboardRenderer::DashboardRenderer(core::DashboardConfig dashboard, core::LibraryConfig library)
    : m_dashboard(std::move(dashboard))
    , m_library(std::move(library)) {
}

RenderedDashboard DashboardRenderer::render(const core::ViewModel& view) const {
    json payload;
    payload["embeds"] = json::array({build_embed(view)});
    payload["allowed_mentions"] = json{{"parse", json::array()}};

    RenderedDashboard rendered;
    rendered.content_hash = utils::sha256_hex(payload.dump());

    payload["embeds"][0]["timestamp"] = utils::format_iso8601(view.generated_at);
    rendered.body = payload.dump();
    return rendered;
}

json DashboardRenderer::build_embed(const core::ViewModel& view) const {
    const bool offline = view.primary_down();

    json embed;
    embed["title"] = offline ? "Server is currently Offline! :warning:"
                             : "Server is currently Online! :white_check_mark:";
    embed["color"] = offline ? COLOR_OFFLINE : COLOR_ONLINE;

    json trailing = json::array();
    add_download_fields(trailing, view);
    add_source_status_field(trailing, view);

    json fields = json::array();
    if (offline) {
        add_offline_fields(fields, view);
    } else {
        add_online_fields(fields, view, EMBED_FIELD_LIMIT - std::min(trailing.size(), EMBED_FIELD_LIMIT));
    }
    for (auto& f : trailing) {
        fields.push_back(std::move(f));
    }
    embed["fields"] = std::move(fields);

    json author{{"name", m_dashboard.name}};
    if (!m_dashboard.icon_url.empty()) {
        author["icon_url"] = m_dashboard.icon_url;
        embed["thumbnail"] = json{{"url", m_dashboard.icon_url}};
    }
    embed["author"] = std::move(author);

    json footer{{"text", "Last updated"}};
    if (!m_dashboard.footer_icon_url.empty()) {
        footer["icon_url"] = m_dashboard.footer_icon_url;
    }
    embed["footer"] = std::move(footer);

    return embed;
}

void DashboardRenderer::add_offline_fields(json& fields, const core::ViewModel& view) const {
    std::string since = "Unknown";
    auto it = view.source_health.find(view.primary_stream_source());
    if (it != view.source_health.end() && it->second.last_ok_at) {
        since = utils::discord_timestamp(*it->second.last_ok_at, 'R');
    }
    fields.push_back(field("Offline since:", since, false));

    add_uptime_fields(fields, view);

    // Other stream sources may still be playing
    if (view.total_streams > 0) {
        add_stream_fields(fields, view);
    }
}

void DashboardRenderer::add_online_fields(json& fields, const core::ViewModel& view, std::size_t budget) const {
    std::string up_since = PLACEHOLDER;
    auto it = view.source_health.find(view.primary_stream_source());
    if (it != view.source_health.end() && it->second.up_since) {
        up_since = utils::discord_timestamp(*it->second.up_since, 'R');
    }

    json tail = json::array();
    add_uptime_fields(tail, view);
    add_stream_fields(tail, view);

    const std::size_t header_fields = 3;
    const std::size_t used = header_fields + tail.size();
    const std::size_t room = budget > used ? budget - used : 0;

    fields.push_back(field("Server Uptime 🖥️", up_since, true));
    fields.push_back(field(BLANK, BLANK, true));
    fields.push_back(field(BLANK, BLANK, true));
    add_library_fields(fields, view.library, room);

    for (auto& f : tail) {
        fields.push_back(std::move(f));
    }
}

void DashboardRenderer::add_library_fields(json& fields, const std::vector<core::LibraryRow>& rows,
                                           std::size_t room) const {
    if (rows.empty() || room == 0) {
        return;
    }

    json separate = json::array();
    for (const auto& row : rows) {
        separate.push_back(field(row.display_name + " " + row.emoji,
                                 code_block(utils::format_count(row.item_count)), true));
        if (row.episode_count) {
            separate.push_back(field(row.display_name + " Episodes 📺",
                                     code_block(utils::format_count(*row.episode_count)), true));
        }
    }
    if (separate.size() <= room) {
        for (auto& f : separate) {
            fields.push_back(std::move(f));
        }
        return;
    }

    // Too many sections for one field each: one line per section instead
    std::string value;
    for (const auto& row : rows) {
        std::string line = row.emoji + " " + row.display_name + ": " + utils::format_count(row.item_count);
        if (row.episode_count) {
            line += " (" + utils::format_count(*row.episode_count) + " Episodes)";
        }
        if (value.size() + line.size() + 1 > FIELD_VALUE_LIMIT) {
            break;
        }
        if (!value.empty()) {
            value += "\n";
        }
        value += line;
    }
    fields.push_back(field("Libraries 📚", value, false));
}

void DashboardRenderer::add_uptime_fields(json& fields, const core::ViewModel& view) const {
    if (!view.uptime) {
        return;
    }
    fields.push_back(field("Uptime (24h)", code_block(format_uptime_window(view.uptime->last_24h)), true));
    fields.push_back(field("Uptime (7 days)", code_block(format_uptime_window(view.uptime->last_7d)), true));
    fields.push_back(field("Uptime (30 days)", code_block(format_uptime_window(view.uptime->last_30d)), true));
    if (view.uptime->last_down_at) {
        fields.push_back(field("Last downtime", utils::discord_timestamp(*view.uptime->last_down_at, 'R'), false));
    }
}

void DashboardRenderer::add_stream_fields(json& fields, const core::ViewModel& view) const {
    if (view.streams.empty()) {
        fields.push_back(field("Current Streams:", "💤 *No active streams currently*", false));
        return;
    }

    std::string name = std::to_string(view.total_streams) + " current Stream" + plural(view.total_streams) + ":";
    if (view.total_streams > view.streams.size()) {
        name += " (showing " + std::to_string(view.streams.size()) + " of " +
                std::to_string(view.total_streams) + ")";
    }

    // Long stream lists continue in untitled fields
    std::string value;
    for (const auto& stream : view.streams) {
        std::string block = format_stream(stream);
        if (!value.empty() && value.size() + 1 + block.size() > FIELD_VALUE_LIMIT) {
            fields.push_back(field(name, value, false));
            name = BLANK;
            value.clear();
        }
        if (!value.empty()) {
            value += "\n";
        }
        value += block;
    }
    fields.push_back(field(name, value, false));
}

void DashboardRenderer::add_download_fields(json& fields, const core::ViewModel& view) const {
    const auto status = view.status_of(core::SourceKind::Queue);
    if (status == core::SourceStatus::Disabled) {
        return;
    }

    if (!view.queue) {
        fields.push_back(field("Current Downloads:", "⚠️ *Download queue unavailable*", false));
        return;
    }

    const auto& queue = *view.queue;
    if (queue.items.empty()) {
        fields.push_back(field("Current Downloads:", "💤 *No active downloads currently*", false));
        return;
    }

    const std::size_t shown = std::min(queue.items.size(), m_dashboard.max_downloads);
    std::string value;
    std::uint64_t total_bytes = 0;
    for (std::size_t i = 0; i < queue.items.size(); ++i) {
        const auto& item = queue.items[i];
        total_bytes += item.size_bytes;
        if (i >= shown) {
            continue;
        }
        std::string line = "📥 " + or_placeholder(item.raw_title) + "\n└─ " +
                           utils::format_progress_bar(item.progress_fraction) + " | " +
                           utils::format_bytes(item.size_bytes);
        if (item.speed_bytes_per_sec > 0.0) {
            line += " | " + utils::format_speed(item.speed_bytes_per_sec);
        }
        if (!value.empty()) {
            value += "\n";
        }
        value += code_block(line);
    }

    std::string name = std::to_string(queue.items.size()) + " current Download" + plural(queue.items.size()) + ":";
    if (queue.paused) {
        name += " (paused)";
    }
    fields.push_back(field(name, value, false));

    fields.push_back(field("Downloads 📥", code_block(utils::format_bytes(total_bytes)), true));
    fields.push_back(field("Free Space 💾",
        code_block(queue.disk_free_bytes ? utils::format_bytes(*queue.disk_free_bytes) : PLACEHOLDER), true));
    fields.push_back(field("Total Space 🗄️",
        code_block(queue.disk_total_bytes ? utils::format_bytes(*queue.disk_total_bytes) : PLACEHOLDER), true));
}

void DashboardRenderer::add_source_status_field(json& fields, const core::ViewModel& view) const {
    std::string lines;
    for (const auto& [kind, health] : view.source_health) {
        std::string line;
        if (health.status == core::SourceStatus::Down) {
            line = "🔴 " + core::to_string(kind) + ": down";
        } else if (health.status == core::SourceStatus::Degraded) {
            line = "🟠 " + core::to_string(kind) + ": degraded";
        } else {
            continue;
        }
        if (!lines.empty()) {
            lines += "\n";
        }
        lines += line;
    }
    if (!lines.empty()) {
        fields.push_back(field("Source status", lines, false));
    }
}

std::string DashboardRenderer::format_stream(const core::StreamSession& stream) const {
    const std::string progress = stream.paused ? "⏸️" : utils::format_progress_bar(stream.progress_fraction);
    const auto total_layout = std::max(stream.duration, stream.elapsed);

    std::string details = (stream.transcoding ? "🔄 " : "⏯️ ") + or_placeholder(stream.quality_label);
    if (stream.bitrate_label && !stream.bitrate_label->empty()) {
        details += " " + *stream.bitrate_label;
    }
    details += " | " + or_placeholder(stream.player_label);

    return code_block(stream_emoji(stream) + " " + or_placeholder(stream.title) + " | " + or_placeholder(stream.raw_user) +
                      "\n└─ " + progress + " | " + utils::format_duration(stream.elapsed, total_layout) + "/" +
                      utils::format_duration(stream.duration, total_layout) +
                      "\n └─ " + details);
}

std::string DashboardRenderer::stream_emoji(const core::StreamSession& stream) const {
    auto it = std::find_if(m_library.sections.begin(), m_library.sections.end(),
        [&stream](const core::LibrarySectionConfig& section) {
            return section.title == stream.section_or_media_type;
        });
    if (it != m_library.sections.end() && !it->emoji.empty()) {
        return it->emoji;
    }

    switch (stream.media_kind) {
        case core::MediaKind::Track: return "🎵";
        case core::MediaKind::Movie: return "🎥";
        default: return "📺";
    }
}

std::string DashboardRenderer::format_uptime_window(const core::UptimeWindow& window) {
    char percentage[16];
    std::snprintf(percentage, sizeof(percentage), "%.1f%%", window.percentage);
    return std::string(percentage) + " (" + utils::format_uptime_length(window.duration_up) + ")";
}

} // namespace services
} // namespace plexwatch
