#pragma once

#include "plexwatch/core/models.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace plexwatch {
namespace services {

struct RenderedDashboard {
    std::string body;           // JSON message payload, ready for the sink
    std::string content_hash;   // SHA-256 of the payload without its timestamp
};

/**
 * @brief Serializes a ViewModel into a Discord message with one embed
 *
 * Rendering is pure: equal view models give byte-identical bodies, and view
 * models that differ only in @c generated_at give equal hashes. Relative
 * times are emitted as Discord timestamp markup so they never change the
 * content.
 */
class DashboardRenderer {
public:
    static constexpr int COLOR_ONLINE = 0x2ECC71;
    static constexpr int COLOR_OFFLINE = 0xE74C3C;
    static constexpr const char* PLACEHOLDER = "—";

    DashboardRenderer(core::DashboardConfig dashboard, core::LibraryConfig library);

    RenderedDashboard render(const core::ViewModel& view) const;

    // The embed without its timestamp; exposed for tests
    nlohmann::json build_embed(const core::ViewModel& view) const;

    std::string format_stream(const core::StreamSession& stream) const;
    std::string stream_emoji(const core::StreamSession& stream) const;

    static std::string format_uptime_window(const core::UptimeWindow& window);

private:
    core::DashboardConfig m_dashboard;
    core::LibraryConfig m_library;

    // budget is the number of fields left for this block
    void add_online_fields(nlohmann::json& fields, const core::ViewModel& view, std::size_t budget) const;
    void add_library_fields(nlohmann::json& fields, const std::vector<core::LibraryRow>& rows,
                            std::size_t room) const;
    void add_offline_fields(nlohmann::json& fields, const core::ViewModel& view) const;
    void add_uptime_fields(nlohmann::json& fields, const core::ViewModel& view) const;
    void add_stream_fields(nlohmann::json& fields, const core::ViewModel& view) const;
    void add_download_fields(nlohmann::json& fields, const core::ViewModel& view) const;
    void add_source_status_field(nlohmann::json& fields, const core::ViewModel& view) const;
};

} // namespace services
} // namespace plexwatch
