#include "plexwatch/services/discord/discord_presence_sink.hpp"
#include "plexwatch/utils/logger.hpp"

namespace plexwatch {
namespace services {

DiscordPresenceSink::DiscordPresenceSink(std::string client_id)
    : m_ipc(std::make_unique<DiscordIPC>(std::move(client_id))) {
}

DiscordPresenceSink::~DiscordPresenceSink() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_ipc->is_connected()) {
        m_ipc->clear_activity();
    }
    m_ipc->disconnect();
}

std::expected<void, PresenceError> DiscordPresenceSink::set_presence(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_ipc->is_connected() && !m_ipc->connect()) {
        return std::unexpected(PresenceError::NotConnected);
    }

    const nlohmann::json activity = {
        {"state", text},
        {"instance", false}
    };

    if (!m_ipc->send_activity(activity)) {
        return std::unexpected(PresenceError::IpcError);
    }
    return {};
}

} // namespace services
} // namespace plexwatch
