#pragma once

#include "plexwatch/services/discord/discord_ipc.hpp"
#include "plexwatch/services/presence/presence_sink.hpp"
#include <memory>
#include <mutex>

namespace plexwatch {
namespace services {

// Sets the custom status text over the local Discord RPC socket.
// Connects lazily and reconnects on the next call after a failure.
class DiscordPresenceSink : public PresenceSink {
public:
    explicit DiscordPresenceSink(std::string client_id);
    ~DiscordPresenceSink() override;

    std::expected<void, PresenceError> set_presence(const std::string& text) override;

private:
    std::unique_ptr<DiscordIPC> m_ipc;
    std::mutex m_mutex;
};

} // namespace services
} // namespace plexwatch
