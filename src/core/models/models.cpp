#include "plexwatch/core/models.hpp"

namespace plexwatch {
namespace core {

void ApplicationConfig::derive_enabled_flags() {
    plex.enabled = !plex.url.empty() && !plex.token.empty();
    jellyfin.enabled = !jellyfin.url.empty() && !jellyfin.api_key.empty();
    sabnzbd.enabled = !sabnzbd.url.empty() && !sabnzbd.api_key.empty();
    uptime.enabled = !uptime.api_key.empty() && !uptime.monitor_id.empty();
}

} // namespace core
} // namespace plexwatch
