#include "plexwatch/utils/plex_headers_builder.hpp"
#include "version.h"

namespace plexwatch::utils {

std::string PlexHeadersBuilder::get_version() {
    return PLEXWATCH_VERSION_STRING;
}

services::HttpHeaders PlexHeadersBuilder::create_plex_headers(const std::string& auth_token) {
    services::HttpHeaders headers;
    headers["X-Plex-Product"] = "plexwatch";
    headers["X-Plex-Version"] = get_version();
    headers["X-Plex-Client-Identifier"] = "plexwatch-dashboard";
    headers["X-Plex-Platform"] = "Linux";
    headers["X-Plex-Device"] = "Server";
    headers["Accept"] = "application/json";

    if (!auth_token.empty()) {
        headers["X-Plex-Token"] = auth_token;
    }

    return headers;
}

services::HttpHeaders PlexHeadersBuilder::create_jellyfin_headers(const std::string& api_key) {
    services::HttpHeaders headers;
    headers["Accept"] = "application/json";
    if (!api_key.empty()) {
        headers["X-Emby-Token"] = api_key;
    }
    return headers;
}

} // namespace plexwatch::utils
