#pragma once

#include "plexwatch/services/network/http_types.hpp"
#include <string>

namespace plexwatch::utils {

/**
 * @brief Helper for building the headers the Plex and Jellyfin APIs expect
 */
class PlexHeadersBuilder {
public:
    /**
     * @brief Plex headers with the client description and the auth token
     *
     * @param auth_token The Plex token; omitted from the headers when empty
     */
    static services::HttpHeaders create_plex_headers(const std::string& auth_token);

    /**
     * @brief Jellyfin headers authenticated with an API key
     */
    static services::HttpHeaders create_jellyfin_headers(const std::string& api_key);

    static std::string get_version();
};

} // namespace plexwatch::utils
