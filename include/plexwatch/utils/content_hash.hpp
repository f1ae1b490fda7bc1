#pragma once

#include <string>
#include <string_view>

namespace plexwatch::utils {

/**
 * @brief Lowercase hex SHA-256 digest of @p content
 *
 * @throws std::runtime_error if the digest context cannot be created
 */
std::string sha256_hex(std::string_view content);

} // namespace plexwatch::utils
