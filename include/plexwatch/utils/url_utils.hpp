#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plexwatch::utils::url {

// Ordered, so the same parameters always produce the same request URL
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// RFC 3986 percent-encoding of everything outside the unreserved set
std::string encode(std::string_view text);

// Exactly one '/' between base and path
std::string join(std::string_view base, std::string_view path);

std::string query(const QueryParams& params);

// join(base, path) + "?" + query(params), or just the join when params is empty
std::string with_query(std::string_view base, std::string_view path, const QueryParams& params);

// http:// or https:// followed by at least one character
bool is_http(std::string_view candidate);

std::string trim_trailing_slashes(std::string value);

} // namespace plexwatch::utils::url
