#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

namespace plexwatch {
namespace services {

enum class HttpMethod {
    GET,
    POST,
    PATCH
};

// Transport-level failures. An HTTP error status is a response, not one of these.
enum class NetworkError {
    InvalidUrl,
    DnsFailure,
    ConnectionFailed,
    TlsFailure,
    Timeout,
    BadResponse
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};

    bool is_valid() const;
};

struct HttpResponse {
    long status_code = 200;
    std::string body;

    int status() const { return static_cast<int>(status_code); }
    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

const char* to_string(HttpMethod method);
std::string to_string(NetworkError error);

} // namespace services
} // namespace plexwatch
