#pragma once

#include "plexwatch/services/network/http_types.hpp"
#include <expected>
#include <memory>

namespace plexwatch {
namespace services {

using HttpResult = std::expected<HttpResponse, NetworkError>;

// Implementations must be safe to call from several worker threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResult execute(const HttpRequest& request) = 0;

    // JSON writes used by the Discord sinks; both go through execute()
    HttpResult post_json(const std::string& url, const std::string& json, const HttpHeaders& headers = {});
    HttpResult patch_json(const std::string& url, const std::string& json, const HttpHeaders& headers = {});

protected:
    virtual std::chrono::milliseconds write_timeout() const { return std::chrono::seconds(30); }
};

struct HttpClientConfig {
    std::chrono::milliseconds default_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    HttpHeaders default_headers;
    std::string user_agent = "plexwatch/1.0";
    bool verify_ssl = true;

    bool is_valid() const;
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace plexwatch
