#pragma once

#include "plexwatch/services/network/http_types.hpp"
#include <chrono>
#include <string>

namespace plexwatch {
namespace services {

// Fluent HttpRequest assembly; body helpers also set Content-Type
class RequestBuilder {
public:
    explicit RequestBuilder(std::string url);

    RequestBuilder& method(HttpMethod method);
    RequestBuilder& header(const std::string& name, std::string value);
    RequestBuilder& headers(const HttpHeaders& extra);
    RequestBuilder& json_body(std::string json);
    RequestBuilder& form_body(std::string form);
    RequestBuilder& timeout(std::chrono::milliseconds timeout);

    HttpRequest build() const { return m_request; }

private:
    HttpRequest m_request;
};

} // namespace services
} // namespace plexwatch
