#include "plexwatch/services/network/http_client.hpp"
#include "plexwatch/services/network/request_builder.hpp"
#include "plexwatch/utils/url_utils.hpp"

namespace plexwatch {
namespace services {

bool HttpRequest::is_valid() const {
    return utils::url::is_http(url) && timeout.count() > 0;
}

const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PATCH: return "PATCH";
    }
    return "GET";
}

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::InvalidUrl: return "invalid URL";
        case NetworkError::DnsFailure: return "DNS lookup failed";
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::TlsFailure: return "TLS handshake failed";
        case NetworkError::Timeout: return "timed out";
        case NetworkError::BadResponse: return "bad response";
    }
    return "unknown network error";
}

HttpResult HttpClient::post_json(const std::string& url, const std::string& json, const HttpHeaders& headers) {
    return execute(RequestBuilder(url)
                       .method(HttpMethod::POST)
                       .headers(headers)
                       .json_body(json)
                       .timeout(write_timeout())
                       .build());
}

HttpResult HttpClient::patch_json(const std::string& url, const std::string& json, const HttpHeaders& headers) {
    return execute(RequestBuilder(url)
                       .method(HttpMethod::PATCH)
                       .headers(headers)
                       .json_body(json)
                       .timeout(write_timeout())
                       .build());
}

bool HttpClientConfig::is_valid() const {
    return default_timeout.count() > 0 && connect_timeout.count() > 0;
}

RequestBuilder::RequestBuilder(std::string url) {
    m_request.url = std::move(url);
}

RequestBuilder& RequestBuilder::method(HttpMethod method) {
    m_request.method = method;
    return *this;
}

RequestBuilder& RequestBuilder::header(const std::string& name, std::string value) {
    m_request.headers[name] = std::move(value);
    return *this;
}

RequestBuilder& RequestBuilder::headers(const HttpHeaders& extra) {
    for (const auto& [name, value] : extra) {
        m_request.headers[name] = value;
    }
    return *this;
}

RequestBuilder& RequestBuilder::json_body(std::string json) {
    m_request.body = std::move(json);
    m_request.headers["Content-Type"] = "application/json";
    return *this;
}

RequestBuilder& RequestBuilder::form_body(std::string form) {
    m_request.body = std::move(form);
    m_request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    return *this;
}

RequestBuilder& RequestBuilder::timeout(std::chrono::milliseconds timeout) {
    m_request.timeout = timeout;
    return *this;
}

} // namespace services
} // namespace plexwatch
