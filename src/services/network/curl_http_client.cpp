#include "plexwatch/services/network/http_client.hpp"
#include "plexwatch/utils/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>

namespace plexwatch {
namespace services {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct ListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, ListDeleter>;

size_t append_body(char* data, size_t size, size_t count, void* target) {
    static_cast<std::string*>(target)->append(data, size * count);
    return size * count;
}

// API keys travel in query strings
std::string without_query(const std::string& url) {
    const auto pos = url.find('?');
    return pos == std::string::npos ? url : url.substr(0, pos);
}

NetworkError map_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return NetworkError::InvalidUrl;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetworkError::DnsFailure;
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return NetworkError::ConnectionFailed;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_PEER_FAILED_VERIFICATION:
            return NetworkError::TlsFailure;
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        default:
            return NetworkError::BadResponse;
    }
}

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config) : m_config(std::move(config)) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    HttpResult execute(const HttpRequest& request) override {
        const auto target = std::string(to_string(request.method)) + " " + without_query(request.url);

        if (!request.is_valid()) {
            PLEXWATCH_LOG_ERROR("CurlHttpClient", "Rejected request " + target);
            return std::unexpected(NetworkError::InvalidUrl);
        }

        EasyHandle curl(curl_easy_init());
        if (!curl) {
            PLEXWATCH_LOG_ERROR("CurlHttpClient", "curl_easy_init failed");
            return std::unexpected(NetworkError::ConnectionFailed);
        }

        std::string body;
        auto* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
        // Worker threads cannot take SIGALRM for timeouts
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 3L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min(request.timeout, m_config.connect_timeout).count()));
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, m_config.verify_ssl ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, m_config.verify_ssl ? 2L : 0L);
        if (!m_config.user_agent.empty()) {
            curl_easy_setopt(h, CURLOPT_USERAGENT, m_config.user_agent.c_str());
        }

        if (request.method != HttpMethod::GET) {
            if (request.method == HttpMethod::PATCH) {
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PATCH");
            } else {
                curl_easy_setopt(h, CURLOPT_POST, 1L);
            }
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }

        HeaderList headers = build_headers(request);
        if (headers) {
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        }

        const auto started = std::chrono::steady_clock::now();
        const CURLcode result = curl_easy_perform(h);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (result != CURLE_OK) {
            PLEXWATCH_LOG_WARNING("CurlHttpClient", target + " failed after " + std::to_string(elapsed.count()) +
                                  "ms: " + curl_easy_strerror(result));
            return std::unexpected(map_curl_error(result));
        }

        HttpResponse response;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
        response.body = std::move(body);

        PLEXWATCH_LOG_DEBUG("CurlHttpClient", target + " -> " + std::to_string(response.status_code) +
                            " in " + std::to_string(elapsed.count()) + "ms");
        return response;
    }

protected:
    std::chrono::milliseconds write_timeout() const override { return m_config.default_timeout; }

private:
    HeaderList build_headers(const HttpRequest& request) const {
        curl_slist* list = nullptr;
        const auto add = [&list](const std::string& name, const std::string& value) {
            const auto line = name + ": " + value;
            list = curl_slist_append(list, line.c_str());
        };

        for (const auto& [name, value] : m_config.default_headers) {
            if (!request.headers.contains(name)) {
                add(name, value);
            }
        }
        for (const auto& [name, value] : request.headers) {
            add(name, value);
        }
        return HeaderList(list);
    }

    HttpClientConfig m_config;
};

} // namespace

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    if (!config.is_valid()) {
        PLEXWATCH_LOG_WARNING("CurlHttpClient", "Invalid HTTP client configuration, using defaults");
        return std::make_unique<CurlHttpClient>(HttpClientConfig{});
    }
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace plexwatch
