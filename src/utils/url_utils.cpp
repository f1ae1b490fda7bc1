#include "plexwatch/utils/url_utils.hpp"

namespace plexwatch::utils::url {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

    bool is_unreserved(unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_' || c == '.' || c == '~';
    }
}

std::string encode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX_DIGITS[c >> 4]);
            out.push_back(HEX_DIGITS[c & 0x0F]);
        }
    }
    return out;
}

std::string join(std::string_view base, std::string_view path) {
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    if (path.empty()) {
        return std::string(base);
    }
    std::string out(base);
    out += '/';
    out += path;
    return out;
}

std::string query(const QueryParams& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out += '&';
        }
        out += encode(key);
        out += '=';
        out += encode(value);
    }
    return out;
}

std::string with_query(std::string_view base, std::string_view path, const QueryParams& params) {
    auto out = join(base, path);
    if (!params.empty()) {
        out += '?';
        out += query(params);
    }
    return out;
}

bool is_http(std::string_view candidate) {
    for (std::string_view scheme : {"http://", "https://"}) {
        if (candidate.starts_with(scheme)) {
            return candidate.size() > scheme.size();
        }
    }
    return false;
}

std::string trim_trailing_slashes(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

} // namespace plexwatch::utils::url
