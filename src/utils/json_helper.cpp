#include "plexwatch/utils/json_helper.hpp"

#include <charconv>

namespace plexwatch::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(const std::string& json_string) {
    if (json_string.empty()) {
        return std::unexpected("Empty JSON string");
    }

    // Servers behind a proxy sometimes answer with an HTML error page
    if (json_string[0] == '<') {
        return std::unexpected("Response appears to be XML/HTML, not JSON");
    }

    try {
        return nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

std::optional<double> JsonHelper::get_number(const nlohmann::json& json, const std::string& field) {
    if (!has_field(json, field)) {
        return std::nullopt;
    }

    const auto& value = json[field];
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        double parsed = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc{} && ptr != text.data()) {
            return parsed;
        }
    }
    return std::nullopt;
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json[field].is_null();
}

bool JsonHelper::has_array(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && json[field].is_array() && !json[field].empty();
}

} // namespace plexwatch::utils
