#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <expected>
#include <optional>

namespace plexwatch::utils {

// Lenient field access for payloads from the media servers and queue APIs.
// Lookups on missing, null or mistyped fields never throw.
class JsonHelper {
public:
    // Parse error text on failure
    static std::expected<nlohmann::json, std::string> safe_parse(const std::string& json_string);

    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& default_value);

    template<typename T>
    static std::optional<T> get_maybe(const nlohmann::json& json, const std::string& field);

    // SABnzbd and UptimeRobot send some numbers as strings ("12.5")
    static std::optional<double> get_number(const nlohmann::json& json, const std::string& field);

    static bool has_field(const nlohmann::json& json, const std::string& field);
    static bool has_array(const nlohmann::json& json, const std::string& field);

    template<typename Func>
    static void for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func);
};

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& default_value) {
    return get_maybe<T>(json, field).value_or(default_value);
}

template<typename T>
std::optional<T> JsonHelper::get_maybe(const nlohmann::json& json, const std::string& field) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    const auto it = json.find(field);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    try {
        return it->template get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

template<typename Func>
void JsonHelper::for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func) {
    if (has_array(json, field)) {
        for (const auto& element : json.at(field)) {
            func(element);
        }
    }
}

} // namespace plexwatch::utils
