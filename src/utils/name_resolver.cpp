#include "plexwatch/utils/name_resolver.hpp"
#include "plexwatch/utils/json_helper.hpp"
#include "plexwatch/utils/logger.hpp"

#include <fstream>
#include <sstream>

namespace plexwatch::utils {

NameResolver::NameResolver(std::unordered_map<std::string, std::string> mapping)
    : m_mapping(std::move(mapping)) {}

std::expected<NameResolver, core::ConfigError>
NameResolver::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        PLEXWATCH_LOG_WARNING("NameResolver", "User mapping not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    std::ifstream file(path);
    if (!file) {
        PLEXWATCH_LOG_ERROR("NameResolver", "Cannot open user mapping: " + path.string());
        return std::unexpected(core::ConfigError::PermissionDenied);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = JsonHelper::safe_parse(buffer.str());
    if (!parsed) {
        PLEXWATCH_LOG_ERROR("NameResolver", "Invalid user mapping: " + parsed.error());
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
    if (!parsed->is_object()) {
        PLEXWATCH_LOG_ERROR("NameResolver", "User mapping must be a JSON object");
        return std::unexpected(core::ConfigError::InvalidFormat);
    }

    std::unordered_map<std::string, std::string> mapping;
    for (const auto& [raw, display] : parsed->items()) {
        if (!display.is_string()) {
            PLEXWATCH_LOG_WARNING("NameResolver", "Skipping non-string mapping for: " + raw);
            continue;
        }
        mapping.emplace(raw, display.get<std::string>());
    }

    PLEXWATCH_LOG_INFO("NameResolver", "Loaded " + std::to_string(mapping.size()) + " user mappings");
    return NameResolver(std::move(mapping));
}

std::string NameResolver::resolve(const std::string& raw) const {
    auto it = m_mapping.find(raw);
    return it != m_mapping.end() ? it->second : raw;
}

} // namespace plexwatch::utils
