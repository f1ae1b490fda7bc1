#pragma once

#include "plexwatch/core/models.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace plexwatch::utils {

// Maps raw account names to display names. Read-only after construction.
class NameResolver {
public:
    NameResolver() = default;
    explicit NameResolver(std::unordered_map<std::string, std::string> mapping);

    // Loads a flat JSON object {"raw": "display", ...}
    static std::expected<NameResolver, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Exact, case-sensitive lookup; unmapped names come back unchanged
    [[nodiscard]] std::string resolve(const std::string& raw) const;

    [[nodiscard]] std::size_t size() const { return m_mapping.size(); }

private:
    std::unordered_map<std::string, std::string> m_mapping;
};

} // namespace plexwatch::utils
