#include "plexwatch/services/dashboard/artifact_state_store.hpp"
#include "plexwatch/utils/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace plexwatch {
namespace services {

ArtifactStateStore::ArtifactStateStore(std::filesystem::path path)
    : m_path(path.empty() ? get_default_path() : std::move(path)) {
}

core::PublishedArtifactState ArtifactStateStore::load() const {
    core::PublishedArtifactState state;

    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        PLEXWATCH_LOG_DEBUG("ArtifactStateStore", "State file does not exist, starting fresh");
        return state;
    }

    try {
        YAML::Node node = YAML::LoadFile(m_path.string());
        if (node["artifact_id"] && !node["artifact_id"].IsNull()) {
            auto id = node["artifact_id"].as<std::string>();
            if (!id.empty()) {
                state.artifact_id = id;
            }
        }
        if (node["last_content_hash"]) {
            state.last_content_hash = node["last_content_hash"].as<std::string>();
        }
        PLEXWATCH_LOG_DEBUG("ArtifactStateStore", "Loaded dashboard state from " + m_path.string());
    } catch (const YAML::Exception& e) {
        PLEXWATCH_LOG_WARNING("ArtifactStateStore", "Ignoring unreadable state file: " + std::string(e.what()));
        return core::PublishedArtifactState{};
    }

    return state;
}

std::expected<void, core::StorageError> ArtifactStateStore::save(const core::PublishedArtifactState& state) const {
    std::error_code ec;
    const auto dir = m_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            PLEXWATCH_LOG_ERROR("ArtifactStateStore", "Failed to create state directory: " + ec.message());
            return std::unexpected(core::StorageError::PermissionDenied);
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "artifact_id" << YAML::Value;
    if (state.artifact_id) {
        // Snowflake ids are quoted so they never read back as numbers
        out << YAML::DoubleQuoted << *state.artifact_id;
    } else {
        out << YAML::Null;
    }
    out << YAML::Key << "last_content_hash" << YAML::Value << state.last_content_hash;
    out << YAML::EndMap;

    auto temp_path = m_path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            PLEXWATCH_LOG_ERROR("ArtifactStateStore", "Failed to open state file for writing: " + temp_path.string());
            return std::unexpected(core::StorageError::PermissionDenied);
        }
        file << out.c_str() << "\n";
        file.flush();
        if (!file) {
            PLEXWATCH_LOG_ERROR("ArtifactStateStore", "Failed to write state file");
            std::filesystem::remove(temp_path, ec);
            return std::unexpected(core::StorageError::IoError);
        }
    }

    std::filesystem::rename(temp_path, m_path, ec);
    if (ec) {
        PLEXWATCH_LOG_ERROR("ArtifactStateStore", "Failed to replace state file: " + ec.message());
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return std::unexpected(core::StorageError::IoError);
    }

    PLEXWATCH_LOG_DEBUG("ArtifactStateStore", "Saved dashboard state");
    return {};
}

std::filesystem::path ArtifactStateStore::get_default_path() {
    std::filesystem::path state_dir;
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        state_dir = std::filesystem::path(xdg_config) / "plexwatch";
    } else if (const char* home = std::getenv("HOME")) {
        state_dir = std::filesystem::path(home) / ".config" / "plexwatch";
    } else {
        state_dir = std::filesystem::current_path();
    }
    return state_dir / "state.yaml";
}

} // namespace services
} // namespace plexwatch
