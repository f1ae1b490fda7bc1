#pragma once

#include "plexwatch/core/models.hpp"
#include <expected>
#include <filesystem>

namespace plexwatch {
namespace services {

// Persists the published message id and content hash across restarts
class ArtifactStateStore {
public:
    explicit ArtifactStateStore(std::filesystem::path path);

    // A missing or unreadable file yields an empty state
    core::PublishedArtifactState load() const;

    // Written to a temporary file first, then renamed over the old one
    std::expected<void, core::StorageError> save(const core::PublishedArtifactState& state) const;

    const std::filesystem::path& path() const { return m_path; }

    static std::filesystem::path get_default_path();

private:
    std::filesystem::path m_path;
};

} // namespace services
} // namespace plexwatch
