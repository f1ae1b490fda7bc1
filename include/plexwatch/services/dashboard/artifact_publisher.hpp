#pragma once

#include "plexwatch/core/models.hpp"
#include "plexwatch/services/dashboard/artifact_sink.hpp"
#include "plexwatch/services/dashboard/dashboard_renderer.hpp"
#include <memory>

namespace plexwatch {
namespace services {

enum class PublishAction {
    Unchanged,
    Updated,
    Created,
    TargetMissing,
    Failed
};

struct PublishResult {
    core::PublishedArtifactState state;
    PublishAction action = PublishAction::Unchanged;
};

/**
 * @brief Writes a rendered dashboard only when its hash changed
 *
 * The state is threaded through explicitly: the caller passes the last
 * state and persists the returned one. A failed write returns the previous
 * state unchanged. NotFound on update clears the artifact id so the next
 * publish creates a new artifact.
 */
class ArtifactPublisher {
public:
    explicit ArtifactPublisher(std::shared_ptr<ArtifactSink> sink);

    PublishResult publish(const RenderedDashboard& rendered, const core::PublishedArtifactState& state);

private:
    std::shared_ptr<ArtifactSink> m_sink;
};

std::string to_string(PublishAction action);

} // namespace services
} // namespace plexwatch
