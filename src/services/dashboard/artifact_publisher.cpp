#include "plexwatch/services/dashboard/artifact_publisher.hpp"
#include "plexwatch/utils/logger.hpp"

namespace plexwatch {
namespace services {

ArtifactPublisher::ArtifactPublisher(std::shared_ptr<ArtifactSink> sink)
    : m_sink(std::move(sink)) {
}

PublishResult ArtifactPublisher::publish(const RenderedDashboard& rendered,
                                         const core::PublishedArtifactState& state) {
    if (state.artifact_id && rendered.content_hash == state.last_content_hash) {
        PLEXWATCH_LOG_DEBUG("ArtifactPublisher", "Dashboard content unchanged, skipping write");
        return {state, PublishAction::Unchanged};
    }

    if (state.artifact_id) {
        auto result = m_sink->update(*state.artifact_id, rendered.body);
        if (result) {
            PLEXWATCH_LOG_DEBUG("ArtifactPublisher", "Dashboard message updated successfully");
            return {core::PublishedArtifactState{state.artifact_id, rendered.content_hash}, PublishAction::Updated};
        }

        if (result.error() == SinkError::NotFound) {
            PLEXWATCH_LOG_WARNING("ArtifactPublisher", "Dashboard message " + *state.artifact_id +
                                  " not found, a new one will be created");
            return {core::PublishedArtifactState{}, PublishAction::TargetMissing};
        }

        PLEXWATCH_LOG_ERROR("ArtifactPublisher", "Failed to update dashboard message: " + to_string(result.error()));
        return {state, PublishAction::Failed};
    }

    auto created = m_sink->create(rendered.body);
    if (!created) {
        PLEXWATCH_LOG_ERROR("ArtifactPublisher", "Failed to create dashboard message: " + to_string(created.error()));
        return {state, PublishAction::Failed};
    }

    PLEXWATCH_LOG_INFO("ArtifactPublisher", "New dashboard message created with ID: " + *created);
    return {core::PublishedArtifactState{*created, rendered.content_hash}, PublishAction::Created};
}

std::string to_string(PublishAction action) {
    switch (action) {
        case PublishAction::Unchanged: return "unchanged";
        case PublishAction::Updated: return "updated";
        case PublishAction::Created: return "created";
        case PublishAction::TargetMissing: return "target missing";
        case PublishAction::Failed: return "failed";
    }
    return "unknown";
}

} // namespace services
} // namespace plexwatch
