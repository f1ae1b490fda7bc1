#pragma once

#include "plexwatch/core/models.hpp"
#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace plexwatch::utils {

enum class ValidationError {
    MissingRequiredField,
    InvalidSection,
    InvalidKeyword,
    InvalidLength,
    InvalidInterval,
    InvalidRateLimit,
    InvalidServerUrl
};

// Errors make the configuration unusable; warnings are only logged
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::pair<ValidationError, std::string>> errors;
    std::vector<std::string> warnings;

    void add_error(ValidationError error, std::string message) {
        is_valid = false;
        errors.emplace_back(error, std::move(message));
    }

    void add_warning(std::string message) { warnings.push_back(std::move(message)); }

    void merge(ValidationResult other) {
        is_valid = is_valid && other.is_valid;
        std::move(other.errors.begin(), other.errors.end(), std::back_inserter(errors));
        std::move(other.warnings.begin(), other.warnings.end(), std::back_inserter(warnings));
    }

    // "first; second; ..."
    std::string get_error_summary() const {
        std::string summary;
        for (const auto& entry : errors) {
            summary += summary.empty() ? "" : "; ";
            summary += entry.second;
        }
        return summary;
    }
};

// Checks run once after load and again on every update()
class ConfigValidator {
public:
    static ValidationResult validate_discord_config(const core::DiscordConfig& config);
    static ValidationResult validate_scheduler_config(const core::SchedulerConfig& config);
    static ValidationResult validate_library_config(const core::LibraryConfig& config);
    static ValidationResult validate_title_config(const core::TitleConfig& config);
    static ValidationResult validate_presence_config(const core::PresenceConfig& config);
    static ValidationResult validate_source_urls(const core::ApplicationConfig& config);
    static ValidationResult validate_application_config(const core::ApplicationConfig& config);

    static bool is_valid_snowflake(const std::string& id);
};

} // namespace plexwatch::utils
