#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace plexwatch::utils {

/**
 * @brief Format a playback position as MM:SS, or H:MM:SS from one hour up
 */
std::string format_duration(std::chrono::seconds duration);

/**
 * @brief Same, with the layout picked by @p reference instead of @p value
 *
 * Keeps an elapsed time in the shape of its total: (5 min, 2 h) -> "0:05:00".
 */
std::string format_duration(std::chrono::seconds value, std::chrono::seconds reference);

/**
 * @brief Format a fraction in [0,1] as a percentage with one decimal ("42.9%")
 */
std::string format_percentage(double fraction);

/**
 * @brief Ten-cell bar of filled and empty blocks followed by the percentage
 */
std::string format_progress_bar(double fraction, int cells = 10);

/**
 * @brief Group thousands with '.' (1234567 -> "1.234.567")
 */
std::string format_count(std::uint64_t value);

/**
 * @brief Human readable byte size with two decimals, in MB below 1 GB
 */
std::string format_bytes(std::uint64_t bytes);

/**
 * @brief Transfer rate, e.g. "12.4 MB/s"
 */
std::string format_speed(double bytes_per_sec);

/**
 * @brief Compact uptime length ("3d 4h 12m", "23h 59m", "5m")
 */
std::string format_uptime_length(std::chrono::seconds duration);

/**
 * @brief Replace every occurrence of a placeholder
 */
std::string replace_all(std::string text, std::string_view placeholder, std::string_view value);

/**
 * @brief Discord timestamp markup rendered client side, e.g. "<t:1700000000:R>"
 */
std::string discord_timestamp(std::chrono::system_clock::time_point tp, char style = 'R');

/**
 * @brief ISO-8601 UTC timestamp with a trailing 'Z'
 */
std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace plexwatch::utils
