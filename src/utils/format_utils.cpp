#include "plexwatch/utils/format_utils.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace plexwatch::utils {

namespace {
    constexpr double KIB = 1024.0;
    constexpr double MIB = KIB * 1024.0;
    constexpr double GIB = MIB * 1024.0;

    std::string fixed2(double value) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << value;
        return oss.str();
    }
}

std::string format_duration(std::chrono::seconds duration) {
    return format_duration(duration, duration);
}

std::string format_duration(std::chrono::seconds value, std::chrono::seconds reference) {
    long long total_seconds = std::max<long long>(value.count(), 0);
    long long hours = total_seconds / 3600;
    long long minutes = (total_seconds % 3600) / 60;
    long long secs = total_seconds % 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (hours > 0 || reference >= std::chrono::hours(1)) {
        oss << hours << ":" << std::setw(2) << minutes << ":" << std::setw(2) << secs;
    } else {
        oss << std::setw(2) << minutes << ":" << std::setw(2) << secs;
    }
    return oss.str();
}

std::string format_percentage(double fraction) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

std::string format_progress_bar(double fraction, int cells) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    int filled = static_cast<int>(std::floor(fraction * cells));

    std::string bar;
    for (int i = 0; i < cells; ++i) {
        bar += i < filled ? "▓" : "░";
    }
    return bar + " " + format_percentage(fraction);
}

std::string format_count(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    int counter = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (counter > 0 && counter % 3 == 0) {
            result.push_back('.');
        }
        result.push_back(*it);
        ++counter;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::string format_bytes(std::uint64_t bytes) {
    const double value = static_cast<double>(bytes);
    if (value >= GIB) {
        return fixed2(value / GIB) + " GB";
    }
    return fixed2(value / MIB) + " MB";
}

std::string format_speed(double bytes_per_sec) {
    if (bytes_per_sec >= MIB) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << bytes_per_sec / MIB << " MB/s";
        return oss.str();
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << bytes_per_sec / KIB << " KB/s";
    return oss.str();
}

std::string format_uptime_length(std::chrono::seconds duration) {
    long long total = std::max<long long>(duration.count(), 0);
    long long days = total / 86400;
    long long hours = (total % 86400) / 3600;
    long long minutes = (total % 3600) / 60;

    if (days > 0) {
        return std::to_string(days) + "d " + std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    return std::to_string(minutes) + "m";
}

std::string replace_all(std::string text, std::string_view placeholder, std::string_view value) {
    if (placeholder.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
    return text;
}

std::string discord_timestamp(std::chrono::system_clock::time_point tp, char style) {
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    return "<t:" + std::to_string(epoch) + ":" + std::string(1, style) + ">";
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    const auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace plexwatch::utils
