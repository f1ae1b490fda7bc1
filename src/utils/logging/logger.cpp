#include "plexwatch/utils/logger.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace plexwatch::utils {

namespace {

std::tm to_local(std::chrono::system_clock::time_point tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm out{};
    localtime_r(&t, &out);
    return out;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None: break;
    }
    return "?";
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::None: break;
    }
    return "";
}

std::mutex g_instance_mutex;
std::unique_ptr<Logger> g_instance;

} // namespace

std::string format_log_line(const LogMessage& message) {
    const auto tm = to_local(message.m_timestamp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        message.m_timestamp.time_since_epoch()).count() % 1000;

    std::ostringstream out;
    out << '[' << std::put_time(&tm, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << "] "
        << '[' << level_tag(message.m_level) << "] "
        << '[' << message.m_component << "] " << message.m_message;
    return out.str();
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
    }
    return "info";
}

std::optional<LogLevel> log_level_from_string(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return std::nullopt;
}

Logger::Logger(LogLevel min_level) : m_min_level(min_level) {}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    const LogMessage entry{level, std::chrono::system_clock::now(), std::string(component), std::string(message)};

    std::lock_guard lock(m_mutex);
    for (const auto& sink : m_sinks) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard lock(m_mutex);
    for (const auto& sink : m_sinks) {
        sink->flush();
    }
}

ConsoleSink::ConsoleSink(bool use_colors)
    : m_color_stdout(use_colors && isatty(STDOUT_FILENO) != 0),
      m_color_stderr(use_colors && isatty(STDERR_FILENO) != 0) {}

void ConsoleSink::write(const LogMessage& message) {
    const bool to_stderr = message.m_level >= LogLevel::Warning;
    auto& stream = to_stderr ? std::cerr : std::cout;
    const bool color = to_stderr ? m_color_stderr : m_color_stdout;

    if (color) {
        stream << level_color(message.m_level) << format_log_line(message) << "\033[0m\n";
    } else {
        stream << format_log_line(message) << '\n';
    }
}

void ConsoleSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

FileSink::FileSink(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    m_file.open(path, std::ios::out | std::ios::app);
    if (m_file.is_open()) {
        const auto tm = to_local(std::chrono::system_clock::now());
        m_file << "\n=== Log session started at " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " ===\n";
        m_file.flush();
    }
}

void FileSink::write(const LogMessage& message) {
    if (m_file.is_open()) {
        m_file << format_log_line(message) << '\n';
    }
}

void FileSink::flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

Logger& LoggerManager::get_instance() {
    std::lock_guard lock(g_instance_mutex);
    if (!g_instance) {
        g_instance = std::make_unique<Logger>(LogLevel::Info);
        g_instance->add_sink(std::make_unique<ConsoleSink>());
    }
    return *g_instance;
}

void LoggerManager::set_instance(std::unique_ptr<Logger> logger) {
    std::lock_guard lock(g_instance_mutex);
    g_instance = std::move(logger);
}

} // namespace plexwatch::utils
