#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plexwatch::utils {

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  None = 4
};

struct LogMessage {
  LogLevel m_level;
  std::chrono::system_clock::time_point m_timestamp;
  std::string m_component;
  std::string m_message;
};

// "[HH:MM:SS.mmm] [LEVEL] [component] message", local time
std::string format_log_line(const LogMessage& message);

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(const LogMessage& message) = 0;
  virtual void flush() = 0;
};

// Sinks are called under the logger's lock, one message at a time.
class Logger {
 public:
  explicit Logger(LogLevel min_level = LogLevel::Info);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level) { m_min_level.store(level); }
  [[nodiscard]] LogLevel level() const { return m_min_level.load(); }
  [[nodiscard]] bool enabled(LogLevel level) const {
    return level != LogLevel::None && level >= m_min_level.load();
  }

  void add_sink(std::unique_ptr<LogSink> sink);

  void log(LogLevel level, std::string_view component, std::string_view message);
  void debug(std::string_view component, std::string_view message) { log(LogLevel::Debug, component, message); }
  void info(std::string_view component, std::string_view message) { log(LogLevel::Info, component, message); }
  void warning(std::string_view component, std::string_view message) { log(LogLevel::Warning, component, message); }
  void error(std::string_view component, std::string_view message) { log(LogLevel::Error, component, message); }

  void flush();

 private:
  std::atomic<LogLevel> m_min_level;
  std::mutex m_mutex;
  std::vector<std::unique_ptr<LogSink>> m_sinks;
};

// Debug and info go to stdout, warnings and errors to stderr. Colour is
// used only when the target stream is a terminal.
class ConsoleSink : public LogSink {
 public:
  explicit ConsoleSink(bool use_colors = true);
  void write(const LogMessage& message) override;
  void flush() override;

 private:
  bool m_color_stdout;
  bool m_color_stderr;
};

// Appends to the file and marks each process start with a session header
class FileSink : public LogSink {
 public:
  explicit FileSink(const std::filesystem::path& path);

  void write(const LogMessage& message) override;
  void flush() override;
  [[nodiscard]] bool is_open() const { return m_file.is_open(); }

 private:
  std::ofstream m_file;
};

// Process-wide logger. Until set_instance() is called it logs info and
// above to the console.
class LoggerManager {
 public:
  static Logger& get_instance();
  static void set_instance(std::unique_ptr<Logger> logger);
};

std::string to_string(LogLevel level);

// Accepts the names written by to_string plus "warn"
std::optional<LogLevel> log_level_from_string(std::string_view name);

} // namespace plexwatch::utils

// The message expression is only evaluated when the level is enabled.
#define PLEXWATCH_LOG_AT(level, component, message)                        \
  do {                                                                     \
    auto& plexwatch_logger_ = plexwatch::utils::LoggerManager::get_instance(); \
    if (plexwatch_logger_.enabled(level)) {                                \
      plexwatch_logger_.log(level, component, message);                    \
    }                                                                      \
  } while (false)

#define PLEXWATCH_LOG_DEBUG(component, message) \
  PLEXWATCH_LOG_AT(plexwatch::utils::LogLevel::Debug, component, message)
#define PLEXWATCH_LOG_INFO(component, message) \
  PLEXWATCH_LOG_AT(plexwatch::utils::LogLevel::Info, component, message)
#define PLEXWATCH_LOG_WARNING(component, message) \
  PLEXWATCH_LOG_AT(plexwatch::utils::LogLevel::Warning, component, message)
#define PLEXWATCH_LOG_ERROR(component, message) \
  PLEXWATCH_LOG_AT(plexwatch::utils::LogLevel::Error, component, message)
