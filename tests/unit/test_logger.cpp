#include <gtest/gtest.h>
#include "plexwatch/utils/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace plexwatch::utils;

namespace {

class CapturingSink : public LogSink {
public:
    explicit CapturingSink(std::vector<LogMessage>& out) : m_out(out) {}
    void write(const LogMessage& message) override { m_out.push_back(message); }
    void flush() override {}

private:
    std::vector<LogMessage>& m_out;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(LoggerTest, DropsMessagesBelowLevel) {
    std::vector<LogMessage> captured;
    Logger logger(LogLevel::Warning);
    logger.add_sink(std::make_unique<CapturingSink>(captured));

    logger.debug("Test", "hidden");
    logger.info("Test", "hidden");
    logger.warning("Test", "shown");
    logger.error("Test", "shown too");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].m_level, LogLevel::Warning);
    EXPECT_EQ(captured[1].m_component, "Test");

    logger.set_level(LogLevel::None);
    logger.error("Test", "silenced");
    EXPECT_EQ(captured.size(), 2u);
}

TEST(LoggerTest, LineFormat) {
    LogMessage message{LogLevel::Error, std::chrono::system_clock::now(), "Scheduler", "boom"};
    const auto line = format_log_line(message);
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(line.find("] [ERROR] [Scheduler] boom"), std::string::npos);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(log_level_from_string("warn"), LogLevel::Warning);
    EXPECT_EQ(log_level_from_string(to_string(LogLevel::Debug)), LogLevel::Debug);
    EXPECT_FALSE(log_level_from_string("loud").has_value());
}

TEST(LoggerTest, FileSinkAppendsSessions) {
    const auto path = std::filesystem::temp_directory_path() / "plexwatch_logger_test" / "plexwatch.log";
    std::filesystem::remove_all(path.parent_path());

    for (int run = 0; run < 2; ++run) {
        FileSink sink(path);
        ASSERT_TRUE(sink.is_open());
        sink.write({LogLevel::Info, std::chrono::system_clock::now(), "Run", "run " + std::to_string(run)});
        sink.flush();
    }

    const auto content = read_file(path);
    std::size_t headers = 0;
    for (auto pos = content.find("=== Log session started"); pos != std::string::npos;
         pos = content.find("=== Log session started", pos + 1)) {
        ++headers;
    }
    EXPECT_EQ(headers, 2u);
    EXPECT_NE(content.find("[Run] run 0"), std::string::npos);
    EXPECT_NE(content.find("[Run] run 1"), std::string::npos);

    std::filesystem::remove_all(path.parent_path());
}
