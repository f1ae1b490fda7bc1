#include <gtest/gtest.h>
#include "plexwatch/services/discord/discord_ipc.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <endian.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

using plexwatch::services::DiscordIPC;

namespace {

struct Frame {
    uint32_t opcode = 0;
    std::string payload;
};

bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool recv_all(int fd, void* out, size_t size) {
    size_t got = 0;
    while (got < size) {
        const ssize_t n = recv(fd, static_cast<char*>(out) + got, size - got, 0);
        if (n <= 0) {
            return false;
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

bool write_frame(int fd, uint32_t opcode, const std::string& payload) {
    const uint32_t header[2] = {htole32(opcode), htole32(static_cast<uint32_t>(payload.size()))};
    std::string frame(reinterpret_cast<const char*>(header), sizeof(header));
    frame += payload;
    return send_all(fd, frame);
}

std::optional<Frame> read_frame(int fd) {
    uint32_t header[2];
    if (!recv_all(fd, header, sizeof(header))) {
        return std::nullopt;
    }
    Frame frame;
    frame.opcode = le32toh(header[0]);
    frame.payload.assign(le32toh(header[1]), '\0');
    if (!frame.payload.empty() && !recv_all(fd, frame.payload.data(), frame.payload.size())) {
        return std::nullopt;
    }
    return frame;
}

// Listens on <dir>/discord-ipc-0 and plays the Discord side of one session.
// Every reply is preceded by a ping the client has to answer.
class FakeDiscord {
public:
    explicit FakeDiscord(const std::filesystem::path& dir) {
        std::filesystem::create_directories(dir);
        const auto path = (dir / "discord-ipc-0").string();
        std::filesystem::remove(path);

        m_listener = socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        bind(m_listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(m_listener, 1);

        timeval timeout{};
        timeout.tv_sec = 3;
        setsockopt(m_listener, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        m_thread = std::thread([this] { serve(); });
    }

    ~FakeDiscord() {
        if (m_thread.joinable()) {
            m_thread.join();
        }
        close(m_listener);
    }

    void join() { m_thread.join(); }

    std::vector<Frame> received;

private:
    void serve() {
        const int client = accept(m_listener, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        timeval timeout{};
        timeout.tv_sec = 3;
        setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        const nlohmann::json ready = {{"cmd", "DISPATCH"}, {"evt", "READY"}};
        const nlohmann::json ack = {{"cmd", "SET_ACTIVITY"}, {"evt", nullptr}};
        const std::string replies[] = {ready.dump(), ack.dump()};

        for (int exchange = 0; exchange < 2; ++exchange) {
            auto request = read_frame(client);
            if (!request) {
                break;
            }
            received.push_back(*request);

            const std::string token = "keepalive-" + std::to_string(exchange);
            write_frame(client, 3, token);
            auto pong = read_frame(client);
            if (!pong) {
                break;
            }
            received.push_back(*pong);

            write_frame(client, 1, replies[exchange]);
        }
        close(client);
    }

    int m_listener = -1;
    std::thread m_thread;
};

class DiscordIPCTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / ("plexwatch_ipc_" + std::to_string(getpid()));
        if (const char* previous = std::getenv("XDG_RUNTIME_DIR")) {
            saved_runtime_dir = previous;
        }
        setenv("XDG_RUNTIME_DIR", dir.c_str(), 1);
    }

    void TearDown() override {
        if (saved_runtime_dir) {
            setenv("XDG_RUNTIME_DIR", saved_runtime_dir->c_str(), 1);
        } else {
            unsetenv("XDG_RUNTIME_DIR");
        }
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
    std::optional<std::string> saved_runtime_dir;
};

} // namespace

TEST_F(DiscordIPCTest, PingsAreAnsweredAndNotTakenAsReplies) {
    FakeDiscord discord(dir);
    DiscordIPC ipc("123456789");

    ASSERT_TRUE(ipc.connect());
    EXPECT_TRUE(ipc.send_activity({{"details", "Watching"}}));
    ipc.disconnect();
    discord.join();

    ASSERT_EQ(discord.received.size(), 4u);
    EXPECT_EQ(discord.received[0].opcode, 0u);
    EXPECT_EQ(discord.received[1].opcode, 4u);
    EXPECT_EQ(discord.received[1].payload, "keepalive-0");

    const auto command = nlohmann::json::parse(discord.received[2].payload);
    EXPECT_EQ(discord.received[2].opcode, 1u);
    EXPECT_EQ(command["cmd"], "SET_ACTIVITY");
    EXPECT_EQ(command["args"]["activity"]["details"], "Watching");

    EXPECT_EQ(discord.received[3].opcode, 4u);
    EXPECT_EQ(discord.received[3].payload, "keepalive-1");
}
