#include "plexwatch/services/discord/discord_ipc.hpp"
#include "plexwatch/utils/logger.hpp"

#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <endian.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace plexwatch::services {

using Json = nlohmann::json;

namespace {

constexpr uint32_t RPC_VERSION = 1;
constexpr int MAX_SOCKET_INDEX = 10;
// Larger frames mean a desynchronized stream
constexpr uint32_t MAX_FRAME_SIZE = 64 * 1024;

enum class OpCode : uint32_t {
  HANDSHAKE = 0,
  FRAME = 1,
  CLOSE = 2,
  PING = 3,
  PONG = 4
};

}  // namespace

DiscordIPC::DiscordIPC(std::string client_id)
    : m_client_id(std::move(client_id)), m_connected(false) {
}

DiscordIPC::~DiscordIPC() {
  disconnect();
}

bool DiscordIPC::connect() {
  if (m_connected) {
    return true;
  }

  PLEXWATCH_LOG_DEBUG("DiscordIPC", "Attempting to connect to Discord");

  for (const auto& path : candidate_socket_paths()) {
    if (!connect_socket(path)) {
      continue;
    }

    m_connected = true;
    if (perform_handshake()) {
      PLEXWATCH_LOG_INFO("DiscordIPC", "Connected to Discord via " + path);
      return true;
    }

    PLEXWATCH_LOG_DEBUG("DiscordIPC", "Handshake failed on " + path + ", trying next socket");
    m_connected = false;
    close_socket();
  }

  PLEXWATCH_LOG_WARNING("DiscordIPC", "Failed to connect to any Discord socket. Is Discord running?");
  return false;
}

void DiscordIPC::disconnect() {
  if (!m_connected && m_socket < 0) {
    return;
  }

  PLEXWATCH_LOG_DEBUG("DiscordIPC", "Disconnecting from Discord");
  m_connected = false;
  close_socket();
}

bool DiscordIPC::is_connected() const {
  return m_connected;
}

bool DiscordIPC::send_activity(const Json& activity) {
  if (!m_connected) {
    return false;
  }

  const Json payload = {
      {"cmd", "SET_ACTIVITY"},
      {"nonce", next_nonce()},
      {"args", {{"pid", static_cast<uint32_t>(getpid())}, {"activity", activity}}}};

  return send_command(payload);
}

bool DiscordIPC::clear_activity() {
  if (!m_connected) {
    return false;
  }

  const Json payload = {
      {"cmd", "SET_ACTIVITY"},
      {"nonce", next_nonce()},
      {"args", {{"pid", static_cast<uint32_t>(getpid())}, {"activity", nullptr}}}};

  return send_command(payload);
}

std::vector<std::string> DiscordIPC::candidate_socket_paths() {
  std::vector<std::string> paths;

  std::string base;
  if (const char* runtime = std::getenv("XDG_RUNTIME_DIR")) {
    base = runtime;
  } else if (const char* tmp = std::getenv("TMPDIR")) {
    base = tmp;
  } else {
    base = "/tmp";
  }

  for (int i = 0; i < MAX_SOCKET_INDEX; ++i) {
    paths.push_back(base + "/discord-ipc-" + std::to_string(i));
  }

  // Snap and Flatpak builds keep the socket in their own runtime dir
  const std::string user_run = "/run/user/" + std::to_string(getuid());
  paths.push_back(user_run + "/snap.discord/discord-ipc-0");
  paths.push_back(user_run + "/app/com.discordapp.Discord/discord-ipc-0");

  return paths;
}

bool DiscordIPC::connect_socket(const std::string& path) {
  struct sockaddr_un addr {};
  if (path.length() >= sizeof(addr.sun_path)) {
    PLEXWATCH_LOG_DEBUG("DiscordIPC", "Socket path too long: " + path);
    return false;
  }

  m_socket = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (m_socket < 0) {
    PLEXWATCH_LOG_DEBUG("DiscordIPC", "Failed to create socket: " + std::string(std::strerror(errno)));
    return false;
  }

  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

  if (::connect(m_socket, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
    close_socket();
    return false;
  }

  // The loop must not hang on a wedged client
  struct timeval timeout {};
  timeout.tv_sec = 5;
  setsockopt(m_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
  setsockopt(m_socket, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
  return true;
}

void DiscordIPC::close_socket() {
  if (m_socket >= 0) {
    close(m_socket);
    m_socket = -1;
  }
}

bool DiscordIPC::write_data(const void* data, size_t size) const {
  size_t total_sent = 0;
  while (total_sent < size) {
    const ssize_t sent = send(m_socket, static_cast<const char*>(data) + total_sent,
                              size - total_sent, MSG_NOSIGNAL);
    if (sent <= 0) {
      PLEXWATCH_LOG_WARNING("DiscordIPC", "Failed to write to socket: " + std::string(std::strerror(errno)));
      return false;
    }
    total_sent += static_cast<size_t>(sent);
  }
  return true;
}

bool DiscordIPC::read_data(void* data, size_t size) const {
  size_t total_read = 0;
  while (total_read < size) {
    const ssize_t received = recv(m_socket, static_cast<char*>(data) + total_read, size - total_read, 0);
    if (received <= 0) {
      if (received < 0) {
        PLEXWATCH_LOG_WARNING("DiscordIPC", "Error reading from socket: " + std::string(std::strerror(errno)));
      } else {
        PLEXWATCH_LOG_WARNING("DiscordIPC", "Socket closed by Discord");
      }
      return false;
    }
    total_read += static_cast<size_t>(received);
  }
  return true;
}

bool DiscordIPC::write_frame(uint32_t opcode, const std::string& payload) {
  if (!m_connected) {
    return false;
  }

  const uint32_t header[2] = {htole32(opcode), htole32(static_cast<uint32_t>(payload.size()))};
  std::string frame(reinterpret_cast<const char*>(header), sizeof(header));
  frame += payload;

  if (!write_data(frame.data(), frame.size())) {
    m_connected = false;
    return false;
  }
  return true;
}

bool DiscordIPC::read_frame(uint32_t& opcode, std::string& data) {
  if (!m_connected) {
    return false;
  }

  uint32_t header[2];
  if (!read_data(header, sizeof(header))) {
    m_connected = false;
    return false;
  }

  opcode = le32toh(header[0]);
  const uint32_t length = le32toh(header[1]);
  if (length > MAX_FRAME_SIZE) {
    PLEXWATCH_LOG_ERROR("DiscordIPC", "Frame length " + std::to_string(length) + " exceeds limit");
    m_connected = false;
    return false;
  }

  data.assign(length, '\0');
  if (length > 0 && !read_data(data.data(), length)) {
    m_connected = false;
    return false;
  }
  return true;
}

bool DiscordIPC::read_reply(uint32_t& opcode, std::string& data) {
  while (read_frame(opcode, data)) {
    if (opcode == static_cast<uint32_t>(OpCode::PING)) {
      PLEXWATCH_LOG_DEBUG("DiscordIPC", "Answering ping");
      if (!write_frame(static_cast<uint32_t>(OpCode::PONG), data)) {
        return false;
      }
      continue;
    }
    if (opcode == static_cast<uint32_t>(OpCode::PONG)) {
      continue;
    }
    return true;
  }
  return false;
}

bool DiscordIPC::perform_handshake() {
  const Json handshake = {{"v", RPC_VERSION}, {"client_id", m_client_id}};

  if (!write_frame(static_cast<uint32_t>(OpCode::HANDSHAKE), handshake.dump())) {
    return false;
  }

  uint32_t opcode = 0;
  std::string response;
  if (!read_reply(opcode, response)) {
    return false;
  }

  if (opcode != static_cast<uint32_t>(OpCode::FRAME)) {
    PLEXWATCH_LOG_WARNING("DiscordIPC", "Unexpected handshake opcode: " + std::to_string(opcode) + " " + response);
    return false;
  }

  try {
    const auto json = Json::parse(response);
    return json.value("evt", "") == "READY";
  } catch (const Json::exception& e) {
    PLEXWATCH_LOG_WARNING("DiscordIPC", "Failed to parse handshake response: " + std::string(e.what()));
    return false;
  }
}

bool DiscordIPC::send_command(const Json& payload) {
  if (!write_frame(static_cast<uint32_t>(OpCode::FRAME), payload.dump())) {
    PLEXWATCH_LOG_WARNING("DiscordIPC", "Failed to send command, connection dropped");
    close_socket();
    return false;
  }

  uint32_t opcode = 0;
  std::string response;
  if (!read_reply(opcode, response)) {
    PLEXWATCH_LOG_WARNING("DiscordIPC", "No response to command, connection dropped");
    close_socket();
    return false;
  }

  if (opcode == static_cast<uint32_t>(OpCode::CLOSE)) {
    PLEXWATCH_LOG_WARNING("DiscordIPC", "Discord closed the connection: " + response);
    m_connected = false;
    close_socket();
    return false;
  }

  if (!response.empty()) {
    try {
      const auto json = Json::parse(response);
      if (json.value("evt", "") == "ERROR") {
        PLEXWATCH_LOG_ERROR("DiscordIPC", "Discord returned error: " + response);
        return false;
      }
    } catch (const Json::exception& e) {
      PLEXWATCH_LOG_WARNING("DiscordIPC", "Failed to parse response: " + std::string(e.what()));
    }
  }

  return true;
}

std::string DiscordIPC::next_nonce() {
  return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count());
}

}  // namespace plexwatch::services
