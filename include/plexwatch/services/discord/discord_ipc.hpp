#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace plexwatch::services {

// Client side of the Discord desktop RPC socket
class DiscordIPC {
 public:
  explicit DiscordIPC(std::string client_id);
  ~DiscordIPC();

  DiscordIPC(const DiscordIPC&) = delete;
  DiscordIPC& operator=(const DiscordIPC&) = delete;

  bool connect();
  void disconnect();
  [[nodiscard]] bool is_connected() const;

  // SET_ACTIVITY; a failed exchange drops the connection
  bool send_activity(const nlohmann::json& activity);
  bool clear_activity();

  // Socket paths tried by connect(), in order
  static std::vector<std::string> candidate_socket_paths();

 private:
  std::string m_client_id;
  std::atomic<bool> m_connected;
  int m_socket = -1;

  bool connect_socket(const std::string& path);
  void close_socket();
  bool write_data(const void* data, size_t size) const;
  bool read_data(void* data, size_t size) const;

  bool write_frame(uint32_t opcode, const std::string& payload);
  bool read_frame(uint32_t& opcode, std::string& data);
  // Next frame that is not a keepalive; pings are answered on the way
  bool read_reply(uint32_t& opcode, std::string& data);
  bool perform_handshake();
  bool send_command(const nlohmann::json& payload);

  static std::string next_nonce();
};

} // namespace plexwatch::services
