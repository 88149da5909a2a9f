#pragma once

#include "src/pylon/local_server.h"
#include "src/pylon/ws_transport.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pylon {

constexpr const char* kDefaultRelayUrl = "ws://127.0.0.1:8080";

struct PylonOptions {
  std::string relay_url = kDefaultRelayUrl;
  WsUrl relay;
  int device_index = 0;
  int env_id = 0;
  std::string name;
  uint16_t local_port = kDefaultLocalPort;
  std::filesystem::path uploads_dir = "uploads";
  std::optional<std::filesystem::path> packet_log_dir;
  std::chrono::milliseconds heartbeat_interval{10000};
  std::chrono::milliseconds heartbeat_timeout{30000};
  std::chrono::milliseconds reconnect_interval{3000};
  bool show_help = false;
};

// Environment fallbacks, read once by main.
struct PylonEnv {
  std::optional<std::string> relay_url;   // RELAY_URL
  std::optional<std::string> index;       // PYLON_INDEX
  std::optional<std::string> env_id;      // ENV_ID
  std::optional<std::string> uploads_dir; // UPLOADS_DIR

  static PylonEnv from_process();
};

// argv wins over the environment. --index (or PYLON_INDEX) is required unless
// --help is given.
std::optional<PylonOptions> parse_pylon_options(int argc,
                                                const char* const* argv,
                                                const PylonEnv& env,
                                                std::string* out_error);

std::string pylon_usage(std::string_view argv0);

} // namespace pylon
