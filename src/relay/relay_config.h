#pragma once

#include "common/json.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

constexpr uint16_t kDefaultPort = 8080;

// Pylon-to-default-destination rule for messages without `to` or `broadcast`.
enum class DefaultRoutePolicy {
  all_pylons,     // broadcast to every Pylon except the sender
  by_sender_role, // Pylon senders reach Clients, everyone else reaches Pylons
  drop,
};

std::string default_route_name(DefaultRoutePolicy policy);
std::optional<DefaultRoutePolicy> parse_default_route(std::string_view s);

// A fixed Pylon slot. "*" in allowed_ips admits any address.
struct DeviceSlot {
  int device_index = 0;
  std::string name;
  std::string icon;
  std::string label;
  std::vector<std::string> allowed_ips{"*"};
};

struct RouterConfig {
  std::map<int, DeviceSlot> devices;
  // Applies to Clients and to Pylon indices without a configured slot.
  std::vector<std::string> default_allowed_ips{"*"};
  DefaultRoutePolicy default_route = DefaultRoutePolicy::all_pylons;
  int env_id = 0;
};

struct RelayOptions {
  std::string bind_ip = "0.0.0.0";
  uint16_t port = kDefaultPort;
  RouterConfig router;
  bool show_help = false;
};

bool ip_allowed(const std::vector<std::string>& allow_list, std::string_view ip);

// Slots 1 and 2, open to any address.
RouterConfig default_router_config();

// {"devices": {"1": {...}}, "defaultAllowedIps": [...], "defaultRoute": "...", "envId": 0}
bool apply_device_catalog(const common::json& j, RouterConfig* cfg, std::string* out_error);
bool load_device_catalog(const std::string& path, RouterConfig* cfg, std::string* out_error);

// argv + PORT env. On failure returns nullopt and fills out_error.
// `port_env` is the PORT variable's value when set.
std::optional<RelayOptions> parse_relay_options(int argc,
                                                const char* const* argv,
                                                std::optional<std::string> port_env,
                                                std::string* out_error);

std::string relay_usage(std::string_view argv0);

} // namespace relay
