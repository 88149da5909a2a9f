#include "src/relay/relay_config.h"

#include "common/util.hpp"
#include "src/identity/device_id.h"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace relay {

using common::json;

std::string default_route_name(DefaultRoutePolicy policy) {
  switch (policy) {
    case DefaultRoutePolicy::all_pylons:
      return "all_pylons";
    case DefaultRoutePolicy::by_sender_role:
      return "by_sender_role";
    case DefaultRoutePolicy::drop:
      return "drop";
  }
  return "all_pylons";
}

std::optional<DefaultRoutePolicy> parse_default_route(std::string_view s) {
  if (s == "all_pylons") return DefaultRoutePolicy::all_pylons;
  if (s == "by_sender_role") return DefaultRoutePolicy::by_sender_role;
  if (s == "drop") return DefaultRoutePolicy::drop;
  return std::nullopt;
}

bool ip_allowed(const std::vector<std::string>& allow_list, std::string_view ip) {
  return std::any_of(allow_list.begin(), allow_list.end(), [&](const std::string& a) {
    return a == "*" || a == ip;
  });
}

RouterConfig default_router_config() {
  RouterConfig cfg;
  cfg.devices[1] = DeviceSlot{1, "Device 1", "\xF0\x9F\x8F\xA2", "office", {"*"}};
  cfg.devices[2] = DeviceSlot{2, "Device 2", "\xF0\x9F\x8F\xA0", "home", {"*"}};
  return cfg;
}

namespace {

bool read_ip_list(const json& j, std::vector<std::string>* out, std::string* out_error) {
  if (!j.is_array()) {
    if (out_error) *out_error = "allowedIps must be an array of strings";
    return false;
  }
  std::vector<std::string> ips;
  for (const auto& v : j) {
    if (!v.is_string()) {
      if (out_error) *out_error = "allowedIps must be an array of strings";
      return false;
    }
    ips.push_back(v.get<std::string>());
  }
  *out = std::move(ips);
  return true;
}

} // namespace

bool apply_device_catalog(const json& j, RouterConfig* cfg, std::string* out_error) {
  if (!cfg) return false;
  if (!j.is_object()) {
    if (out_error) *out_error = "device catalog is not an object";
    return false;
  }

  RouterConfig next = *cfg;
  if (j.contains("devices")) {
    const auto& devices = j["devices"];
    if (!devices.is_object()) {
      if (out_error) *out_error = "devices must be an object keyed by deviceIndex";
      return false;
    }
    next.devices.clear();
    for (const auto& [key, v] : devices.items()) {
      const auto index = common::parse_int(key);
      if (!index || !identity::is_valid_pylon_index(*index)) {
        if (out_error) *out_error = "invalid device slot: " + key;
        return false;
      }
      if (!v.is_object()) {
        if (out_error) *out_error = "device slot " + key + " is not an object";
        return false;
      }
      DeviceSlot slot;
      slot.device_index = static_cast<int>(*index);
      slot.name = v.value("name", "Device " + key);
      slot.icon = v.value("icon", std::string{});
      slot.label = v.value("label", std::string{});
      if (v.contains("allowedIps") && !read_ip_list(v["allowedIps"], &slot.allowed_ips, out_error)) {
        return false;
      }
      next.devices[slot.device_index] = std::move(slot);
    }
  }
  if (j.contains("defaultAllowedIps") &&
      !read_ip_list(j["defaultAllowedIps"], &next.default_allowed_ips, out_error)) {
    return false;
  }
  if (j.contains("defaultRoute")) {
    const auto policy = j["defaultRoute"].is_string()
                            ? parse_default_route(j["defaultRoute"].get<std::string>())
                            : std::nullopt;
    if (!policy) {
      if (out_error) *out_error = "defaultRoute must be all_pylons, by_sender_role or drop";
      return false;
    }
    next.default_route = *policy;
  }
  if (j.contains("envId")) {
    if (!j["envId"].is_number_integer() || j["envId"].get<int>() < 0 ||
        j["envId"].get<int>() > identity::kMaxEnvId) {
      if (out_error) *out_error = "envId must be 0..3";
      return false;
    }
    next.env_id = j["envId"].get<int>();
  }
  *cfg = std::move(next);
  return true;
}

bool load_device_catalog(const std::string& path, RouterConfig* cfg, std::string* out_error) {
  std::ifstream in(path);
  if (!in) {
    if (out_error) *out_error = "device catalog not found: " + path;
    return false;
  }
  json j;
  try {
    j = json::parse(in, nullptr, true, true);
  } catch (const std::exception& e) {
    if (out_error) *out_error = std::string("failed to parse device catalog: ") + e.what();
    return false;
  }
  return apply_device_catalog(j, cfg, out_error);
}

std::optional<RelayOptions> parse_relay_options(int argc,
                                                const char* const* argv,
                                                std::optional<std::string> port_env,
                                                std::string* out_error) {
  RelayOptions opts;
  opts.router = default_router_config();

  auto fail = [&](std::string msg) -> std::optional<RelayOptions> {
    if (out_error) *out_error = std::move(msg);
    return std::nullopt;
  };

  if (port_env) {
    const auto p = common::parse_port(*port_env);
    if (!p) return fail("invalid PORT: " + *port_env);
    opts.port = *p;
  }

  std::optional<std::string> catalog_path;
  std::optional<std::string> route_override;
  std::optional<std::string> env_override;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    bool missing = false;
    auto need_val = [&](std::initializer_list<const char*> flags) -> std::optional<std::string> {
      if (std::none_of(flags.begin(), flags.end(), [&](const char* f) { return a == f; })) {
        return std::nullopt;
      }
      if (i + 1 >= argc) {
        missing = true;
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (a == "--help" || a == "-h") {
      opts.show_help = true;
      continue;
    }
    if (a.rfind("--port=", 0) == 0) {
      const auto p = common::parse_port(std::string_view(a).substr(7));
      if (!p) return fail("invalid port: " + a.substr(7));
      opts.port = *p;
      continue;
    }
    if (auto v = need_val({"--port", "-p"})) {
      const auto p = common::parse_port(*v);
      if (!p) return fail("invalid port: " + *v);
      opts.port = *p;
      continue;
    }
    if (auto v = need_val({"--bind"})) {
      opts.bind_ip = *v;
      continue;
    }
    if (auto v = need_val({"--devices"})) {
      catalog_path = *v;
      continue;
    }
    if (auto v = need_val({"--default-route"})) {
      route_override = *v;
      continue;
    }
    if (auto v = need_val({"--env"})) {
      env_override = *v;
      continue;
    }
    if (missing) return fail("missing value for " + a);
    return fail("unknown arg: " + a);
  }

  if (catalog_path && !load_device_catalog(*catalog_path, &opts.router, out_error)) return std::nullopt;
  if (route_override) {
    const auto policy = parse_default_route(*route_override);
    if (!policy) return fail("invalid --default-route: " + *route_override);
    opts.router.default_route = *policy;
  }
  if (env_override) {
    const auto env = common::parse_int(*env_override);
    if (!env || *env < 0 || *env > identity::kMaxEnvId) return fail("invalid --env: " + *env_override);
    opts.router.env_id = static_cast<int>(*env);
  }
  return opts;
}

std::string relay_usage(std::string_view argv0) {
  std::ostringstream oss;
  oss << "Usage: " << argv0
      << " [--bind <ip>] [--port <n> | -p <n> | --port=<n>] [--devices <catalog.json>]"
         " [--default-route all_pylons|by_sender_role|drop] [--env <0-3>]\n"
      << "PORT environment variable sets the port when --port is absent (default "
      << kDefaultPort << ").\n";
  return oss.str();
}

} // namespace relay
