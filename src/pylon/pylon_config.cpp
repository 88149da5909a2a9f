#include "src/pylon/pylon_config.h"

#include "common/util.hpp"
#include "src/identity/device_id.h"

#include <algorithm>
#include <initializer_list>
#include <sstream>

namespace pylon {

PylonEnv PylonEnv::from_process() {
  PylonEnv env;
  env.relay_url = common::env_var("RELAY_URL");
  env.index = common::env_var("PYLON_INDEX");
  env.env_id = common::env_var("ENV_ID");
  env.uploads_dir = common::env_var("UPLOADS_DIR");
  return env;
}

std::optional<PylonOptions> parse_pylon_options(int argc,
                                                const char* const* argv,
                                                const PylonEnv& env,
                                                std::string* out_error) {
  PylonOptions opts;

  auto fail = [&](std::string msg) -> std::optional<PylonOptions> {
    if (out_error) *out_error = std::move(msg);
    return std::nullopt;
  };
  auto millis = [](const std::string& v) -> std::optional<std::chrono::milliseconds> {
    const auto n = common::parse_int(v);
    if (!n || *n <= 0) return std::nullopt;
    return std::chrono::milliseconds(*n);
  };

  std::optional<std::string> relay_url = env.relay_url;
  std::optional<std::string> index = env.index;
  std::optional<std::string> env_id = env.env_id;
  if (env.uploads_dir) opts.uploads_dir = *env.uploads_dir;

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
    if (auto v = need_val({"--relay"})) {
      relay_url = *v;
      continue;
    }
    if (auto v = need_val({"--index"})) {
      index = *v;
      continue;
    }
    if (auto v = need_val({"--env"})) {
      env_id = *v;
      continue;
    }
    if (auto v = need_val({"--name"})) {
      opts.name = *v;
      continue;
    }
    if (auto v = need_val({"--local-port"})) {
      const auto p = common::parse_port(*v);
      if (!p) return fail("invalid --local-port: " + *v);
      opts.local_port = *p;
      continue;
    }
    if (auto v = need_val({"--uploads"})) {
      opts.uploads_dir = *v;
      continue;
    }
    if (auto v = need_val({"--packet-log"})) {
      opts.packet_log_dir = std::filesystem::path(*v);
      continue;
    }
    if (auto v = need_val({"--heartbeat-ms"})) {
      const auto ms = millis(*v);
      if (!ms) return fail("invalid --heartbeat-ms: " + *v);
      opts.heartbeat_interval = *ms;
      continue;
    }
    if (auto v = need_val({"--heartbeat-timeout-ms"})) {
      const auto ms = millis(*v);
      if (!ms) return fail("invalid --heartbeat-timeout-ms: " + *v);
      opts.heartbeat_timeout = *ms;
      continue;
    }
    if (auto v = need_val({"--reconnect-ms"})) {
      const auto ms = millis(*v);
      if (!ms) return fail("invalid --reconnect-ms: " + *v);
      opts.reconnect_interval = *ms;
      continue;
    }
    if (missing) return fail("missing value for " + a);
    return fail("unknown arg: " + a);
  }

  if (opts.show_help) return opts;

  if (relay_url) opts.relay_url = *relay_url;
  const auto url = parse_ws_url(opts.relay_url);
  if (!url) return fail("invalid relay url: " + opts.relay_url);
  opts.relay = *url;

  if (!index) return fail("--index is required (or set PYLON_INDEX)");
  const auto n = common::parse_int(*index);
  if (!n || !identity::is_valid_pylon_index(*n)) return fail("invalid pylon index (1-15): " + *index);
  opts.device_index = static_cast<int>(*n);

  if (env_id) {
    const auto e = common::parse_int(*env_id);
    if (!e || *e < 0 || *e > identity::kMaxEnvId) return fail("invalid env id (0-3): " + *env_id);
    opts.env_id = static_cast<int>(*e);
  }

  if (opts.heartbeat_timeout <= opts.heartbeat_interval) {
    return fail("--heartbeat-timeout-ms must exceed --heartbeat-ms");
  }
  return opts;
}

std::string pylon_usage(std::string_view argv0) {
  std::ostringstream oss;
  oss << "Usage: " << argv0
      << " --index <1-15> [--relay ws://host:port[/path]] [--env <0-3>] [--name <name>]\n"
         "       [--local-port <n>] [--uploads <dir>] [--packet-log <dir>]\n"
         "       [--heartbeat-ms <n>] [--heartbeat-timeout-ms <n>] [--reconnect-ms <n>]\n"
      << "Environment: RELAY_URL (default " << kDefaultRelayUrl << "), PYLON_INDEX, ENV_ID, UPLOADS_DIR.\n"
      << "Local server listens on 127.0.0.1:" << kDefaultLocalPort << " unless --local-port is given.\n";
  return oss.str();
}

} // namespace pylon
