#include "common/envelope.hpp"
#include "common/framing.hpp"
#include "src/pylon/agent_adapter.h"
#include "src/pylon/pylon_app.h"
#include "src/pylon/ws_transport.h"
#include "src/relay/relay_config.h"
#include "src/relay/relay_server.h"

#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace {

using common::json;
using namespace std::chrono_literals;

// Plays a phone/browser Client over a real WebSocket.
class ClientEvents : public pylon::TransportEvents {
 public:
  void on_open() override { opened = true; }
  void on_message(std::string text) override { received.push_back(json::parse(text)); }
  void on_close() override { closed = true; }
  void on_error(const std::string&) override {}

  bool has(const std::string& type, const std::function<bool(const json&)>& pred = nullptr) const {
    for (const auto& m : received) {
      if (m["type"] == type && (!pred || pred(m))) return true;
    }
    return false;
  }

  bool opened = false;
  bool closed = false;
  std::vector<json> received;
};

bool run_until(boost::asio::io_context& io, const std::function<bool()>& done, std::chrono::milliseconds limit = 3000ms) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    io.restart();
    io.run_for(10ms);
  }
  return true;
}

} // namespace

int main() {
  namespace fs = std::filesystem;
  const fs::path root = fs::temp_directory_path() / "pylon_e2e_smoke";
  fs::remove_all(root);

  boost::asio::io_context io;
  relay::RelayServer server(io, relay::default_router_config());
  server.listen(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const uint16_t port = server.local_port();
  assert(port != 0);

  const auto url = pylon::parse_ws_url("ws://127.0.0.1:" + std::to_string(port) + "/");
  assert(url && url->host == "127.0.0.1" && url->port == port && url->target == "/");

  pylon::PylonOptions opts;
  opts.device_index = 1;
  opts.local_port = 0;
  opts.uploads_dir = root / "uploads";
  opts.relay = *url;
  pylon::PylonApp app(
      io, opts, [&io, u = *url] { return std::make_shared<pylon::WsTransport>(io, u); },
      std::make_unique<pylon::EchoAgent>(io));
  std::string err;
  assert(app.start(&err));

  assert(run_until(io, [&] { return app.relay().identity().has_value(); }));
  assert((*app.relay().identity())["name"] == "Device 1");
  assert(server.router().stats().pylons == 1);

  auto events = std::make_shared<ClientEvents>();
  auto client = std::make_shared<pylon::WsTransport>(io, *url);
  client->open(events);
  assert(run_until(io, [&] { return events->opened && events->has("connected"); }));

  // Bad JSON is answered and the connection survives.
  client->send("{nope");
  assert(run_until(io, [&] {
    return events->has("error", [](const json& m) { return common::payload_of(m)["error"] == "invalid_json"; });
  }));

  client->send(common::to_text(common::make_message("auth", json{{"role", "client"}, {"name", "phone"}})));
  assert(run_until(io, [&] {
    return events->has("auth_result", [](const json& m) { return common::payload_of(m)["success"] == true; });
  }));

  // Default route carries claude_send to the Pylon; the echo comes back addressed to us.
  client->send(common::to_text(common::make_message("claude_send", json{{"entityId", 5}, {"message", "over the wire"}})));
  assert(run_until(io, [&] {
    return events->has("claude_event", [](const json& m) {
      const auto& ev = common::payload_of(m)["event"];
      return ev.is_object() && ev.value("text", std::string()) == "echo: over the wire";
    });
  }));
  for (const auto& m : events->received) {
    if (m["type"] == "claude_event") assert(m["from"]["role"] == "pylon");
  }

  client->send(common::to_text(common::make_message("get_devices")));
  assert(run_until(io, [&] {
    return events->has("device_list", [](const json& m) { return common::payload_of(m)["devices"].size() == 2; });
  }));

  // A second Pylon on the same index is refused and dropped.
  {
    auto dup_events = std::make_shared<ClientEvents>();
    auto dup = std::make_shared<pylon::WsTransport>(io, *url);
    dup->open(dup_events);
    assert(run_until(io, [&] { return dup_events->opened; }));
    dup->send(common::to_text(common::make_message("auth", json{{"role", "pylon"}, {"deviceIndex", 1}})));
    assert(run_until(io, [&] { return dup_events->closed; }));
    assert(dup_events->has("auth_result", [](const json& m) {
      return common::payload_of(m)["error"] == "index_in_use";
    }));
  }

  // The client leaves; the relay frees its index.
  client->close();
  assert(run_until(io, [&] { return events->closed && server.router().stats().clients == 0; }));
  assert(!server.router().client_indices().is_assigned(0));

  app.stop();
  server.stop();
  assert(run_until(io, [&] { return server.session_count() == 0; }));

  fs::remove_all(root);
  return 0;
}
