#include "common/envelope.hpp"
#include "src/relay/router.h"

#include <cassert>
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace {

using common::json;

class RecordingOutbox : public relay::Outbox {
 public:
  void deliver(const relay::ConnectionId& to, const json& msg) override { inbox[to].push_back(msg); }
  void close(const relay::ConnectionId& id) override { closed.insert(id); }

  std::vector<json> take(const relay::ConnectionId& id) {
    auto out = std::move(inbox[id]);
    inbox[id].clear();
    return out;
  }

  std::vector<json> of_type(const relay::ConnectionId& id, const std::string& type) {
    std::vector<json> out;
    for (const auto& m : take(id)) {
      if (common::message_type(m) == type) out.push_back(m);
    }
    return out;
  }

  std::map<relay::ConnectionId, std::vector<json>> inbox;
  std::set<relay::ConnectionId> closed;
};

json auth(const std::string& role, json index = nullptr, const std::string& name = "") {
  json p;
  p["role"] = role;
  if (!index.is_null()) p["deviceIndex"] = index;
  if (!name.empty()) p["name"] = name;
  return common::make_message("auth", p);
}

relay::ConnectionId join(relay::Router& r, RecordingOutbox& out, const std::string& ip, const json& auth_msg) {
  const auto id = r.on_connect(ip);
  assert(id);
  r.handle_message(*id, auth_msg.dump());
  out.take(*id);
  return *id;
}

std::string auth_error(RecordingOutbox& out, const relay::ConnectionId& id) {
  const auto results = out.of_type(id, "auth_result");
  assert(results.size() == 1);
  const auto& p = common::payload_of(results[0]);
  assert(p["success"] == false);
  return p["error"].get<std::string>();
}

} // namespace

int main() {
  relay::RouterConfig cfg = relay::default_router_config();
  cfg.devices[3] = relay::DeviceSlot{3, "Locked", "", "lab", {"10.0.0.9"}};

  RecordingOutbox out;
  relay::Router router(cfg, out);

  // Connect greets with a connection id.
  const auto a = router.on_connect("127.0.0.1");
  assert(a);
  {
    const auto greet = out.take(*a);
    assert(greet.size() == 1);
    assert(greet[0]["type"] == "connected");
    assert(common::payload_of(greet[0])["connectionId"] == *a);
  }

  // Unauthenticated traffic is refused, bad JSON survives.
  router.handle_message(*a, R"({"type":"claude_send","payload":{}})");
  assert(common::payload_of(out.take(*a).at(0))["error"] == "not_authenticated");
  router.handle_message(*a, "{not json");
  assert(common::payload_of(out.take(*a).at(0))["error"] == "invalid_json");
  router.handle_message(*a, R"({"payload":{}})");
  assert(common::payload_of(out.take(*a).at(0))["error"] == "missing_type");
  assert(router.connection(*a) != nullptr);

  // Pylon auth errors.
  router.handle_message(*a, auth("pylon").dump());
  assert(auth_error(out, *a) == "index_required");
  assert(out.closed.count(*a) == 1);
  router.handle_message(*a, auth("pylon", 0).dump());
  assert(auth_error(out, *a) == "index_out_of_range");
  router.handle_message(*a, auth("pylon", 16).dump());
  assert(auth_error(out, *a) == "index_out_of_range");
  router.handle_message(*a, auth("pylon", 3).dump());
  assert(auth_error(out, *a) == "ip_denied");
  router.handle_message(*a, auth("robot", 1).dump());
  assert(auth_error(out, *a) == "invalid_role");
  assert(!router.connection(*a)->authenticated());
  router.on_disconnect(*a);
  assert(router.connection(*a) == nullptr);

  // Two Pylons, second claim on the same index fails.
  const auto p1 = join(router, out, "127.0.0.1", auth("pylon", 1));
  const auto p2 = join(router, out, "127.0.0.1", auth("pylon", "2"));
  assert(router.connection(p1)->identity->name == "Device 1");
  assert(router.connection(p2)->identity->label == "home");
  {
    const auto dup = router.on_connect("127.0.0.1");
    router.handle_message(*dup, auth("pylon", 1).dump());
    assert(auth_error(out, *dup) == "index_in_use");
    router.on_disconnect(*dup);
  }
  // Slot 3 admits its configured address.
  const auto p3 = join(router, out, "10.0.0.9", auth("pylon", 3));
  assert(router.connection(p3)->identity->name == "Locked");

  // Clients get the smallest free index.
  const auto c0 = join(router, out, "127.0.0.1", auth("client", nullptr, "phone"));
  const auto c1 = join(router, out, "127.0.0.1", auth("client"));
  assert(router.connection(c0)->identity->device_index == 0);
  assert(router.connection(c0)->identity->name == "phone");
  assert(router.connection(c1)->identity->device_index == 1);
  assert(router.connection(c1)->identity->name == "Client 1");
  assert(router.stats().pylons == 3);
  assert(router.stats().clients == 2);
  out.inbox.clear();

  // Default route: untargeted client traffic reaches every Pylon.
  router.handle_message(c0, R"({"type":"claude_send","payload":{"entityId":1,"message":"hi"}})");
  for (const auto& p : {p1, p2, p3}) {
    const auto got = out.of_type(p, "claude_send");
    assert(got.size() == 1);
    assert(got[0]["from"]["deviceIndex"] == 0);
    assert(got[0]["from"]["role"] == "client");
    assert(got[0]["from"]["deviceId"] == 16);
  }
  assert(out.take(c1).empty());
  assert(out.take(c0).empty());

  // Explicit targets, deduplicated, sender excluded.
  {
    json m = common::make_message("x");
    m["to"] = json::array({json{{"deviceIndex", 1}, {"role", "client"}}, json{{"deviceIndex", 1}, {"role", "client"}}});
    const auto r = router.route(p1, m);
    assert(r.delivered.size() == 1);
    assert(r.unreachable.empty());
    assert(out.of_type(c1, "x").size() == 1);
  }
  {
    // Encoded global id 35 = env 1 pylon 3; relay env is 0 but the index still matches.
    json m = common::make_message("x");
    m["to"] = json::array({35, json{{"deviceId", 17}}});
    const auto r = router.route(c0, m);
    assert(r.delivered.size() == 2);
    assert(out.of_type(p3, "x").size() == 1);
    assert(out.of_type(c1, "x").size() == 1);
  }
  {
    json m = common::make_message("x");
    m["to"] = json::array({json{{"deviceIndex", 9}, {"role", "pylon"}}, 1});
    m["requestId"] = "r-1";
    const auto r = router.route(c1, m);
    assert(r.unreachable.size() == 1);
    // Bare index 1 matches Pylon 1 (the client with index 1 is the sender).
    assert(r.delivered.size() == 1);
    assert(out.of_type(p1, "x").size() == 1);
    const auto errs = out.of_type(c1, "route_error");
    assert(errs.size() == 1);
    assert(common::payload_of(errs[0])["error"] == "target_unreachable");
    assert(errs[0]["requestId"] == "r-1");
  }

  // Broadcast scopes.
  {
    json m = common::make_message("x");
    m["broadcast"] = "clients";
    assert(router.route(p1, m).delivered.size() == 2);
    m["broadcast"] = true;
    assert(router.route(p1, m).delivered.size() == 4);
    m["broadcast"] = "lab";
    const auto r = router.route(c0, m);
    assert(r.delivered.size() == 1 && r.delivered[0] == p3);
    out.inbox.clear();
  }

  // Policy override.
  router.set_default_route(relay::DefaultRoutePolicy::by_sender_role);
  assert(router.route(p2, common::make_message("x")).delivered.size() == 2);
  router.set_default_route(relay::DefaultRoutePolicy::drop);
  assert(router.route(c0, common::make_message("x")).delivered.empty());
  router.set_default_route(relay::DefaultRoutePolicy::all_pylons);
  out.inbox.clear();

  // ping / get_devices.
  router.handle_message(c0, R"({"type":"ping"})");
  assert(out.take(c0).at(0)["type"] == "pong");
  router.handle_message(c0, R"({"type":"get_devices"})");
  {
    const auto list = out.take(c0).at(0);
    assert(list["type"] == "device_list");
    const auto& devices = common::payload_of(list)["devices"];
    assert(devices.size() == 5);
    assert(devices[0]["role"] == "pylon");
    assert(devices[0]["deviceIndex"] == 1);
    assert(devices[4]["role"] == "client");
  }
  {
    // Pending connections are not listed.
    const auto pending = router.on_connect("127.0.0.1");
    assert(router.list_devices().size() == 5);
    router.on_disconnect(*pending);
  }
  out.inbox.clear();

  // Client disconnect: Pylons hear about it, clients only see device_status.
  router.on_disconnect(c0);
  for (const auto& p : {p1, p2, p3}) {
    const auto gone = out.of_type(p, "client_disconnect");
    assert(gone.size() == 1);
    assert(common::payload_of(gone[0])["deviceIndex"] == 0);
    assert(common::payload_of(gone[0])["deviceId"] == 16);
  }
  {
    const auto msgs = out.take(c1);
    assert(msgs.size() == 1);
    assert(msgs[0]["type"] == "device_status");
  }
  assert(!router.client_indices().is_assigned(0));

  // Pylon disconnect sends no client_disconnect.
  router.on_disconnect(p3);
  assert(out.of_type(p1, "client_disconnect").empty());

  // Capacity: 16 clients, the 17th fails; a freed index is reused.
  std::vector<relay::ConnectionId> clients{c1};
  for (int i = 0; i < 15; ++i) clients.push_back(join(router, out, "127.0.0.1", auth("client")));
  assert(router.client_indices().size() == 16);
  {
    const auto extra = router.on_connect("127.0.0.1");
    router.handle_message(*extra, auth("client").dump());
    assert(auth_error(out, *extra) == "no_available_index");
    router.on_disconnect(*extra);
  }
  const int freed = router.connection(clients[5])->identity->device_index;
  router.on_disconnect(clients[5]);
  const auto again = join(router, out, "127.0.0.1", auth("client"));
  assert(router.connection(again)->identity->device_index == freed);

  // Requesting a taken client index.
  {
    const auto dup = router.on_connect("127.0.0.1");
    router.handle_message(*dup, auth("client", 1).dump());
    assert(auth_error(out, *dup) == "index_in_use");
  }

  // Addresses outside every allow-list are refused at connect time.
  relay::RouterConfig closed = relay::default_router_config();
  closed.devices.at(1).allowed_ips = {"10.1.1.1"};
  closed.devices.at(2).allowed_ips = {"10.1.1.2"};
  closed.default_allowed_ips = {"10.1.1.3"};
  RecordingOutbox out2;
  relay::Router strict(closed, out2);
  assert(!strict.on_connect("127.0.0.1"));
  const auto ok = strict.on_connect("10.1.1.2");
  assert(ok);
  strict.handle_message(*ok, auth("pylon", 1).dump());
  assert(auth_error(out2, *ok) == "ip_denied");

  // An empty default list admits nobody; only slot addresses get through.
  relay::RouterConfig empty_default = relay::default_router_config();
  empty_default.devices.at(1).allowed_ips = {"10.2.2.1"};
  empty_default.devices.at(2).allowed_ips = {"10.2.2.2"};
  empty_default.default_allowed_ips.clear();
  RecordingOutbox out3;
  relay::Router locked(empty_default, out3);
  assert(!locked.on_connect("127.0.0.1"));
  assert(!locked.on_connect("10.2.2.9"));
  const auto slot_ip = locked.on_connect("10.2.2.1");
  assert(slot_ip);
  locked.handle_message(*slot_ip, auth("client").dump());
  assert(auth_error(out3, *slot_ip) == "ip_denied");
  locked.handle_message(*slot_ip, auth("pylon", 1).dump());
  assert(locked.connection(*slot_ip)->identity);

  return 0;
}
