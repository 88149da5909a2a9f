#include "src/relay/router.h"

#include "common/envelope.hpp"
#include "common/framing.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace relay {

using common::json;
using identity::Role;

std::string auth_error_name(AuthError e) {
  switch (e) {
    case AuthError::none:
      return "none";
    case AuthError::unknown_connection:
      return "unknown_connection";
    case AuthError::invalid_role:
      return "invalid_role";
    case AuthError::ip_denied:
      return "ip_denied";
    case AuthError::index_required:
      return "index_required";
    case AuthError::index_out_of_range:
      return "index_out_of_range";
    case AuthError::index_in_use:
      return "index_in_use";
    case AuthError::no_available_index:
      return "no_available_index";
  }
  return "unknown";
}

AuthRequest AuthRequest::from_payload(const json& payload) {
  AuthRequest req;
  if (auto r = common::string_field(payload, "role")) {
    req.role = *r;
  } else if (auto t = common::string_field(payload, "deviceType")) {
    req.role = *t;
  }
  if (payload.contains("deviceIndex")) {
    req.device_index = payload["deviceIndex"];
  } else if (payload.contains("deviceId")) {
    req.device_index = payload["deviceId"];
  }
  req.name = common::string_field(payload, "name").value_or("");
  req.mac = common::string_field(payload, "mac").value_or("");
  return req;
}

Router::Router(RouterConfig cfg, Outbox& outbox) : cfg_(std::move(cfg)), outbox_(outbox) {}

const std::vector<std::string>& Router::allow_list_for(int pylon_index) const {
  const auto it = cfg_.devices.find(pylon_index);
  if (it != cfg_.devices.end()) return it->second.allowed_ips;
  return cfg_.default_allowed_ips;
}

bool Router::ip_admitted(std::string_view ip) const {
  if (ip_allowed(cfg_.default_allowed_ips, ip)) return true;
  return std::any_of(cfg_.devices.begin(), cfg_.devices.end(), [&](const auto& kv) {
    return ip_allowed(kv.second.allowed_ips, ip);
  });
}

std::optional<ConnectionId> Router::pylon_owner(int index) const {
  for (const auto& [cid, c] : connections_) {
    if (c.identity && c.identity->role == Role::pylon && c.identity->device_index == index) return cid;
  }
  return std::nullopt;
}

std::optional<ConnectionId> Router::on_connect(std::string_view ip) {
  if (!ip_admitted(ip)) {
    common::log_warn("rejected connection from " + std::string(ip));
    return std::nullopt;
  }
  Connection c;
  c.id = "conn-" + std::to_string(next_connection_++);
  c.ip = std::string(ip);
  c.connected_at = common::now_ms();
  const ConnectionId id = c.id;
  connections_.emplace(id, std::move(c));

  json payload;
  payload["connectionId"] = id;
  payload["message"] = "Connected to Relay";
  outbox_.deliver(id, common::make_message("connected", std::move(payload)));

  const auto s = stats();
  common::log("connected " + id + " from " + std::string(ip) + " (pylons=" + std::to_string(s.pylons) +
              " clients=" + std::to_string(s.clients) + " pending=" + std::to_string(s.unauthenticated) + ")");
  return id;
}

void Router::reject_auth(const ConnectionId& id, AuthError e) {
  const auto it = connections_.find(id);
  const std::string ip = it != connections_.end() ? it->second.ip : std::string("?");
  common::log_warn("auth failed " + id + " from " + ip + ": " + auth_error_name(e));
  json payload;
  payload["success"] = false;
  payload["error"] = auth_error_name(e);
  outbox_.deliver(id, common::make_message("auth_result", std::move(payload)));
  outbox_.close(id);
}

AuthResult Router::on_auth(const ConnectionId& id, const AuthRequest& req) {
  AuthResult result;
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    result.error = AuthError::unknown_connection;
    return result;
  }
  Connection& conn = it->second;

  auto fail = [&](AuthError e) {
    reject_auth(id, e);
    result.error = e;
    return result;
  };

  const auto role = identity::parse_role(req.role);
  if (!role) return fail(AuthError::invalid_role);

  std::optional<int> previous_client;
  if (conn.identity && conn.identity->role == Role::client) previous_client = conn.identity->device_index;

  DeviceIdentity dev;
  dev.role = *role;

  if (*role == Role::pylon) {
    if (req.device_index.is_null()) return fail(AuthError::index_required);
    const auto idx = identity::parse_device_index(req.device_index);
    if (!idx || !identity::is_valid_pylon_index(*idx)) return fail(AuthError::index_out_of_range);
    if (!ip_allowed(allow_list_for(*idx), conn.ip)) return fail(AuthError::ip_denied);
    const auto owner = pylon_owner(*idx);
    if (owner && *owner != id) return fail(AuthError::index_in_use);

    dev.device_index = *idx;
    const auto slot = cfg_.devices.find(*idx);
    if (slot != cfg_.devices.end()) {
      dev.name = slot->second.name;
      dev.icon = slot->second.icon;
      dev.label = slot->second.label;
    } else {
      dev.name = req.name.empty() ? "Pylon " + std::to_string(*idx) : req.name;
    }
    if (previous_client) clients_.release(*previous_client);
  } else {
    if (!ip_allowed(cfg_.default_allowed_ips, conn.ip)) return fail(AuthError::ip_denied);
    int index = 0;
    if (req.device_index.is_null()) {
      if (previous_client) {
        index = *previous_client;
      } else {
        const auto assigned = clients_.assign();
        if (!assigned) return fail(AuthError::no_available_index);
        index = *assigned;
      }
    } else {
      const auto idx = identity::parse_device_index(req.device_index);
      if (!idx || !identity::is_valid_client_index(*idx)) return fail(AuthError::index_out_of_range);
      if (previous_client != idx) {
        if (!clients_.reserve(*idx)) return fail(AuthError::index_in_use);
        if (previous_client) clients_.release(*previous_client);
      }
      index = *idx;
    }
    dev.device_index = index;
    dev.name = req.name.empty() ? "Client " + std::to_string(index) : req.name;
  }

  conn.identity = dev;
  result.ok = true;
  result.device = dev;

  json payload;
  payload["success"] = true;
  payload["device"] = device_info(conn);
  outbox_.deliver(id, common::make_message("auth_result", std::move(payload)));
  common::log("auth ok " + id + " as " + identity::role_name(dev.role) + " " + std::to_string(dev.device_index) +
              " (" + dev.name + ") from " + conn.ip + (req.mac.empty() ? "" : " mac " + req.mac));

  broadcast_device_status();
  return result;
}

std::optional<Router::Target> Router::parse_target(const json& t) const {
  if (t.is_object()) {
    Target target;
    if (t.contains("deviceIndex")) {
      const auto idx = identity::parse_device_index(t["deviceIndex"]);
      if (!idx || !identity::is_valid_client_index(*idx)) return std::nullopt;
      target.device_index = *idx;
    } else if (t.contains("deviceId")) {
      const auto idx = identity::parse_device_index(t["deviceId"]);
      if (!idx) return std::nullopt;
      const auto decoded = identity::decode_device_id(*idx);
      if (!decoded) return std::nullopt;
      target.device_index = decoded->device_index;
      target.role = decoded->role;
    } else {
      return std::nullopt;
    }
    if (auto r = common::string_field(t, "role")) {
      const auto role = identity::parse_role(*r);
      if (!role) return std::nullopt;
      target.role = role;
    }
    return target;
  }

  const auto idx = identity::parse_device_index(t);
  if (!idx) return std::nullopt;
  if (*idx <= identity::kMaxClientIndex) return Target{*idx, std::nullopt};
  const auto decoded = identity::decode_device_id(*idx);
  if (!decoded) return std::nullopt;
  return Target{decoded->device_index, decoded->role};
}

bool Router::matches(const Connection& c, const Target& t) const {
  if (!c.identity) return false;
  if (c.identity->device_index != t.device_index) return false;
  return !t.role || *t.role == c.identity->role;
}

bool Router::matches_broadcast(const Connection& c, std::string_view scope) const {
  if (!c.identity) return false;
  if (scope == "all") return true;
  if (scope == "pylons" || scope == "pylon") return c.identity->role == Role::pylon;
  if (scope == "clients" || scope == "client") return c.identity->role == Role::client;
  return !c.identity->label.empty() && c.identity->label == scope;
}

json Router::device_info(const Connection& c) const {
  json j;
  if (!c.identity) return j;
  const auto& d = *c.identity;
  const auto global = d.role == Role::pylon ? identity::encode_pylon_id(cfg_.env_id, d.device_index)
                                            : identity::encode_client_id(cfg_.env_id, d.device_index);
  j["deviceIndex"] = d.device_index;
  j["role"] = identity::role_name(d.role);
  j["deviceId"] = global.value_or(d.device_index);
  j["name"] = d.name;
  j["icon"] = d.icon;
  if (!d.label.empty()) j["label"] = d.label;
  j["connectedAt"] = c.connected_at;
  return j;
}

json Router::with_sender(const json& msg, const Connection& sender) const {
  json out = msg;
  json from = device_info(sender);
  from.erase("connectedAt");
  from.erase("label");
  out["from"] = std::move(from);
  return out;
}

void Router::deliver_to(const ConnectionId& id, const json& msg, RouteResult* result) {
  outbox_.deliver(id, msg);
  if (result) result->delivered.push_back(id);
}

RouteResult Router::route(const ConnectionId& from, const json& msg) {
  RouteResult result;
  const auto it = connections_.find(from);
  if (it == connections_.end()) return result;
  const Connection& sender = it->second;
  if (!sender.authenticated()) {
    outbox_.deliver(from, common::make_error("not_authenticated"));
    return result;
  }
  if (!msg.is_object()) return result;

  const json out = with_sender(msg, sender);
  const std::string type = common::message_type(msg).value_or("?");

  const auto to_it = msg.find("to");
  const bool has_to = to_it != msg.end() && !to_it->is_null() && !(to_it->is_array() && to_it->empty());
  if (has_to) {
    std::vector<json> targets;
    if (to_it->is_array()) {
      targets.assign(to_it->begin(), to_it->end());
    } else {
      targets.push_back(*to_it);
    }

    std::set<ConnectionId> sent;
    for (const auto& t : targets) {
      const auto target = parse_target(t);
      bool hit = false;
      if (target) {
        for (const auto& [cid, c] : connections_) {
          if (cid == from || !matches(c, *target)) continue;
          hit = true;
          if (sent.insert(cid).second) deliver_to(cid, out, &result);
        }
      }
      if (!hit) result.unreachable.push_back(t);
    }

    if (!result.unreachable.empty()) {
      common::log_warn("route " + type + " from " + from + ": unreachable " +
                       common::to_text(json(result.unreachable)));
      if (msg.contains("requestId")) {
        json payload;
        payload["error"] = "target_unreachable";
        payload["targets"] = result.unreachable;
        payload["requestId"] = msg["requestId"];
        json err = common::make_message("route_error", std::move(payload));
        err["requestId"] = msg["requestId"];
        outbox_.deliver(from, err);
      }
    }
    return result;
  }

  std::optional<std::string> scope;
  const auto b_it = msg.find("broadcast");
  if (b_it != msg.end()) {
    if (b_it->is_boolean() && b_it->get<bool>()) {
      scope = "all";
    } else if (b_it->is_string() && !b_it->get<std::string>().empty()) {
      scope = b_it->get<std::string>();
    }
  }

  if (!scope) {
    switch (cfg_.default_route) {
      case DefaultRoutePolicy::all_pylons:
        scope = "pylons";
        break;
      case DefaultRoutePolicy::by_sender_role:
        scope = sender.identity->role == Role::pylon ? "clients" : "pylons";
        break;
      case DefaultRoutePolicy::drop:
        common::log_warn("dropped untargeted " + type + " from " + from);
        return result;
    }
  }

  for (const auto& [cid, c] : connections_) {
    if (cid == from) continue;
    if (!matches_broadcast(c, *scope)) continue;
    deliver_to(cid, out, &result);
  }
  return result;
}

void Router::broadcast_device_status() {
  json payload;
  payload["devices"] = list_devices();
  const json msg = common::make_message("device_status", std::move(payload));
  for (const auto& [cid, c] : connections_) {
    if (c.authenticated()) outbox_.deliver(cid, msg);
  }
}

void Router::notify_client_disconnect(const DeviceIdentity& gone) {
  json payload;
  payload["deviceIndex"] = gone.device_index;
  payload["role"] = identity::role_name(gone.role);
  payload["deviceId"] = identity::encode_client_id(cfg_.env_id, gone.device_index).value_or(gone.device_index);
  const json msg = common::make_message("client_disconnect", std::move(payload));
  for (const auto& [cid, c] : connections_) {
    if (c.identity && c.identity->role == Role::pylon) outbox_.deliver(cid, msg);
  }
}

void Router::on_disconnect(const ConnectionId& id) {
  auto it = connections_.find(id);
  if (it == connections_.end()) return;
  Connection gone = std::move(it->second);
  connections_.erase(it);

  if (!gone.identity) {
    common::log("disconnected " + id + " (unauthenticated)");
    return;
  }
  const auto& dev = *gone.identity;
  if (dev.role == Role::client) clients_.release(dev.device_index);
  common::log("disconnected " + id + " " + identity::role_name(dev.role) + " " + std::to_string(dev.device_index));

  if (dev.role != Role::pylon) notify_client_disconnect(dev);
  broadcast_device_status();
}

void Router::handle_message(const ConnectionId& id, std::string_view text) {
  const auto it = connections_.find(id);
  if (it == connections_.end()) return;

  const auto parsed = common::parse_json_text(text);
  if (!parsed || !parsed->is_object()) {
    common::log_warn("invalid JSON from " + id);
    outbox_.deliver(id, common::make_error("invalid_json"));
    return;
  }
  const json& msg = *parsed;
  const auto type = common::message_type(msg);
  if (!type) {
    outbox_.deliver(id, common::make_error("missing_type"));
    return;
  }

  if (*type == "auth") {
    on_auth(id, AuthRequest::from_payload(common::payload_of(msg)));
    return;
  }
  if (!it->second.authenticated()) {
    outbox_.deliver(id, common::make_error("not_authenticated"));
    return;
  }
  if (*type == "ping") {
    outbox_.deliver(id, common::make_message("pong"));
    return;
  }
  if (*type == "get_devices" || *type == "getDevices") {
    json payload;
    payload["devices"] = list_devices();
    outbox_.deliver(id, common::make_message("device_list", std::move(payload)));
    return;
  }
  route(id, msg);
}

json Router::list_devices() const {
  std::vector<const Connection*> live;
  for (const auto& [cid, c] : connections_) {
    if (c.authenticated()) live.push_back(&c);
  }
  std::sort(live.begin(), live.end(), [](const Connection* a, const Connection* b) {
    if (a->identity->role != b->identity->role) return a->identity->role == Role::pylon;
    return a->identity->device_index < b->identity->device_index;
  });
  json out = json::array();
  for (const Connection* c : live) out.push_back(device_info(*c));
  return out;
}

ConnectionStats Router::stats() const {
  ConnectionStats s;
  for (const auto& [cid, c] : connections_) {
    if (!c.identity) {
      ++s.unauthenticated;
    } else if (c.identity->role == Role::pylon) {
      ++s.pylons;
    } else {
      ++s.clients;
    }
  }
  return s;
}

const Connection* Router::connection(const ConnectionId& id) const {
  const auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : &it->second;
}

} // namespace relay
