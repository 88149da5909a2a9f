#pragma once

#include "common/json.hpp"
#include "src/identity/device_id.h"
#include "src/relay/relay_config.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relay {

using ConnectionId = std::string;

struct DeviceIdentity {
  int device_index = 0;
  identity::Role role = identity::Role::client;
  std::string name;
  std::string icon;
  std::string label;
};

struct Connection {
  ConnectionId id;
  std::string ip;
  int64_t connected_at = 0;
  std::optional<DeviceIdentity> identity;

  bool authenticated() const { return identity.has_value(); }
};

// Where the router sends its output. Implemented by the network server.
class Outbox {
 public:
  virtual ~Outbox() = default;
  virtual void deliver(const ConnectionId& to, const common::json& msg) = 0;
  // Flush pending output, then close the socket. The server reports the
  // close back through Router::on_disconnect, never from inside close().
  virtual void close(const ConnectionId& id) = 0;
};

enum class AuthError {
  none,
  unknown_connection,
  invalid_role,
  ip_denied,
  index_required,
  index_out_of_range,
  index_in_use,
  no_available_index,
};

std::string auth_error_name(AuthError e);

struct AuthRequest {
  std::string role;
  common::json device_index; // null when omitted
  std::string name;
  std::string mac;

  // Reads {role|deviceType, deviceIndex|deviceId, name, mac}.
  static AuthRequest from_payload(const common::json& payload);
};

struct AuthResult {
  bool ok = false;
  AuthError error = AuthError::none;
  std::optional<DeviceIdentity> device;
};

struct RouteResult {
  std::vector<ConnectionId> delivered;
  std::vector<common::json> unreachable;
};

struct ConnectionStats {
  std::size_t pylons = 0;
  std::size_t clients = 0;
  std::size_t unauthenticated = 0;
};

// Sole owner of relay state: live connections and the client index pool.
// Single-threaded; the server calls it from its io_context.
class Router {
 public:
  Router(RouterConfig cfg, Outbox& outbox);

  std::optional<ConnectionId> on_connect(std::string_view ip);
  AuthResult on_auth(const ConnectionId& id, const AuthRequest& req);
  RouteResult route(const ConnectionId& from, const common::json& msg);
  void on_disconnect(const ConnectionId& id);

  // Parses one inbound text frame and dispatches it.
  void handle_message(const ConnectionId& id, std::string_view text);

  common::json list_devices() const;
  ConnectionStats stats() const;

  const Connection* connection(const ConnectionId& id) const;
  const identity::ClientIndexAllocator& client_indices() const { return clients_; }
  const RouterConfig& config() const { return cfg_; }

  void set_default_route(DefaultRoutePolicy policy) { cfg_.default_route = policy; }

 private:
  struct Target {
    int device_index = 0;
    std::optional<identity::Role> role;
  };

  const std::vector<std::string>& allow_list_for(int pylon_index) const;
  bool ip_admitted(std::string_view ip) const;
  std::optional<ConnectionId> pylon_owner(int index) const;

  std::optional<Target> parse_target(const common::json& t) const;
  bool matches(const Connection& c, const Target& t) const;
  bool matches_broadcast(const Connection& c, std::string_view scope) const;

  common::json device_info(const Connection& c) const;
  common::json with_sender(const common::json& msg, const Connection& sender) const;

  void deliver_to(const ConnectionId& id, const common::json& msg, RouteResult* result);
  void reject_auth(const ConnectionId& id, AuthError e);
  void broadcast_device_status();
  void notify_client_disconnect(const DeviceIdentity& gone);

  RouterConfig cfg_;
  Outbox& outbox_;
  std::unordered_map<ConnectionId, Connection> connections_;
  identity::ClientIndexAllocator clients_;
  uint64_t next_connection_ = 1;
};

} // namespace relay
