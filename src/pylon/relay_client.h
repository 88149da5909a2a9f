#pragma once

#include "common/json.hpp"
#include "src/pylon/transport.h"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pylon {

// Keeps one Pylon connected to the Relay: identify on open, ping on a fixed
// interval, tear down on heartbeat timeout and reconnect after a delay.
class RelayClient : public std::enable_shared_from_this<RelayClient> {
 public:
  enum class State { disconnected, connecting, connected };

  struct Config {
    int device_index = 1;
    std::string name;
    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds heartbeat_timeout{30000};
    std::chrono::milliseconds reconnect_interval{3000};
  };

  class Listener {
   public:
    virtual ~Listener() = default;
    virtual void on_relay_message(const common::json& msg) = 0;
    virtual void on_relay_status(bool connected) = 0;
  };

  RelayClient(boost::asio::io_context& io, Config cfg, TransportFactory factory);

  void set_listener(Listener* listener) { listener_ = listener; }

  void connect();
  // Disables reconnects, cancels both timers, then closes the link.
  void disconnect();
  bool send(const common::json& msg);

  State state() const { return state_; }
  bool connected() const { return state_ == State::connected; }
  uint64_t attempts() const { return attempts_; }
  // device object from the last successful auth_result.
  const std::optional<common::json>& identity() const { return identity_; }
  const Config& config() const { return cfg_; }

 private:
  class Link;

  void start_attempt();
  void handle_open(uint64_t generation);
  void handle_message(uint64_t generation, const std::string& text);
  void handle_close(uint64_t generation);
  void handle_error(uint64_t generation, const std::string& what);

  void send_identify();
  void schedule_heartbeat();
  void schedule_reconnect();
  void force_reconnect();

  Config cfg_;
  TransportFactory factory_;
  Listener* listener_ = nullptr;

  boost::asio::steady_timer heartbeat_timer_;
  boost::asio::steady_timer reconnect_timer_;
  std::shared_ptr<Transport> transport_;
  State state_ = State::disconnected;
  bool reconnect_enabled_ = false;
  uint64_t generation_ = 0;
  uint64_t attempts_ = 0;
  std::chrono::steady_clock::time_point last_pong_{};
  std::optional<common::json> identity_;
};

} // namespace pylon
