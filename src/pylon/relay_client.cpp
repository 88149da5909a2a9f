#include "src/pylon/relay_client.h"

#include "common/envelope.hpp"
#include "common/framing.hpp"
#include "common/util.hpp"

#include <utility>

namespace pylon {

using common::json;

// Routes one attempt's transport events back to the client, tagged with the
// attempt's generation so a stale attempt cannot disturb a newer one.
class RelayClient::Link : public TransportEvents {
 public:
  Link(std::weak_ptr<RelayClient> owner, uint64_t generation)
      : owner_(std::move(owner)), generation_(generation) {}

  void on_open() override {
    if (auto c = owner_.lock()) c->handle_open(generation_);
  }
  void on_message(std::string text) override {
    if (auto c = owner_.lock()) c->handle_message(generation_, text);
  }
  void on_close() override {
    if (auto c = owner_.lock()) c->handle_close(generation_);
  }
  void on_error(const std::string& what) override {
    if (auto c = owner_.lock()) c->handle_error(generation_, what);
  }

 private:
  std::weak_ptr<RelayClient> owner_;
  uint64_t generation_;
};

RelayClient::RelayClient(boost::asio::io_context& io, Config cfg, TransportFactory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)), heartbeat_timer_(io), reconnect_timer_(io) {}

void RelayClient::connect() {
  reconnect_enabled_ = true;
  if (state_ != State::disconnected) return;
  reconnect_timer_.cancel();
  start_attempt();
}

void RelayClient::start_attempt() {
  state_ = State::connecting;
  ++generation_;
  ++attempts_;
  transport_ = factory_();
  if (!transport_) {
    common::log_error("relay transport unavailable");
    state_ = State::disconnected;
    schedule_reconnect();
    return;
  }
  transport_->open(std::make_shared<Link>(weak_from_this(), generation_));
}

void RelayClient::disconnect() {
  reconnect_enabled_ = false;
  heartbeat_timer_.cancel();
  reconnect_timer_.cancel();

  const bool was_connected = state_ == State::connected;
  ++generation_;
  state_ = State::disconnected;
  if (transport_) {
    auto t = std::move(transport_);
    t->close();
  }
  if (was_connected) {
    common::log("disconnected from relay");
    if (listener_) listener_->on_relay_status(false);
  }
}

bool RelayClient::send(const json& msg) {
  if (state_ != State::connected || !transport_) {
    common::log_warn("Cannot send, not connected to Relay");
    return false;
  }
  transport_->send(common::to_text(msg));
  return true;
}

void RelayClient::handle_open(uint64_t generation) {
  if (generation != generation_) return;
  state_ = State::connected;
  last_pong_ = std::chrono::steady_clock::now();
  common::log("connected to relay (attempt " + std::to_string(attempts_) + ")");
  if (listener_) listener_->on_relay_status(true);
  send_identify();
  schedule_heartbeat();
}

void RelayClient::send_identify() {
  json payload;
  payload["role"] = "pylon";
  payload["deviceIndex"] = cfg_.device_index;
  if (!cfg_.name.empty()) payload["name"] = cfg_.name;
  send(common::make_message("auth", std::move(payload)));
}

void RelayClient::handle_message(uint64_t generation, const std::string& text) {
  if (generation != generation_) return;
  const auto msg = common::parse_json_text(text);
  if (!msg || !msg->is_object()) {
    common::log_warn("invalid JSON from relay");
    return;
  }
  const auto type = common::message_type(*msg).value_or("");
  if (type == "pong") {
    last_pong_ = std::chrono::steady_clock::now();
    return;
  }
  if (type == "auth_result") {
    const json& p = common::payload_of(*msg);
    if (common::bool_field(p, "success").value_or(false)) {
      identity_ = p.contains("device") ? p["device"] : json::object();
      common::log("authenticated with relay as pylon " + std::to_string(cfg_.device_index));
    } else {
      identity_.reset();
      common::log_error("relay rejected auth: " + common::string_field(p, "error").value_or("unknown"));
    }
  }
  if (listener_) listener_->on_relay_message(*msg);
}

void RelayClient::handle_error(uint64_t generation, const std::string& what) {
  if (generation != generation_) return;
  common::log_warn("relay link error: " + what);
}

void RelayClient::handle_close(uint64_t generation) {
  if (generation != generation_) return;
  const bool was_connected = state_ == State::connected;
  state_ = State::disconnected;
  heartbeat_timer_.cancel();
  transport_.reset();
  identity_.reset();
  if (was_connected) {
    common::log("relay connection closed");
    if (listener_) listener_->on_relay_status(false);
  }
  if (reconnect_enabled_) schedule_reconnect();
}

void RelayClient::schedule_heartbeat() {
  heartbeat_timer_.expires_after(cfg_.heartbeat_interval);
  std::weak_ptr<RelayClient> weak = weak_from_this();
  heartbeat_timer_.async_wait([weak](const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (ec || !self || self->state_ != State::connected) return;
    const auto silent = std::chrono::steady_clock::now() - self->last_pong_;
    if (silent > self->cfg_.heartbeat_timeout) {
      common::log_warn("relay heartbeat timeout after " +
                       std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(silent).count()) +
                       " ms, reconnecting");
      self->force_reconnect();
      return;
    }
    self->send(common::make_message("ping"));
    self->schedule_heartbeat();
  });
}

void RelayClient::schedule_reconnect() {
  reconnect_timer_.cancel();
  reconnect_timer_.expires_after(cfg_.reconnect_interval);
  common::log("reconnecting to relay in " + std::to_string(cfg_.reconnect_interval.count()) + " ms");
  std::weak_ptr<RelayClient> weak = weak_from_this();
  reconnect_timer_.async_wait([weak](const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (ec || !self) return;
    if (!self->reconnect_enabled_ || self->state_ != State::disconnected) return;
    self->start_attempt();
  });
}

void RelayClient::force_reconnect() {
  heartbeat_timer_.cancel();
  if (transport_) {
    transport_->close();
  } else {
    handle_close(generation_);
  }
}

} // namespace pylon
