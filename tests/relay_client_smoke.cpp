#include "common/envelope.hpp"
#include "common/framing.hpp"
#include "src/pylon/relay_client.h"

#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace {

using common::json;
using namespace std::chrono_literals;

// In-memory transport: events are posted to the io_context like a socket's.
class FakeTransport : public pylon::Transport, public std::enable_shared_from_this<FakeTransport> {
 public:
  enum class Mode { open, refuse };

  FakeTransport(boost::asio::io_context& io, Mode mode, bool answer_pings)
      : io_(io), mode_(mode), answer_pings_(answer_pings) {}

  void open(std::shared_ptr<pylon::TransportEvents> events) override {
    events_ = std::move(events);
    auto self = shared_from_this();
    boost::asio::post(io_, [self] {
      if (self->closed_) return;
      if (self->mode_ == Mode::refuse) {
        self->events_->on_error("connection refused");
        self->finish();
        return;
      }
      self->events_->on_open();
    });
  }

  void send(std::string text) override {
    sent.push_back(json::parse(text));
    if (answer_pings_ && sent.back()["type"] == "ping") {
      auto self = shared_from_this();
      boost::asio::post(io_, [self] {
        if (!self->closed_) self->events_->on_message(common::to_text(common::make_message("pong")));
      });
    }
  }

  void close() override {
    auto self = shared_from_this();
    boost::asio::post(io_, [self] { self->finish(); });
  }

  void push(const json& msg) { events_->on_message(common::to_text(msg)); }

  std::vector<json> sent;

 private:
  void finish() {
    if (closed_) return;
    closed_ = true;
    events_->on_close();
  }

  boost::asio::io_context& io_;
  Mode mode_;
  bool answer_pings_;
  bool closed_ = false;
  std::shared_ptr<pylon::TransportEvents> events_;
};

class RecordingListener : public pylon::RelayClient::Listener {
 public:
  void on_relay_message(const json& msg) override { messages.push_back(msg); }
  void on_relay_status(bool connected) override { statuses.push_back(connected); }

  std::vector<json> messages;
  std::vector<bool> statuses;
};

struct Harness {
  explicit Harness(FakeTransport::Mode mode = FakeTransport::Mode::open, bool answer_pings = false) {
    pylon::RelayClient::Config cfg;
    cfg.device_index = 4;
    cfg.name = "build box";
    cfg.heartbeat_interval = 20ms;
    cfg.heartbeat_timeout = 60ms;
    cfg.reconnect_interval = 30ms;
    client = std::make_shared<pylon::RelayClient>(io, cfg, [this, mode, answer_pings] {
      auto t = std::make_shared<FakeTransport>(io, mode, answer_pings);
      transports.push_back(t);
      return t;
    });
    client->set_listener(&listener);
  }

  void run(std::chrono::milliseconds d) {
    io.restart();
    io.run_for(d);
  }

  boost::asio::io_context io;
  RecordingListener listener;
  std::vector<std::shared_ptr<FakeTransport>> transports;
  std::shared_ptr<pylon::RelayClient> client;
};

} // namespace

int main() {
  // Identify on open, consume pong, remember auth_result.
  {
    Harness h(FakeTransport::Mode::open, true);
    assert(!h.client->send(common::make_message("early")));
    h.client->connect();
    assert(h.client->state() == pylon::RelayClient::State::connecting);
    h.run(5ms);
    assert(h.client->connected());
    assert(h.listener.statuses == std::vector<bool>{true});

    auto& t = *h.transports.at(0);
    assert(!t.sent.empty());
    const auto& identify = t.sent.front();
    assert(identify["type"] == "auth");
    assert(common::payload_of(identify)["role"] == "pylon");
    assert(common::payload_of(identify)["deviceIndex"] == 4);
    assert(common::payload_of(identify)["name"] == "build box");

    t.push(common::make_message("auth_result", json{{"success", true}, {"device", {{"deviceIndex", 4}}}}));
    assert(h.client->identity());
    assert((*h.client->identity())["deviceIndex"] == 4);

    // Pongs keep the link alive across several timeout windows.
    h.run(200ms);
    assert(h.client->attempts() == 1);
    assert(h.client->connected());
    for (const auto& m : h.listener.messages) assert(m["type"] != "pong");
    std::size_t pings = 0;
    for (const auto& m : t.sent) pings += m["type"] == "ping";
    assert(pings >= 3);

    assert(h.client->send(common::make_message("claude_event")));
    assert(t.sent.back()["type"] == "claude_event");

    h.client->disconnect();
    assert(h.client->state() == pylon::RelayClient::State::disconnected);
    assert(!h.client->send(common::make_message("late")));
    assert(h.listener.statuses == (std::vector<bool>{true, false}));
    h.run(100ms);
    assert(h.client->attempts() == 1);
  }

  // Silence past the heartbeat timeout tears the link down and reconnects.
  {
    Harness h(FakeTransport::Mode::open, false);
    h.client->connect();
    h.run(250ms);
    assert(h.client->attempts() >= 2);
    assert(h.listener.statuses.size() >= 3);
    assert(h.listener.statuses[0] && !h.listener.statuses[1] && h.listener.statuses[2]);
    // Every attempt identified itself.
    for (const auto& t : h.transports) {
      if (!t->sent.empty()) assert(t->sent.front()["type"] == "auth");
    }
    h.client->disconnect();
    const auto attempts = h.client->attempts();
    h.run(100ms);
    assert(h.client->attempts() == attempts);
  }

  // A refused attempt retries on the reconnect timer without status changes.
  {
    Harness h(FakeTransport::Mode::refuse);
    h.client->connect();
    h.run(100ms);
    assert(h.client->attempts() >= 3);
    assert(h.listener.statuses.empty());
    assert(!h.client->connected());

    // disconnect() cancels the pending reconnect.
    h.client->disconnect();
    const auto attempts = h.client->attempts();
    h.run(100ms);
    assert(h.client->attempts() == attempts);
  }

  // A failed auth clears the remembered identity and still reaches the listener.
  {
    Harness h;
    h.client->connect();
    h.run(5ms);
    h.transports.at(0)->push(common::make_message("auth_result", json{{"success", false}, {"error", "index_in_use"}}));
    assert(!h.client->identity());
    assert(h.listener.messages.back()["type"] == "auth_result");
    h.client->disconnect();
  }

  return 0;
}
