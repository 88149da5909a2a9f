#pragma once

#include "common/json.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace pylon {

class PacketLogger;

constexpr uint16_t kDefaultLocalPort = 9000;

// One connected companion app as seen by the LocalServer.
class LocalPeer {
 public:
  virtual ~LocalPeer() = default;
  virtual void send(std::string text) = 0;
  virtual void close() = 0;
};

// WebSocket server for companion apps on the Pylon machine (loopback only).
// The peer bookkeeping is transport-independent; start() adds the Beast
// acceptor that creates peers from real sockets.
class LocalServer {
 public:
  using PeerId = uint64_t;

  class Listener {
   public:
    virtual ~Listener() = default;
    virtual void on_local_connect(PeerId peer) = 0;
    virtual void on_local_message(PeerId peer, const common::json& msg) = 0;
    virtual void on_local_disconnect(PeerId peer) = 0;
  };

  LocalServer(boost::asio::io_context& io, uint16_t port, PacketLogger* packets = nullptr);
  ~LocalServer();

  void set_listener(Listener* listener) { listener_ = listener; }

  bool start(std::string* out_error);
  void stop();
  bool running() const { return running_; }
  uint16_t local_port() const;

  PeerId attach(std::shared_ptr<LocalPeer> peer);
  void on_text(PeerId peer, std::string_view text);
  void detach(PeerId peer);

  void broadcast(const common::json& msg);
  bool send_to(PeerId peer, const common::json& msg);
  void send_relay_status(bool connected);

  bool relay_connected() const { return relay_connected_; }
  std::size_t client_count() const { return peers_.size(); }

 private:
  void do_accept();

  uint16_t port_;
  PacketLogger* packets_;
  Listener* listener_ = nullptr;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::map<PeerId, std::shared_ptr<LocalPeer>> peers_;
  PeerId next_peer_ = 1;
  bool relay_connected_ = false;
  bool running_ = false;
};

} // namespace pylon
