#include "src/pylon/local_server.h"

#include "common/envelope.hpp"
#include "common/framing.hpp"
#include "common/util.hpp"
#include "src/pylon/packet_logger.h"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <utility>
#include <vector>

namespace pylon {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;
using common::json;

namespace {

bool skip_packet_log(std::string_view type) {
  return type == "relay_status" || type == "pong";
}

class LocalSession : public LocalPeer, public std::enable_shared_from_this<LocalSession> {
 public:
  using WsStream = websocket::stream<beast::tcp_stream>;

  LocalSession(LocalServer& server, tcp::socket socket)
      : server_(server), ws_(std::move(socket)), read_buffer_(std::make_shared<beast::flat_buffer>()) {}

  void start() {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.read_message_max(common::kMaxMessageSize);
    auto self = shared_from_this();
    ws_.async_accept([self](const beast::error_code& ec) {
      if (ec) {
        common::log_warn("local handshake failed: " + ec.message());
        return;
      }
      self->writer_ = std::make_shared<common::TextWriteQueue<WsStream>>(self->ws_);
      self->id_ = self->server_.attach(self);
      self->do_read();
    });
  }

  void send(std::string text) override {
    if (writer_) writer_->send(std::move(text));
  }

  void close() override {
    if (writer_) writer_->shutdown();
  }

 private:
  void do_read() {
    auto self = shared_from_this();
    common::async_read_text(ws_, read_buffer_, [self](const beast::error_code& ec, std::string text) {
      if (ec) {
        if (!common::is_benign_close(ec)) common::log_warn("local read error: " + ec.message());
        if (self->writer_) self->writer_->abandon();
        self->server_.detach(self->id_);
        return;
      }
      self->server_.on_text(self->id_, text);
      self->do_read();
    });
  }

  LocalServer& server_;
  WsStream ws_;
  std::shared_ptr<beast::flat_buffer> read_buffer_;
  std::shared_ptr<common::TextWriteQueue<WsStream>> writer_;
  LocalServer::PeerId id_ = 0;
};

} // namespace

LocalServer::LocalServer(boost::asio::io_context& io, uint16_t port, PacketLogger* packets)
    : port_(port), packets_(packets), acceptor_(io) {}

LocalServer::~LocalServer() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

bool LocalServer::start(std::string* out_error) {
  boost::system::error_code ec;
  const tcp::endpoint ep(boost::asio::ip::make_address_v4("127.0.0.1"), port_);
  acceptor_.open(ep.protocol(), ec);
  if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(ep, ec);
  if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    if (out_error) *out_error = "local server bind 127.0.0.1:" + std::to_string(port_) + ": " + ec.message();
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }
  running_ = true;
  common::log("local server listening on " + common::endpoint_to_string(acceptor_.local_endpoint()));
  do_accept();
  return true;
}

void LocalServer::stop() {
  if (!running_) return;
  running_ = false;
  boost::system::error_code ignored;
  acceptor_.close(ignored);
  std::vector<std::shared_ptr<LocalPeer>> live;
  for (const auto& [id, p] : peers_) live.push_back(p);
  for (const auto& p : live) p->close();
}

uint16_t LocalServer::local_port() const {
  boost::system::error_code ec;
  const auto ep = acceptor_.local_endpoint(ec);
  return ec ? port_ : ep.port();
}

void LocalServer::do_accept() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) common::log_error("local accept error: " + ec.message());
      return;
    }
    std::make_shared<LocalSession>(*this, std::move(socket))->start();
    if (running_) do_accept();
  });
}

LocalServer::PeerId LocalServer::attach(std::shared_ptr<LocalPeer> peer) {
  const PeerId id = next_peer_++;
  peers_[id] = peer;

  json greeting;
  greeting["type"] = "connected";
  greeting["message"] = "Connected to Pylon";
  greeting["relayStatus"] = relay_connected_;
  greeting["timestamp"] = common::now_ms();
  peer->send(common::to_text(greeting));

  common::log("local client " + std::to_string(id) + " connected (" + std::to_string(peers_.size()) + " total)");
  if (listener_) listener_->on_local_connect(id);
  return id;
}

void LocalServer::on_text(PeerId peer, std::string_view text) {
  if (peers_.find(peer) == peers_.end()) return;
  const auto msg = common::parse_json_text(text);
  if (!msg || !msg->is_object()) {
    common::log_warn("invalid JSON from local client " + std::to_string(peer));
    return;
  }
  if (packets_) packets_->log_recv("local", *msg);
  if (listener_) listener_->on_local_message(peer, *msg);
}

void LocalServer::detach(PeerId peer) {
  if (peers_.erase(peer) == 0) return;
  common::log("local client " + std::to_string(peer) + " disconnected (" + std::to_string(peers_.size()) +
              " remaining)");
  if (listener_) listener_->on_local_disconnect(peer);
}

void LocalServer::broadcast(const json& msg) {
  const auto type = common::message_type(msg).value_or("");
  if (packets_ && !skip_packet_log(type)) packets_->log_send("local", msg);
  const std::string text = common::to_text(msg);
  for (const auto& [id, p] : peers_) p->send(text);
}

bool LocalServer::send_to(PeerId peer, const json& msg) {
  const auto it = peers_.find(peer);
  if (it == peers_.end()) return false;
  const auto type = common::message_type(msg).value_or("");
  if (packets_ && !skip_packet_log(type)) packets_->log_send("local", msg);
  it->second->send(common::to_text(msg));
  return true;
}

void LocalServer::send_relay_status(bool connected) {
  relay_connected_ = connected;
  json msg;
  msg["type"] = "relay_status";
  msg["connected"] = connected;
  msg["timestamp"] = common::now_ms();
  broadcast(msg);
}

} // namespace pylon
