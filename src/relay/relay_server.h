#pragma once

#include "common/framing.hpp"
#include "src/relay/router.h"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace relay {

// First entry of an X-Forwarded-For header, or `fallback` when absent/empty.
std::string forwarded_client_ip(std::string_view header, std::string_view fallback);

class RelayServer;

class RelaySession : public std::enable_shared_from_this<RelaySession> {
 public:
  using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  RelaySession(RelayServer& server, boost::asio::ip::tcp::socket socket);

  void start();
  void send(const common::json& msg);
  void close();

  const ConnectionId& id() const { return id_; }
  const std::string& ip() const { return ip_; }

 private:
  void on_request(const boost::beast::error_code& ec);
  void reject_http();
  void on_accept(const boost::beast::error_code& ec);
  void do_read();
  void finish();

  RelayServer& server_;
  WsStream ws_;
  boost::beast::flat_buffer http_buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<boost::beast::flat_buffer> read_buffer_;
  std::shared_ptr<common::TextWriteQueue<WsStream>> writer_;
  ConnectionId id_;
  std::string ip_;
  bool finished_ = false;
};

// Accepts WebSocket connections and feeds them to the Router.
class RelayServer : public Outbox {
 public:
  RelayServer(boost::asio::io_context& io, RouterConfig cfg);

  void listen(const boost::asio::ip::tcp::endpoint& ep);
  void stop();
  uint16_t local_port() const;

  Router& router() { return router_; }
  std::size_t session_count() const { return sessions_.size(); }

  void deliver(const ConnectionId& to, const common::json& msg) override;
  void close(const ConnectionId& id) override;

 private:
  friend class RelaySession;

  void do_accept();
  std::optional<ConnectionId> register_session(const std::shared_ptr<RelaySession>& session);
  void session_closed(const ConnectionId& id);

  boost::asio::ip::tcp::acceptor acceptor_;
  Router router_;
  std::unordered_map<ConnectionId, std::shared_ptr<RelaySession>> sessions_;
  // Session being registered; receives the greeting sent from inside on_connect.
  std::shared_ptr<RelaySession> registering_;
  bool stopped_ = false;
};

} // namespace relay
