#pragma once

#include "common/framing.hpp"
#include "src/pylon/transport.h"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pylon {

struct WsUrl {
  std::string host;
  uint16_t port = 80;
  std::string target = "/";
};

// ws://host[:port][/path]; wss is not supported.
std::optional<WsUrl> parse_ws_url(std::string_view url);

class WsTransport : public Transport, public std::enable_shared_from_this<WsTransport> {
 public:
  using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  WsTransport(boost::asio::io_context& io, WsUrl url);

  void open(std::shared_ptr<TransportEvents> events) override;
  void send(std::string text) override;
  void close() override;

 private:
  void on_resolve(const boost::beast::error_code& ec, boost::asio::ip::tcp::resolver::results_type results);
  void on_connect(const boost::beast::error_code& ec, const boost::asio::ip::tcp::endpoint& ep);
  void on_handshake(const boost::beast::error_code& ec);
  void do_read();
  void fail(const std::string& what);
  void notify_close();

  WsUrl url_;
  boost::asio::ip::tcp::resolver resolver_;
  WsStream ws_;
  boost::asio::steady_timer close_timer_;
  std::shared_ptr<boost::beast::flat_buffer> read_buffer_;
  std::shared_ptr<common::TextWriteQueue<WsStream>> writer_;
  std::shared_ptr<TransportEvents> events_;
  bool open_ = false;
  bool closing_ = false;
  bool closed_ = false;
};

} // namespace pylon
