#include "src/pylon/ws_transport.h"

#include "common/util.hpp"

#include <chrono>
#include <utility>

namespace pylon {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(10);
constexpr auto kCloseGrace = std::chrono::seconds(2);

} // namespace

std::optional<WsUrl> parse_ws_url(std::string_view url) {
  url = common::trim(url);
  constexpr std::string_view kScheme = "ws://";
  if (url.substr(0, kScheme.size()) != kScheme) return std::nullopt;
  url.remove_prefix(kScheme.size());

  WsUrl out;
  const auto slash = url.find('/');
  std::string_view authority = url.substr(0, slash);
  if (slash != std::string_view::npos) out.target = std::string(url.substr(slash));

  std::string_view host = authority;
  if (!authority.empty() && authority.front() == '[') {
    const auto rb = authority.find(']');
    if (rb == std::string_view::npos) return std::nullopt;
    host = authority.substr(1, rb - 1);
    const auto rest = authority.substr(rb + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') return std::nullopt;
      const auto p = common::parse_port(rest.substr(1));
      if (!p) return std::nullopt;
      out.port = *p;
    }
  } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    const auto p = common::parse_port(authority.substr(colon + 1));
    if (!p) return std::nullopt;
    out.port = *p;
  }
  if (host.empty()) return std::nullopt;
  out.host = std::string(host);
  return out;
}

WsTransport::WsTransport(boost::asio::io_context& io, WsUrl url)
    : url_(std::move(url)),
      resolver_(io),
      ws_(io),
      close_timer_(io),
      read_buffer_(std::make_shared<beast::flat_buffer>()) {}

void WsTransport::open(std::shared_ptr<TransportEvents> events) {
  events_ = std::move(events);
  auto self = shared_from_this();
  resolver_.async_resolve(url_.host, std::to_string(url_.port),
                          [self](const beast::error_code& ec, tcp::resolver::results_type results) {
                            self->on_resolve(ec, std::move(results));
                          });
}

void WsTransport::on_resolve(const beast::error_code& ec, tcp::resolver::results_type results) {
  if (ec) return fail("resolve " + url_.host + ": " + ec.message());
  if (closing_) return notify_close();
  beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
  auto self = shared_from_this();
  beast::get_lowest_layer(ws_).async_connect(
      results, [self](const beast::error_code& ec, const tcp::endpoint& ep) { self->on_connect(ec, ep); });
}

void WsTransport::on_connect(const beast::error_code& ec, const tcp::endpoint& ep) {
  if (ec) return fail("connect " + url_.host + ":" + std::to_string(url_.port) + ": " + ec.message());
  if (closing_) return notify_close();

  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::request_type& req) { req.set(http::field::user_agent, "pylon-relay-client"); }));
  ws_.read_message_max(common::kMaxMessageSize);

  const std::string host = url_.host + ":" + std::to_string(ep.port());
  auto self = shared_from_this();
  ws_.async_handshake(host, url_.target, [self](const beast::error_code& ec) { self->on_handshake(ec); });
}

void WsTransport::on_handshake(const beast::error_code& ec) {
  if (ec) return fail("websocket handshake: " + ec.message());
  if (closing_) return notify_close();
  open_ = true;
  writer_ = std::make_shared<common::TextWriteQueue<WsStream>>(ws_);
  do_read();
  if (events_) events_->on_open();
}

void WsTransport::do_read() {
  auto self = shared_from_this();
  common::async_read_text(ws_, read_buffer_, [self](const beast::error_code& ec, std::string text) {
    if (ec) {
      if (!common::is_benign_close(ec)) {
        if (self->events_) self->events_->on_error("read: " + ec.message());
      }
      self->notify_close();
      return;
    }
    if (self->events_) self->events_->on_message(std::move(text));
    if (!self->closed_) self->do_read();
  });
}

void WsTransport::send(std::string text) {
  if (!open_ || closing_ || !writer_) return;
  writer_->send(std::move(text));
}

void WsTransport::close() {
  if (closing_ || closed_) return;
  closing_ = true;
  if (!open_) {
    // Still resolving/connecting/handshaking: abort the pending step.
    resolver_.cancel();
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
    return;
  }
  writer_->shutdown();
  // A dead peer never answers the close frame; cut the socket after a grace period.
  close_timer_.expires_after(kCloseGrace);
  auto self = shared_from_this();
  close_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || self->closed_) return;
    beast::error_code ignored;
    beast::get_lowest_layer(self->ws_).socket().close(ignored);
  });
}

void WsTransport::fail(const std::string& what) {
  if (!closing_ && events_) events_->on_error(what);
  notify_close();
}

void WsTransport::notify_close() {
  if (closed_) return;
  closed_ = true;
  open_ = false;
  close_timer_.cancel();
  if (writer_) writer_->abandon();
  auto events = std::move(events_);
  if (events) events->on_close();
}

} // namespace pylon
