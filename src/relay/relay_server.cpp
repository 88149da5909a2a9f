#include "src/relay/relay_server.h"

#include "common/util.hpp"

#include <chrono>
#include <utility>
#include <vector>

namespace relay {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;
using common::json;

namespace {

constexpr auto kHandshakeTimeout = std::chrono::seconds(30);

} // namespace

std::string forwarded_client_ip(std::string_view header, std::string_view fallback) {
  const auto comma = header.find(',');
  const auto first = common::trim(header.substr(0, comma));
  if (first.empty()) return std::string(fallback);
  return std::string(first);
}

RelaySession::RelaySession(RelayServer& server, tcp::socket socket)
    : server_(server), ws_(std::move(socket)), read_buffer_(std::make_shared<beast::flat_buffer>()) {}

void RelaySession::start() {
  beast::error_code ec;
  const auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
  ip_ = ec ? "unknown" : ep.address().to_string();

  beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
  auto self = shared_from_this();
  http::async_read(beast::get_lowest_layer(ws_), http_buffer_, req_,
                   [self](const beast::error_code& ec, std::size_t) { self->on_request(ec); });
}

void RelaySession::on_request(const beast::error_code& ec) {
  if (ec) {
    if (!common::is_benign_close(ec) && ec != http::error::end_of_stream) {
      common::log_warn("http read error from " + ip_ + ": " + ec.message());
    }
    return;
  }
  if (!websocket::is_upgrade(req_)) {
    reject_http();
    return;
  }

  const auto xff = req_.find("X-Forwarded-For");
  if (xff != req_.end()) ip_ = forwarded_client_ip(std::string_view(xff->value().data(), xff->value().size()), ip_);

  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.read_message_max(common::kMaxMessageSize);
  auto self = shared_from_this();
  ws_.async_accept(req_, [self](const beast::error_code& ec) { self->on_accept(ec); });
}

void RelaySession::reject_http() {
  auto res = std::make_shared<http::response<http::string_body>>(http::status::upgrade_required, req_.version());
  res->set(http::field::content_type, "text/plain");
  res->set(http::field::upgrade, "websocket");
  res->body() = "WebSocket upgrade required\n";
  res->keep_alive(false);
  res->prepare_payload();
  auto self = shared_from_this();
  http::async_write(beast::get_lowest_layer(ws_), *res, [self, res](const beast::error_code&, std::size_t) {
    beast::error_code ignored;
    beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    beast::get_lowest_layer(self->ws_).close();
  });
}

void RelaySession::on_accept(const beast::error_code& ec) {
  if (ec) {
    common::log_warn("websocket handshake failed from " + ip_ + ": " + ec.message());
    return;
  }
  writer_ = std::make_shared<common::TextWriteQueue<WsStream>>(ws_);
  const auto id = server_.register_session(shared_from_this());
  if (!id) {
    auto self = shared_from_this();
    ws_.async_close(websocket::close_reason(websocket::close_code::policy_error, "IP not allowed"),
                    [self](const beast::error_code&) {});
    return;
  }
  id_ = *id;
  do_read();
}

void RelaySession::do_read() {
  auto self = shared_from_this();
  common::async_read_text(ws_, read_buffer_, [self](const beast::error_code& ec, std::string text) {
    if (ec) {
      if (!common::is_benign_close(ec)) {
        common::log_warn("read error on " + self->id_ + ": " + ec.message());
      }
      self->finish();
      return;
    }
    self->server_.router().handle_message(self->id_, text);
    self->do_read();
  });
}

void RelaySession::send(const json& msg) {
  if (writer_) writer_->send(msg);
}

void RelaySession::close() {
  if (writer_) writer_->shutdown();
}

void RelaySession::finish() {
  if (finished_) return;
  finished_ = true;
  if (writer_) writer_->abandon();
  server_.session_closed(id_);
}

RelayServer::RelayServer(boost::asio::io_context& io, RouterConfig cfg)
    : acceptor_(io), router_(std::move(cfg), *this) {}

void RelayServer::listen(const tcp::endpoint& ep) {
  acceptor_.open(ep.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  common::log("relay listening on " + common::endpoint_to_string(acceptor_.local_endpoint()) +
              " (default route: " + default_route_name(router_.config().default_route) + ")");
  do_accept();
}

void RelayServer::stop() {
  if (stopped_) return;
  stopped_ = true;
  boost::system::error_code ignored;
  acceptor_.close(ignored);
  std::vector<std::shared_ptr<RelaySession>> live;
  live.reserve(sessions_.size());
  for (const auto& [id, s] : sessions_) live.push_back(s);
  for (const auto& s : live) s->close();
}

uint16_t RelayServer::local_port() const {
  boost::system::error_code ec;
  const auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void RelayServer::do_accept() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        common::log_error("accept error: " + ec.message());
      }
      return;
    }
    std::make_shared<RelaySession>(*this, std::move(socket))->start();
    do_accept();
  });
}

std::optional<ConnectionId> RelayServer::register_session(const std::shared_ptr<RelaySession>& session) {
  if (stopped_) return std::nullopt;
  registering_ = session;
  const auto id = router_.on_connect(session->ip());
  registering_.reset();
  if (id) sessions_.emplace(*id, session);
  return id;
}

void RelayServer::session_closed(const ConnectionId& id) {
  if (id.empty()) return;
  sessions_.erase(id);
  router_.on_disconnect(id);
}

void RelayServer::deliver(const ConnectionId& to, const json& msg) {
  auto it = sessions_.find(to);
  if (it == sessions_.end()) {
    if (!registering_) return;
    it = sessions_.emplace(to, registering_).first;
  }
  it->second->send(msg);
}

void RelayServer::close(const ConnectionId& id) {
  const auto it = sessions_.find(id);
  if (it != sessions_.end()) it->second->close();
}

} // namespace relay
