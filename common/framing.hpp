#pragma once

#include "common/json.hpp"
#include "common/util.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace common {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

// One JSON object per WebSocket text frame.
static constexpr std::size_t kMaxMessageSize = 4 * 1024 * 1024;

inline std::string to_text(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline std::optional<json> parse_json_text(std::string_view text) {
  try {
    return json::parse(text);
  } catch (const json::parse_error&) {
    return std::nullopt;
  }
}

inline bool is_benign_close(const beast::error_code& ec) {
  return ec == boost::asio::error::operation_aborted || ec == boost::asio::error::eof ||
         ec == websocket::error::closed || ec == boost::asio::error::connection_reset;
}

template <class WebSocketStream, class Handler>
inline void async_read_text(WebSocketStream& ws,
                            std::shared_ptr<beast::flat_buffer> buf,
                            Handler&& handler) {
  ws.async_read(*buf,
                [buf, handler = std::forward<Handler>(handler)](const beast::error_code& ec,
                                                                std::size_t) mutable {
                  if (ec) return handler(ec, std::string{});
                  std::string text = beast::buffers_to_string(buf->data());
                  buf->consume(buf->size());
                  handler(ec, std::move(text));
                });
}

// Serializes writes on one WebSocket stream. Messages go out in send order;
// shutdown() lets the queue drain before the close frame is sent.
template <class WebSocketStream>
class TextWriteQueue : public std::enable_shared_from_this<TextWriteQueue<WebSocketStream>> {
 public:
  explicit TextWriteQueue(WebSocketStream& ws) : ws_(ws) {}

  void send(std::string text) {
    if (closing_ || failed_) return;
    pending_.push_back(std::move(text));
    if (writing_) return;
    writing_ = true;
    do_write();
  }

  void send(const json& msg) { send(to_text(msg)); }

  void shutdown() {
    if (closing_) return;
    closing_ = true;
    if (!writing_) do_close();
  }

  // Drop anything queued; used when the socket is already gone.
  void abandon() {
    failed_ = true;
    pending_.clear();
  }

 private:
  void do_write() {
    if (pending_.empty() || failed_) {
      writing_ = false;
      if (closing_) do_close();
      return;
    }
    auto self = this->shared_from_this();
    auto payload = std::make_shared<std::string>(std::move(pending_.front()));
    pending_.pop_front();
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(*payload),
                    [self, payload](const beast::error_code& ec, std::size_t) {
                      if (ec) {
                        if (!is_benign_close(ec)) log_warn(std::string("websocket write error: ") + ec.message());
                        self->abandon();
                        self->writing_ = false;
                        return;
                      }
                      self->do_write();
                    });
  }

  void do_close() {
    if (close_sent_ || failed_) return;
    close_sent_ = true;
    auto self = this->shared_from_this();
    ws_.async_close(websocket::close_code::normal, [self](const beast::error_code& ec) {
      if (ec && !is_benign_close(ec)) log_warn(std::string("websocket close error: ") + ec.message());
    });
  }

  WebSocketStream& ws_;
  std::deque<std::string> pending_;
  bool writing_ = false;
  bool closing_ = false;
  bool close_sent_ = false;
  bool failed_ = false;
};

} // namespace common
