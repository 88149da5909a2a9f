#pragma once

#include <functional>
#include <memory>
#include <string>

namespace pylon {

// Events from one transport attempt. After open() exactly one on_close()
// follows, whether or not on_open() fired; on_error() may precede it.
class TransportEvents {
 public:
  virtual ~TransportEvents() = default;
  virtual void on_open() = 0;
  virtual void on_message(std::string text) = 0;
  virtual void on_close() = 0;
  virtual void on_error(const std::string& what) = 0;
};

// One outbound connection attempt. Not reused after close.
class Transport {
 public:
  virtual ~Transport() = default;
  virtual void open(std::shared_ptr<TransportEvents> events) = 0;
  virtual void send(std::string text) = 0;
  virtual void close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<Transport>()>;

} // namespace pylon
