#pragma once

#include "common/json.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <string>

namespace pylon {

// Receives the agent's output for one conversation entity.
class AgentSink {
 public:
  virtual ~AgentSink() = default;
  virtual void on_agent_event(int64_t entity_id, const common::json& event) = 0;
};

// Boundary to the code-assistant agent. Events may be delivered later, on
// the io_context thread, and always end with a `state` event of `idle`.
class AgentAdapter {
 public:
  virtual ~AgentAdapter() = default;
  virtual void send(int64_t entity_id, const std::string& text, AgentSink& sink) = 0;
};

// Stand-in agent: answers every message with its own text.
class EchoAgent : public AgentAdapter {
 public:
  explicit EchoAgent(boost::asio::io_context& io) : io_(io) {}

  void send(int64_t entity_id, const std::string& text, AgentSink& sink) override;

  uint64_t requests() const { return requests_; }
  const std::string& last_text() const { return last_text_; }

 private:
  boost::asio::io_context& io_;
  uint64_t requests_ = 0;
  std::string last_text_;
};

} // namespace pylon
