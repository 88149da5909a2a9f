#include "src/pylon/agent_adapter.h"

#include "common/json.hpp"

#include <utility>
#include <vector>

namespace pylon {

using common::json;

void EchoAgent::send(int64_t entity_id, const std::string& text, AgentSink& sink) {
  ++requests_;
  last_text_ = text;

  std::vector<json> events;
  events.push_back(json{{"type", "state"}, {"state", "working"}});
  events.push_back(json{{"type", "text"}, {"text", "echo: " + text}});
  events.push_back(json{{"type", "result"}, {"numTurns", 1}, {"durationMs", 0}});
  events.push_back(json{{"type", "state"}, {"state", "idle"}});

  boost::asio::post(io_, [&sink, entity_id, events = std::move(events)] {
    for (const auto& e : events) sink.on_agent_event(entity_id, e);
  });
}

} // namespace pylon
