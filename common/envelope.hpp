#pragma once

#include "common/json.hpp"
#include "common/util.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace common {

// Envelope: {type, payload?, timestamp, from?, to?, broadcast?, requestId?}
inline json make_message(std::string_view type, json payload = json::object()) {
  json j;
  j["type"] = std::string(type);
  j["payload"] = std::move(payload);
  j["timestamp"] = now_ms();
  return j;
}

inline std::optional<std::string> string_field(const json& j, const char* key) {
  if (!j.is_object()) return std::nullopt;
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

inline std::optional<bool> bool_field(const json& j, const char* key) {
  if (!j.is_object()) return std::nullopt;
  const auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) return std::nullopt;
  return it->get<bool>();
}

inline std::optional<long long> int_field(const json& j, const char* key) {
  if (!j.is_object()) return std::nullopt;
  const auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) return std::nullopt;
  return it->get<long long>();
}

inline std::optional<std::string> message_type(const json& msg) {
  return string_field(msg, "type");
}

// Payload object, or an empty object when absent or not an object.
inline const json& payload_of(const json& msg) {
  static const json kEmpty = json::object();
  if (!msg.is_object()) return kEmpty;
  const auto it = msg.find("payload");
  if (it == msg.end() || !it->is_object()) return kEmpty;
  return *it;
}

inline json make_error(std::string_view error, std::string_view detail = {}) {
  json payload;
  payload["error"] = std::string(error);
  if (!detail.empty()) payload["message"] = std::string(detail);
  return make_message("error", std::move(payload));
}

} // namespace common
