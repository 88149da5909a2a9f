#include "src/identity/device_id.h"

#include "common/util.hpp"

#include <bit>
#include <cmath>

namespace identity {

std::string role_name(Role role) {
  return role == Role::pylon ? "pylon" : "client";
}

std::optional<Role> parse_role(std::string_view s) {
  if (s == "pylon") return Role::pylon;
  if (s == "client") return Role::client;
  return std::nullopt;
}

bool is_valid_pylon_index(int n) {
  return n >= kMinPylonIndex && n <= kMaxPylonIndex;
}

bool is_valid_pylon_index(long long n) {
  return n >= kMinPylonIndex && n <= kMaxPylonIndex;
}

bool is_valid_pylon_index(double n) {
  if (!std::isfinite(n) || std::trunc(n) != n) return false;
  return n >= kMinPylonIndex && n <= kMaxPylonIndex;
}

bool is_valid_client_index(int n) {
  return n >= kMinClientIndex && n <= kMaxClientIndex;
}

bool is_valid_client_index(long long n) {
  return n >= kMinClientIndex && n <= kMaxClientIndex;
}

bool is_valid_client_index(double n) {
  if (!std::isfinite(n) || std::trunc(n) != n) return false;
  return n >= kMinClientIndex && n <= kMaxClientIndex;
}

std::optional<int> parse_device_index(const common::json& j) {
  if (j.is_number_integer()) {
    const auto v = j.get<long long>();
    if (v < 0 || v > 127) return std::nullopt;
    return static_cast<int>(v);
  }
  if (j.is_number_float()) {
    const double d = j.get<double>();
    if (!std::isfinite(d) || std::trunc(d) != d || d < 0 || d > 127) return std::nullopt;
    return static_cast<int>(d);
  }
  if (j.is_string()) {
    const auto v = common::parse_int(j.get<std::string>());
    if (!v || *v < 0 || *v > 127) return std::nullopt;
    return static_cast<int>(*v);
  }
  return std::nullopt;
}

std::optional<int> encode_pylon_id(int env_id, int device_index) {
  if (env_id < 0 || env_id > kMaxEnvId) return std::nullopt;
  if (!is_valid_pylon_index(device_index)) return std::nullopt;
  return (env_id << 5) | device_index;
}

std::optional<int> encode_client_id(int env_id, int device_index) {
  if (env_id < 0 || env_id > kMaxEnvId) return std::nullopt;
  if (!is_valid_client_index(device_index)) return std::nullopt;
  return (env_id << 5) | (1 << 4) | device_index;
}

std::optional<GlobalDeviceId> decode_device_id(long long id) {
  if (id < 0 || id > 127) return std::nullopt;
  GlobalDeviceId out;
  out.env_id = static_cast<int>(id >> 5);
  out.role = ((id >> 4) & 1) ? Role::client : Role::pylon;
  out.device_index = static_cast<int>(id & 0x0F);
  if (out.role == Role::pylon && !is_valid_pylon_index(out.device_index)) return std::nullopt;
  return out;
}

std::optional<int64_t> make_conversation_id(int pylon_global_id, int64_t sequence) {
  if (pylon_global_id < 0 || pylon_global_id > 127) return std::nullopt;
  if (sequence < 0 || sequence > kMaxConversationSeq) return std::nullopt;
  return (static_cast<int64_t>(pylon_global_id) << kConversationSeqBits) | sequence;
}

int64_t extract_pylon_id(int64_t conversation_id) {
  return conversation_id >> kConversationSeqBits;
}

int env_id_of(int pylon_global_id) {
  return pylon_global_id >> 5;
}

std::string env_name_for(int pylon_global_id) {
  if (pylon_global_id < 0) return "release";
  switch (env_id_of(pylon_global_id)) {
    case 1:
      return "stage";
    case 2:
      return "dev";
    default:
      return "release";
  }
}

std::optional<int> ClientIndexAllocator::assign() {
  for (int i = kMinClientIndex; i <= kMaxClientIndex; ++i) {
    if (!is_assigned(i)) {
      bits_ = static_cast<uint16_t>(bits_ | (1u << i));
      return i;
    }
  }
  return std::nullopt;
}

bool ClientIndexAllocator::reserve(int index) {
  if (!is_valid_client_index(index) || is_assigned(index)) return false;
  bits_ = static_cast<uint16_t>(bits_ | (1u << index));
  return true;
}

void ClientIndexAllocator::release(int index) {
  if (!is_valid_client_index(index)) return;
  bits_ = static_cast<uint16_t>(bits_ & ~(1u << index));
}

bool ClientIndexAllocator::is_assigned(int index) const {
  if (!is_valid_client_index(index)) return false;
  return (bits_ >> index) & 1u;
}

std::vector<int> ClientIndexAllocator::assigned() const {
  std::vector<int> out;
  for (int i = kMinClientIndex; i <= kMaxClientIndex; ++i) {
    if (is_assigned(i)) out.push_back(i);
  }
  return out;
}

std::size_t ClientIndexAllocator::size() const {
  return static_cast<std::size_t>(std::popcount(bits_));
}

} // namespace identity
