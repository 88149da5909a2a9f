#pragma once

#include "common/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace identity {

enum class Role { pylon, client };

constexpr int kMinPylonIndex = 1;
constexpr int kMaxPylonIndex = 15;
constexpr int kMinClientIndex = 0;
constexpr int kMaxClientIndex = 15;
constexpr int kMaxEnvId = 3;

// ConversationId = (pylonGlobalId << 17) | sequence
constexpr int kConversationSeqBits = 17;
constexpr int64_t kMaxConversationSeq = (int64_t{1} << kConversationSeqBits) - 1;

std::string role_name(Role role);
std::optional<Role> parse_role(std::string_view s);

bool is_valid_pylon_index(int n);
bool is_valid_pylon_index(long long n);
bool is_valid_pylon_index(double n);
bool is_valid_client_index(int n);
bool is_valid_client_index(long long n);
bool is_valid_client_index(double n);

// Accepts integral JSON numbers and integral decimal strings ("3").
std::optional<int> parse_device_index(const common::json& j);

// 7-bit global id: envId(2) | roleBit(1) | deviceIndex(4), roleBit 1 = client.
struct GlobalDeviceId {
  int env_id = 0;
  Role role = Role::pylon;
  int device_index = 0;
};

std::optional<int> encode_pylon_id(int env_id, int device_index);
std::optional<int> encode_client_id(int env_id, int device_index);
std::optional<GlobalDeviceId> decode_device_id(long long id);

std::optional<int64_t> make_conversation_id(int pylon_global_id, int64_t sequence);
int64_t extract_pylon_id(int64_t conversation_id);
int env_id_of(int pylon_global_id);
// "release" | "stage" | "dev"; unknown env ids display as "release".
std::string env_name_for(int pylon_global_id);

// Client index pool: 16 slots as a bitmap, smallest free index first.
class ClientIndexAllocator {
 public:
  // nullopt when all 16 indices are taken (no_available_index).
  std::optional<int> assign();
  // Claims a specific index; false when out of range or already taken.
  bool reserve(int index);
  // Idempotent; out-of-range values are ignored.
  void release(int index);

  bool is_assigned(int index) const;
  std::vector<int> assigned() const;
  std::size_t size() const;

 private:
  uint16_t bits_ = 0;
};

} // namespace identity
