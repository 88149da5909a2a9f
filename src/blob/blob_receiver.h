#pragma once

#include "common/json.hpp"
#include "src/blob/blob_protocol.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace blob {

struct CompletedBlob {
  BlobMeta meta;
  std::string owner;
  std::vector<uint8_t> bytes;
};

// Reassembles transfers by chunk index. Buffers are keyed by blobId and
// released on blob_end (either outcome) or when the owner goes away.
class BlobReceiver {
 public:
  struct EndResult {
    BlobAck ack;
    std::optional<CompletedBlob> blob;
  };

  // A repeated blob_start for a live blobId restarts that transfer.
  BlobError on_start(const std::string& owner, const BlobMeta& meta);
  BlobError on_chunk(const std::string& owner, const common::json& payload);
  EndResult on_end(const std::string& owner, const common::json& payload);

  std::size_t drop_owner(const std::string& owner);
  bool active(const std::string& blob_id) const;
  std::size_t active_count() const { return partial_.size(); }
  std::optional<uint32_t> received_chunks(const std::string& blob_id) const;

 private:
  struct Partial {
    BlobMeta meta;
    std::string owner;
    std::vector<std::vector<uint8_t>> chunks;
    std::vector<bool> have;
    uint32_t have_count = 0;
  };

  std::unordered_map<std::string, Partial> partial_;
};

} // namespace blob
