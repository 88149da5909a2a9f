#pragma once

#include "common/json.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blob {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr uint64_t kMaxBlobSize = 256ull * 1024 * 1024;

enum class BlobError {
  none,
  invalid_start,
  unknown_transfer,
  invalid_chunk,
  incomplete_chunks,
  size_mismatch,
  checksum_mismatch,
  not_found,
  write_failed,
};

std::string blob_error_name(BlobError e);

struct BlobMeta {
  std::string blob_id;
  std::string filename;
  std::string mime;
  uint64_t total_size = 0;
  uint32_t total_chunks = 0;
  uint32_t chunk_size = static_cast<uint32_t>(kChunkSize);
  common::json context; // {type: image_upload|file_transfer, conversationId}; null when absent
  bool same_device = false;
  std::string local_path;
};

uint32_t chunk_count(uint64_t total_size, std::size_t chunk_size = kChunkSize);

// blob_start, blob_chunk x N (index order), blob_end with "sha256:<hex>".
std::vector<common::json> packetize_blob(BlobMeta meta,
                                         std::span<const uint8_t> data,
                                         std::size_t chunk_size = kChunkSize);

common::json make_start(const BlobMeta& meta);
common::json make_chunk(std::string_view blob_id, uint32_t index, std::span<const uint8_t> bytes);
common::json make_end(std::string_view blob_id, uint32_t total_chunks, std::string_view checksum);

std::optional<BlobMeta> parse_start(const common::json& payload, std::string* out_error);

struct BlobAck {
  std::string blob_id;
  bool success = false;
  BlobError error = BlobError::none;
  std::vector<uint32_t> missing_chunks;

  common::json to_message() const;
};

std::string mime_type_for(std::string_view filename);
// Replaces <>:"/\|?* and control characters with '_'; never yields "", "." or "..".
std::string sanitize_filename(std::string_view name);

} // namespace blob
