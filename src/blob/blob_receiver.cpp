#include "src/blob/blob_receiver.h"

#include "common/crypto.hpp"
#include "common/envelope.hpp"
#include "common/util.hpp"

#include <utility>

namespace blob {

using common::json;

BlobError BlobReceiver::on_start(const std::string& owner, const BlobMeta& meta) {
  if (meta.blob_id.empty() || meta.total_size > kMaxBlobSize) return BlobError::invalid_start;
  if (meta.chunk_size == 0 || meta.total_chunks != chunk_count(meta.total_size, meta.chunk_size)) {
    return BlobError::invalid_start;
  }
  if (const auto it = partial_.find(meta.blob_id); it != partial_.end() && it->second.owner != owner) {
    common::log_warn("blob " + meta.blob_id + " start from " + owner + " collides with a transfer owned by " +
                     it->second.owner);
    return BlobError::invalid_start;
  }
  Partial p;
  p.meta = meta;
  p.owner = owner;
  p.chunks.resize(meta.total_chunks);
  p.have.assign(meta.total_chunks, false);
  partial_[meta.blob_id] = std::move(p);
  common::log("blob " + meta.blob_id + " start: " + meta.filename + " (" + std::to_string(meta.total_size) +
              " bytes, " + std::to_string(meta.total_chunks) + " chunks)");
  return BlobError::none;
}

BlobError BlobReceiver::on_chunk(const std::string& owner, const json& payload) {
  const auto id = common::string_field(payload, "blobId");
  if (!id) return BlobError::unknown_transfer;
  const auto it = partial_.find(*id);
  if (it == partial_.end() || it->second.owner != owner) return BlobError::unknown_transfer;
  Partial& p = it->second;

  const auto index = common::int_field(payload, "index");
  if (!index || *index < 0 || *index >= static_cast<long long>(p.meta.total_chunks)) return BlobError::invalid_chunk;
  const auto data = common::string_field(payload, "data");
  if (!data) return BlobError::invalid_chunk;
  auto bytes = common::base64_decode(*data);
  if (!bytes || bytes->size() > p.meta.chunk_size) return BlobError::invalid_chunk;

  const auto i = static_cast<std::size_t>(*index);
  if (!p.have[i]) {
    p.have[i] = true;
    p.have_count++;
  }
  p.chunks[i] = std::move(*bytes);
  return BlobError::none;
}

BlobReceiver::EndResult BlobReceiver::on_end(const std::string& owner, const json& payload) {
  EndResult out;
  const auto id = common::string_field(payload, "blobId");
  out.ack.blob_id = id.value_or("");
  if (!id) {
    out.ack.error = BlobError::unknown_transfer;
    return out;
  }
  const auto it = partial_.find(*id);
  if (it == partial_.end() || it->second.owner != owner) {
    out.ack.error = BlobError::unknown_transfer;
    return out;
  }
  Partial p = std::move(it->second);
  partial_.erase(it);

  if (p.have_count < p.meta.total_chunks) {
    for (uint32_t i = 0; i < p.meta.total_chunks; ++i) {
      if (!p.have[i]) out.ack.missing_chunks.push_back(i);
    }
    out.ack.error = BlobError::incomplete_chunks;
    common::log_warn("blob " + *id + " incomplete: " + std::to_string(out.ack.missing_chunks.size()) +
                     " of " + std::to_string(p.meta.total_chunks) + " chunks missing");
    return out;
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(p.meta.total_size);
  for (const auto& c : p.chunks) bytes.insert(bytes.end(), c.begin(), c.end());
  if (bytes.size() != p.meta.total_size) {
    out.ack.error = BlobError::size_mismatch;
    common::log_warn("blob " + *id + " size mismatch: got " + std::to_string(bytes.size()) + " expected " +
                     std::to_string(p.meta.total_size));
    return out;
  }

  if (const auto checksum = common::string_field(payload, "checksum"); checksum && !checksum->empty()) {
    if (*checksum != common::sha256_tagged(bytes)) {
      out.ack.error = BlobError::checksum_mismatch;
      common::log_warn("blob " + *id + " checksum mismatch");
      return out;
    }
  }

  out.ack.success = true;
  CompletedBlob done;
  done.meta = std::move(p.meta);
  done.owner = std::move(p.owner);
  done.bytes = std::move(bytes);
  out.blob = std::move(done);
  common::log("blob " + *id + " complete");
  return out;
}

std::size_t BlobReceiver::drop_owner(const std::string& owner) {
  std::vector<std::string> drop;
  for (const auto& [id, p] : partial_) {
    if (p.owner == owner) drop.push_back(id);
  }
  for (const auto& id : drop) partial_.erase(id);
  if (!drop.empty()) common::log("dropped " + std::to_string(drop.size()) + " partial blob(s) from " + owner);
  return drop.size();
}

bool BlobReceiver::active(const std::string& blob_id) const {
  return partial_.count(blob_id) != 0;
}

std::optional<uint32_t> BlobReceiver::received_chunks(const std::string& blob_id) const {
  const auto it = partial_.find(blob_id);
  if (it == partial_.end()) return std::nullopt;
  return it->second.have_count;
}

} // namespace blob
