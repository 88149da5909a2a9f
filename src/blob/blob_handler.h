#pragma once

#include "common/json.hpp"
#include "src/blob/blob_receiver.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blob {

struct SavedBlob {
  std::string blob_id;
  std::filesystem::path path;
  std::string mime;
  uint64_t size = 0;
  common::json context;
};

// Pylon-side endpoint of the transfer protocol: stores uploads under
// <uploads>/<conversationId>/<filename> and serves blob_request downloads.
class BlobHandler {
 public:
  struct Result {
    std::vector<common::json> replies; // to the sender, in order
    std::optional<SavedBlob> saved;
  };

  explicit BlobHandler(std::filesystem::path uploads_dir);

  static bool is_blob_message(std::string_view type);

  Result handle(const std::string& owner, const common::json& msg);
  void drop_owner(const std::string& owner) { receiver_.drop_owner(owner); }

  const std::filesystem::path& uploads_dir() const { return uploads_dir_; }
  const BlobReceiver& receiver() const { return receiver_; }

 private:
  Result on_start(const std::string& owner, const common::json& payload);
  Result on_chunk(const std::string& owner, const common::json& payload);
  Result on_end(const std::string& owner, const common::json& payload);
  Result on_request(const common::json& payload);

  std::filesystem::path target_path(const BlobMeta& meta) const;
  bool save(const CompletedBlob& blob, SavedBlob* out, std::string* out_error) const;

  std::filesystem::path uploads_dir_;
  BlobReceiver receiver_;
};

} // namespace blob
