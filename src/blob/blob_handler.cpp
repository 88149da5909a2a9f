#include "src/blob/blob_handler.h"

#include "common/envelope.hpp"
#include "common/util.hpp"

#include <fstream>
#include <initializer_list>
#include <iterator>
#include <system_error>
#include <utility>

namespace blob {

using common::json;
namespace fs = std::filesystem;

BlobHandler::BlobHandler(fs::path uploads_dir) : uploads_dir_(std::move(uploads_dir)) {}

bool BlobHandler::is_blob_message(std::string_view type) {
  return type == "blob_start" || type == "blob_chunk" || type == "blob_end" || type == "blob_request";
}

BlobHandler::Result BlobHandler::handle(const std::string& owner, const json& msg) {
  const auto type = common::message_type(msg).value_or("");
  const json& payload = common::payload_of(msg);
  if (type == "blob_start") return on_start(owner, payload);
  if (type == "blob_chunk") return on_chunk(owner, payload);
  if (type == "blob_end") return on_end(owner, payload);
  if (type == "blob_request") return on_request(payload);
  return {};
}

BlobHandler::Result BlobHandler::on_start(const std::string& owner, const json& payload) {
  Result r;
  std::string err;
  const auto meta = parse_start(payload, &err);
  if (!meta) {
    common::log_warn("blob_start from " + owner + " rejected: " + err);
    BlobAck ack;
    ack.blob_id = common::string_field(payload, "blobId").value_or("");
    ack.error = BlobError::invalid_start;
    r.replies.push_back(ack.to_message());
    return r;
  }

  if (meta->same_device && !meta->local_path.empty()) {
    std::error_code ec;
    const fs::path local(meta->local_path);
    if (fs::is_regular_file(local, ec)) {
      SavedBlob saved;
      saved.blob_id = meta->blob_id;
      saved.path = local;
      saved.mime = meta->mime;
      saved.size = fs::file_size(local, ec);
      saved.context = meta->context;
      r.saved = std::move(saved);
      BlobAck ack;
      ack.blob_id = meta->blob_id;
      ack.success = true;
      r.replies.push_back(ack.to_message());
      common::log("blob " + meta->blob_id + " same-device shortcut: " + local.string());
      return r;
    }
  }

  const auto e = receiver_.on_start(owner, *meta);
  if (e != BlobError::none) {
    BlobAck ack;
    ack.blob_id = meta->blob_id;
    ack.error = e;
    r.replies.push_back(ack.to_message());
  }
  return r;
}

BlobHandler::Result BlobHandler::on_chunk(const std::string& owner, const json& payload) {
  const auto e = receiver_.on_chunk(owner, payload);
  if (e != BlobError::none) {
    common::log_warn("blob_chunk from " + owner + " ignored: " + blob_error_name(e));
  }
  return {};
}

BlobHandler::Result BlobHandler::on_end(const std::string& owner, const json& payload) {
  Result r;
  auto end = receiver_.on_end(owner, payload);
  if (end.blob) {
    SavedBlob saved;
    std::string err;
    if (save(*end.blob, &saved, &err)) {
      r.saved = std::move(saved);
    } else {
      common::log_error("blob " + end.ack.blob_id + " not saved: " + err);
      end.ack.success = false;
      end.ack.error = BlobError::write_failed;
    }
  }
  r.replies.push_back(end.ack.to_message());
  return r;
}

BlobHandler::Result BlobHandler::on_request(const json& payload) {
  Result r;
  BlobMeta meta;
  meta.blob_id = common::string_field(payload, "blobId").value_or(common::generate_id());
  meta.filename = common::string_field(payload, "filename").value_or("");
  if (payload.contains("context") && payload["context"].is_object()) meta.context = payload["context"];

  std::error_code ec;
  fs::path source;
  if (const auto local = common::string_field(payload, "localPath"); local && fs::is_regular_file(*local, ec)) {
    source = *local;
  } else if (!meta.filename.empty()) {
    for (const fs::path& candidate : {target_path(meta), uploads_dir_ / sanitize_filename(meta.filename)}) {
      if (fs::is_regular_file(candidate, ec)) {
        source = candidate;
        break;
      }
    }
  }

  auto not_found = [&]() {
    common::log_warn("blob_request " + meta.blob_id + ": file not found (" + meta.filename + ")");
    BlobAck ack;
    ack.blob_id = meta.blob_id;
    ack.error = BlobError::not_found;
    r.replies.push_back(ack.to_message());
    return r;
  };
  if (source.empty()) return not_found();

  const auto size = fs::file_size(source, ec);
  if (ec || size > kMaxBlobSize) return not_found();
  std::ifstream in(source, std::ios::binary);
  if (!in) return not_found();
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (meta.filename.empty()) meta.filename = source.filename().string();

  r.replies = packetize_blob(std::move(meta), data);
  common::log("blob_request served " + source.string() + " (" + std::to_string(data.size()) + " bytes)");
  return r;
}

fs::path BlobHandler::target_path(const BlobMeta& meta) const {
  std::string conversation = "misc";
  if (meta.context.is_object() && meta.context.contains("conversationId")) {
    const auto& cid = meta.context["conversationId"];
    if (cid.is_number_integer()) {
      conversation = std::to_string(cid.get<long long>());
    } else if (cid.is_string() && !cid.get<std::string>().empty()) {
      conversation = sanitize_filename(cid.get<std::string>());
    }
  }
  return uploads_dir_ / conversation / sanitize_filename(meta.filename);
}

bool BlobHandler::save(const CompletedBlob& blob, SavedBlob* out, std::string* out_error) const {
  const fs::path path = target_path(blob.meta);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    if (out_error) *out_error = "failed to create directory: " + path.parent_path().string();
    return false;
  }
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    if (out_error) *out_error = "failed to open " + path.string();
    return false;
  }
  f.write(reinterpret_cast<const char*>(blob.bytes.data()), static_cast<std::streamsize>(blob.bytes.size()));
  if (!f) {
    if (out_error) *out_error = "failed to write " + path.string();
    return false;
  }

  out->blob_id = blob.meta.blob_id;
  out->path = path;
  out->mime = blob.meta.mime;
  out->size = blob.bytes.size();
  out->context = blob.meta.context;
  common::log("blob " + blob.meta.blob_id + " saved to " + path.string());
  return true;
}

} // namespace blob
