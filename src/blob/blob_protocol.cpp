#include "src/blob/blob_protocol.h"

#include "common/crypto.hpp"
#include "common/envelope.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace blob {

using common::json;

std::string blob_error_name(BlobError e) {
  switch (e) {
    case BlobError::none:
      return "none";
    case BlobError::invalid_start:
      return "invalid_start";
    case BlobError::unknown_transfer:
      return "unknown_transfer";
    case BlobError::invalid_chunk:
      return "invalid_chunk";
    case BlobError::incomplete_chunks:
      return "incomplete_chunks";
    case BlobError::size_mismatch:
      return "size_mismatch";
    case BlobError::checksum_mismatch:
      return "checksum_mismatch";
    case BlobError::not_found:
      return "not_found";
    case BlobError::write_failed:
      return "write_failed";
  }
  return "unknown";
}

uint32_t chunk_count(uint64_t total_size, std::size_t chunk_size) {
  if (chunk_size == 0) return 0;
  return static_cast<uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

json make_start(const BlobMeta& meta) {
  json p;
  p["blobId"] = meta.blob_id;
  p["filename"] = meta.filename;
  p["mimeType"] = meta.mime;
  p["totalSize"] = meta.total_size;
  p["chunkSize"] = meta.chunk_size;
  p["totalChunks"] = meta.total_chunks;
  p["encoding"] = "base64";
  if (!meta.context.is_null()) p["context"] = meta.context;
  if (meta.same_device) p["sameDevice"] = true;
  if (!meta.local_path.empty()) p["localPath"] = meta.local_path;
  return common::make_message("blob_start", std::move(p));
}

json make_chunk(std::string_view blob_id, uint32_t index, std::span<const uint8_t> bytes) {
  json p;
  p["blobId"] = std::string(blob_id);
  p["index"] = index;
  p["data"] = common::base64_encode(bytes);
  p["size"] = bytes.size();
  return common::make_message("blob_chunk", std::move(p));
}

json make_end(std::string_view blob_id, uint32_t total_chunks, std::string_view checksum) {
  json p;
  p["blobId"] = std::string(blob_id);
  p["totalChunks"] = total_chunks;
  p["checksum"] = std::string(checksum);
  return common::make_message("blob_end", std::move(p));
}

std::vector<json> packetize_blob(BlobMeta meta, std::span<const uint8_t> data, std::size_t chunk_size) {
  std::vector<json> out;
  if (chunk_size == 0) return out;
  meta.total_size = data.size();
  meta.chunk_size = static_cast<uint32_t>(chunk_size);
  meta.total_chunks = chunk_count(data.size(), chunk_size);
  if (meta.mime.empty()) meta.mime = mime_type_for(meta.filename);

  out.reserve(meta.total_chunks + 2);
  out.push_back(make_start(meta));
  std::size_t off = 0;
  for (uint32_t i = 0; i < meta.total_chunks; ++i) {
    const std::size_t take = std::min(chunk_size, data.size() - off);
    out.push_back(make_chunk(meta.blob_id, i, data.subspan(off, take)));
    off += take;
  }
  out.push_back(make_end(meta.blob_id, meta.total_chunks, common::sha256_tagged(data)));
  return out;
}

std::optional<BlobMeta> parse_start(const json& payload, std::string* out_error) {
  auto fail = [&](const char* msg) -> std::optional<BlobMeta> {
    if (out_error) *out_error = msg;
    return std::nullopt;
  };

  BlobMeta meta;
  const auto id = common::string_field(payload, "blobId");
  if (!id || id->empty()) return fail("missing/invalid field: blobId");
  meta.blob_id = *id;
  meta.filename = common::string_field(payload, "filename").value_or("blob");

  const auto total = common::int_field(payload, "totalSize");
  if (!total || *total < 0) return fail("missing/invalid field: totalSize");
  if (static_cast<uint64_t>(*total) > kMaxBlobSize) return fail("blob too large");
  meta.total_size = static_cast<uint64_t>(*total);

  const auto chunk = common::int_field(payload, "chunkSize").value_or(static_cast<long long>(kChunkSize));
  if (chunk <= 0 || static_cast<uint64_t>(chunk) > kChunkSize) return fail("invalid chunkSize");
  meta.chunk_size = static_cast<uint32_t>(chunk);

  const uint32_t expected = chunk_count(meta.total_size, meta.chunk_size);
  const auto chunks = common::int_field(payload, "totalChunks");
  if (chunks && *chunks != static_cast<long long>(expected)) return fail("totalChunks does not match totalSize");
  meta.total_chunks = expected;

  if (auto enc = common::string_field(payload, "encoding"); enc && *enc != "base64") {
    return fail("unsupported encoding");
  }

  meta.mime = common::string_field(payload, "mimeType")
                  .value_or(common::string_field(payload, "mime").value_or(mime_type_for(meta.filename)));
  if (payload.contains("context") && payload["context"].is_object()) meta.context = payload["context"];
  meta.same_device = common::bool_field(payload, "sameDevice").value_or(false);
  meta.local_path = common::string_field(payload, "localPath").value_or("");
  return meta;
}

json BlobAck::to_message() const {
  json p;
  p["blobId"] = blob_id;
  p["success"] = success;
  if (!success) p["error"] = blob_error_name(error);
  if (!missing_chunks.empty()) p["missingChunks"] = missing_chunks;
  return common::make_message("blob_ack", std::move(p));
}

std::string mime_type_for(std::string_view filename) {
  const auto dot = filename.rfind('.');
  if (dot == std::string_view::npos) return "application/octet-stream";
  std::string ext(filename.substr(dot));
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  static const std::pair<const char*, const char*> kTable[] = {
      {".jpg", "image/jpeg"},   {".jpeg", "image/jpeg"},     {".png", "image/png"},
      {".gif", "image/gif"},    {".webp", "image/webp"},     {".svg", "image/svg+xml"},
      {".bmp", "image/bmp"},    {".md", "text/markdown"},    {".txt", "text/plain"},
      {".log", "text/plain"},   {".json", "application/json"}, {".xml", "application/xml"},
      {".yaml", "text/yaml"},   {".yml", "text/yaml"},       {".pdf", "application/pdf"},
  };
  for (const auto& [e, mime] : kTable) {
    if (ext == e) return mime;
  }
  return "application/octet-stream";
}

std::string sanitize_filename(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const unsigned char uc = static_cast<unsigned char>(c);
    switch (c) {
      case '<':
      case '>':
      case ':':
      case '"':
      case '/':
      case '\\':
      case '|':
      case '?':
      case '*':
        out.push_back('_');
        break;
      default:
        out.push_back(uc < 0x20 ? '_' : c);
    }
  }
  if (out.empty() || out == "." || out == "..") return "file";
  return out;
}

} // namespace blob
