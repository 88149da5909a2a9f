#include "common/envelope.hpp"
#include "src/blob/blob_handler.h"
#include "src/blob/blob_protocol.h"
#include "src/blob/blob_receiver.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

using common::json;

std::vector<uint8_t> make_bytes(std::size_t n) {
  std::vector<uint8_t> out(n);
  for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
  return out;
}

blob::BlobMeta meta_for(const std::string& id, const std::string& filename) {
  blob::BlobMeta m;
  m.blob_id = id;
  m.filename = filename;
  return m;
}

std::vector<uint8_t> read_file(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
  namespace fs = std::filesystem;

  assert(blob::chunk_count(0) == 0);
  assert(blob::chunk_count(1) == 1);
  assert(blob::chunk_count(blob::kChunkSize) == 1);
  assert(blob::chunk_count(blob::kChunkSize + 1) == 2);
  assert(blob::mime_type_for("photo.JPG") == "image/jpeg");
  assert(blob::mime_type_for("notes.md") == "text/markdown");
  assert(blob::mime_type_for("noext") == "application/octet-stream");
  assert(blob::sanitize_filename("a/b:c*?.txt") == "a_b_c__.txt");
  assert(blob::sanitize_filename("..") == "file");
  assert(blob::sanitize_filename("") == "file");

  const auto data = make_bytes(200000);
  auto packets = blob::packetize_blob(meta_for("b1", "data.bin"), data);
  // start + 4 chunks + end
  assert(packets.size() == 6);
  assert(packets.front()["type"] == "blob_start");
  assert(common::payload_of(packets.front())["totalChunks"] == 4);
  assert(common::payload_of(packets.front())["encoding"] == "base64");
  assert(packets.back()["type"] == "blob_end");
  const std::string checksum = common::payload_of(packets.back())["checksum"].get<std::string>();
  assert(checksum.rfind("sha256:", 0) == 0);
  assert(checksum.size() == 7 + 64);

  // Reassembly is by index; arrival order does not matter.
  {
    blob::BlobReceiver rx;
    std::string err;
    const auto meta = blob::parse_start(common::payload_of(packets.front()), &err);
    assert(meta);
    assert(rx.on_start("owner", *meta) == blob::BlobError::none);
    std::vector<json> chunks(packets.begin() + 1, packets.end() - 1);
    std::mt19937 rng(99);
    std::shuffle(chunks.begin(), chunks.end(), rng);
    for (const auto& c : chunks) assert(rx.on_chunk("owner", common::payload_of(c)) == blob::BlobError::none);
    // Duplicates count once.
    assert(rx.on_chunk("owner", common::payload_of(chunks[0])) == blob::BlobError::none);
    assert(rx.received_chunks("b1") == 4u);

    const auto end = rx.on_end("owner", common::payload_of(packets.back()));
    assert(end.ack.success);
    assert(end.blob);
    assert(end.blob->bytes == data);
    assert(!rx.active("b1"));
  }

  // Missing chunk.
  {
    blob::BlobReceiver rx;
    const auto meta = blob::parse_start(common::payload_of(packets.front()), nullptr);
    assert(rx.on_start("owner", *meta) == blob::BlobError::none);
    for (std::size_t i = 1; i + 1 < packets.size(); ++i) {
      if (i == 3) continue; // index 2
      assert(rx.on_chunk("owner", common::payload_of(packets[i])) == blob::BlobError::none);
    }
    const auto end = rx.on_end("owner", common::payload_of(packets.back()));
    assert(!end.ack.success);
    assert(end.ack.error == blob::BlobError::incomplete_chunks);
    assert(end.ack.missing_chunks == std::vector<uint32_t>{2});
    const auto msg = end.ack.to_message();
    assert(common::payload_of(msg)["error"] == "incomplete_chunks");
    assert(common::payload_of(msg)["missingChunks"] == json::array({2}));
    assert(!rx.active("b1"));
  }

  // Checksum mismatch discards the buffer.
  {
    blob::BlobReceiver rx;
    const auto meta = blob::parse_start(common::payload_of(packets.front()), nullptr);
    assert(rx.on_start("owner", *meta) == blob::BlobError::none);
    for (std::size_t i = 1; i + 1 < packets.size(); ++i) rx.on_chunk("owner", common::payload_of(packets[i]));
    json end_payload = common::payload_of(packets.back());
    end_payload["checksum"] = "sha256:" + std::string(64, '0');
    const auto end = rx.on_end("owner", end_payload);
    assert(end.ack.error == blob::BlobError::checksum_mismatch);
    assert(!end.blob);
    assert(rx.active_count() == 0);
  }

  // Foreign owners, bad chunks, unknown transfers, owner disconnect.
  {
    blob::BlobReceiver rx;
    const auto meta = blob::parse_start(common::payload_of(packets.front()), nullptr);
    assert(rx.on_start("alice", *meta) == blob::BlobError::none);
    assert(rx.on_chunk("alice", common::payload_of(packets[1])) == blob::BlobError::none);
    assert(rx.on_start("bob", *meta) == blob::BlobError::invalid_start);
    assert(rx.received_chunks(meta->blob_id) == 1u);
    assert(rx.on_chunk("bob", common::payload_of(packets[1])) == blob::BlobError::unknown_transfer);
    json bad = common::payload_of(packets[1]);
    bad["index"] = 4;
    assert(rx.on_chunk("alice", bad) == blob::BlobError::invalid_chunk);
    bad["index"] = 0;
    bad["data"] = "***";
    assert(rx.on_chunk("alice", bad) == blob::BlobError::invalid_chunk);
    assert(rx.on_end("alice", json{{"blobId", "nope"}}).ack.error == blob::BlobError::unknown_transfer);
    assert(rx.drop_owner("bob") == 0);
    assert(rx.drop_owner("alice") == 1);
    assert(rx.active_count() == 0);
  }

  {
    std::string err;
    assert(!blob::parse_start(json{{"totalSize", 10}}, &err));
    assert(!blob::parse_start(json{{"blobId", "x"}, {"totalSize", 10}, {"totalChunks", 3}}, &err));
    assert(!blob::parse_start(json{{"blobId", "x"}, {"totalSize", 10}, {"encoding", "hex"}}, &err));
    assert(!blob::parse_start(json{{"blobId", "x"}, {"totalSize", 10}, {"chunkSize", 1 << 20}}, &err));
    const auto empty = blob::parse_start(json{{"blobId", "x"}, {"totalSize", 0}, {"filename", "a.png"}}, &err);
    assert(empty && empty->total_chunks == 0 && empty->mime == "image/png");
  }

  // Handler: saves under uploads/<conversationId>/ and serves it back.
  const fs::path uploads = fs::temp_directory_path() / "pylon_blob_smoke";
  fs::remove_all(uploads);
  {
    blob::BlobHandler handler(uploads);
    auto meta = meta_for("b2", "report?.md");
    meta.context = json{{"type", "file_transfer"}, {"conversationId", 4398046511104LL}};
    const auto upload = blob::packetize_blob(meta, data);

    std::optional<blob::SavedBlob> saved;
    std::vector<json> replies;
    for (const auto& m : upload) {
      assert(blob::BlobHandler::is_blob_message(*common::message_type(m)));
      auto r = handler.handle("client-1", m);
      for (auto& x : r.replies) replies.push_back(std::move(x));
      if (r.saved) saved = r.saved;
    }
    assert(replies.size() == 1);
    assert(replies[0]["type"] == "blob_ack");
    assert(common::payload_of(replies[0])["success"] == true);
    assert(saved);
    assert(saved->path == uploads / "4398046511104" / "report_.md");
    assert(saved->mime == "text/markdown");
    assert(read_file(saved->path) == data);

    json req = common::make_message("blob_request", json{{"blobId", "dl-1"},
                                                         {"filename", "report_.md"},
                                                         {"context", meta.context}});
    const auto served = handler.handle("client-1", req);
    assert(served.replies.size() == 6);
    assert(common::payload_of(served.replies.front())["blobId"] == "dl-1");

    json missing = common::make_message("blob_request", json{{"blobId", "dl-2"}, {"filename", "nothing.bin"}});
    const auto nf = handler.handle("client-1", missing);
    assert(nf.replies.size() == 1);
    assert(common::payload_of(nf.replies[0])["error"] == "not_found");

    // Same-device shortcut completes without chunks.
    auto local = meta_for("b3", "report_.md");
    local.same_device = true;
    local.local_path = saved->path.string();
    local.total_size = data.size();
    local.total_chunks = blob::chunk_count(data.size());
    const auto quick = handler.handle("client-1", blob::make_start(local));
    assert(quick.replies.size() == 1);
    assert(common::payload_of(quick.replies[0])["success"] == true);
    assert(quick.saved && quick.saved->path == saved->path);
    assert(handler.receiver().active_count() == 0);

    // Bad start gets an invalid_start ack.
    const auto bad = handler.handle("client-1", common::make_message("blob_start", json{{"blobId", "b4"}}));
    assert(common::payload_of(bad.replies.at(0))["error"] == "invalid_start");
  }
  fs::remove_all(uploads);
  return 0;
}
