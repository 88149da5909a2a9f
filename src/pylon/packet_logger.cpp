#include "src/pylon/packet_logger.h"

#include "common/envelope.hpp"
#include "common/framing.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <vector>

namespace pylon {

using common::json;
namespace fs = std::filesystem;

PacketLogger::PacketLogger(Config cfg) : cfg_(std::move(cfg)) {}

void PacketLogger::log_recv(std::string_view source, const json& msg) {
  json entry;
  entry["timestamp"] = common::iso_timestamp_utc();
  entry["direction"] = "recv";
  entry["source"] = std::string(source);
  entry["type"] = common::message_type(msg).value_or("unknown");
  entry["data"] = msg;
  write(entry);
}

void PacketLogger::log_send(std::string_view target, const json& msg) {
  json entry;
  entry["timestamp"] = common::iso_timestamp_utc();
  entry["direction"] = "send";
  entry["target"] = std::string(target);
  entry["type"] = common::message_type(msg).value_or("unknown");
  entry["data"] = msg;
  write(entry);
}

bool PacketLogger::ensure_open() {
  if (out_.is_open()) return true;
  if (failed_) return false;

  std::error_code ec;
  fs::create_directories(cfg_.dir, ec);
  if (ec) {
    common::log_error("packet log: cannot create " + cfg_.dir.string() + ": " + ec.message());
    failed_ = true;
    return false;
  }

  std::string stamp = common::iso_timestamp_utc();
  std::replace(stamp.begin(), stamp.end(), ':', '-');
  std::replace(stamp.begin(), stamp.end(), '.', '-');
  const fs::path path = cfg_.dir / (cfg_.prefix + stamp + ".jsonl");
  out_.open(path, std::ios::app);
  if (!out_) {
    common::log_error("packet log: cannot open " + path.string());
    failed_ = true;
    return false;
  }
  current_ = path;
  common::log("packet log: " + path.string());
  cleanup();
  return true;
}

void PacketLogger::write(const json& entry) {
  if (!ensure_open()) return;
  out_ << common::to_text(entry) << '\n';
  out_.flush();
  if (!out_) {
    common::log_error("packet log: write failed, disabling");
    out_.close();
    failed_ = true;
    return;
  }
  ++written_;
}

std::size_t PacketLogger::cleanup() {
  std::error_code ec;
  std::vector<fs::path> files;
  for (fs::directory_iterator it(cfg_.dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& path = it->path();
    const auto name = path.filename().string();
    if (name.rfind(cfg_.prefix, 0) == 0 && path.extension() == ".jsonl") files.push_back(path);
  }
  if (ec || files.size() <= cfg_.max_files) return 0;

  std::sort(files.begin(), files.end());
  std::size_t removed = 0;
  const std::size_t excess = files.size() - cfg_.max_files;
  for (std::size_t i = 0; i < files.size() && removed < excess; ++i) {
    if (current_ && files[i] == *current_) continue;
    if (fs::remove(files[i], ec)) {
      ++removed;
    } else if (ec) {
      common::log_warn("packet log: cannot remove " + files[i].string() + ": " + ec.message());
    }
  }
  return removed;
}

} // namespace pylon
