#pragma once

#include "common/json.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

namespace pylon {

// Appends one JSON line per message to <dir>/<prefix><timestamp>.jsonl and
// keeps at most max_files such files. Failures are logged, never thrown.
class PacketLogger {
 public:
  struct Config {
    std::filesystem::path dir;
    std::string prefix = "packets-";
    std::size_t max_files = 50;
  };

  explicit PacketLogger(Config cfg);

  void log_recv(std::string_view source, const common::json& msg);
  void log_send(std::string_view target, const common::json& msg);

  std::optional<std::filesystem::path> current_file() const { return current_; }
  std::size_t entries_written() const { return written_; }
  // Deletes the oldest log files beyond max_files; returns how many went.
  std::size_t cleanup();

 private:
  bool ensure_open();
  void write(const common::json& entry);

  Config cfg_;
  std::ofstream out_;
  std::optional<std::filesystem::path> current_;
  std::size_t written_ = 0;
  bool failed_ = false;
};

} // namespace pylon
