#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>

#include <boost/asio.hpp>

#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace common {

inline std::string iso_timestamp_utc() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  char buf[40];
  std::snprintf(buf,
                sizeof(buf),
                "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900,
                tm.tm_mon + 1,
                tm.tm_mday,
                tm.tm_hour,
                tm.tm_min,
                tm.tm_sec,
                static_cast<int>(ms));
  return buf;
}

// Milliseconds since the Unix epoch; used for message timestamps.
inline int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline void log(std::string_view msg) {
  std::cerr << "[" << iso_timestamp_utc() << "] " << msg << "\n";
}

inline void log_warn(std::string_view msg) {
  std::cerr << "[" << iso_timestamp_utc() << "] warn: " << msg << "\n";
}

inline void log_error(std::string_view msg) {
  std::cerr << "[" << iso_timestamp_utc() << "] error: " << msg << "\n";
}

inline std::string endpoint_to_string(const boost::asio::ip::tcp::endpoint& ep) {
  std::ostringstream oss;
  oss << ep.address().to_string() << ":" << ep.port();
  return oss.str();
}

inline std::string base64_encode(std::span<const uint8_t> data) {
  static constexpr char kB64[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  std::size_t i = 0;
  while (i + 3 <= data.size()) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8) |
                       (static_cast<uint32_t>(data[i + 2]));
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back(kB64[(v >> 6) & 0x3F]);
    out.push_back(kB64[v & 0x3F]);
    i += 3;
  }

  const std::size_t rem = data.size() - i;
  if (rem == 1) {
    const uint32_t v = static_cast<uint32_t>(data[i]) << 16;
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back('=');
    out.push_back('=');
  } else if (rem == 2) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8);
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back(kB64[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

inline std::optional<std::vector<uint8_t>> base64_decode(std::string_view s) {
  auto val = [](unsigned char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    if (c == '=') return -2;
    return -1;
  };

  if (s.size() % 4 != 0) return std::nullopt;
  std::vector<uint8_t> out;
  out.reserve((s.size() / 4) * 3);

  for (std::size_t i = 0; i < s.size(); i += 4) {
    const int v0 = val(static_cast<unsigned char>(s[i]));
    const int v1 = val(static_cast<unsigned char>(s[i + 1]));
    const int v2 = val(static_cast<unsigned char>(s[i + 2]));
    const int v3 = val(static_cast<unsigned char>(s[i + 3]));
    if (v0 < 0 || v1 < 0 || v2 == -1 || v3 == -1) return std::nullopt;
    // Padding is only legal in the final quantum.
    if ((v2 == -2 || v3 == -2) && i + 4 != s.size()) return std::nullopt;
    if (v2 == -2 && v3 != -2) return std::nullopt;

    const uint32_t n0 = static_cast<uint32_t>(v0);
    const uint32_t n1 = static_cast<uint32_t>(v1);
    const uint32_t n2 = (v2 == -2) ? 0u : static_cast<uint32_t>(v2);
    const uint32_t n3 = (v3 == -2) ? 0u : static_cast<uint32_t>(v3);
    const uint32_t v = (n0 << 18) | (n1 << 12) | (n2 << 6) | n3;

    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    if (v2 != -2) out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    if (v3 != -2) out.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  return out;
}

inline std::string generate_id(std::size_t len = 12) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> dist(0, sizeof(kAlphabet) - 2);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) out.push_back(kAlphabet[dist(rng)]);
  return out;
}

inline std::string_view trim(std::string_view v) {
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.remove_prefix(1);
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
  return v;
}

// Strict decimal port parse: "8080" ok, "", "0", "80x", "70000" rejected.
inline std::optional<uint16_t> parse_port(std::string_view s) {
  s = trim(s);
  if (s.empty() || s.size() > 5) return std::nullopt;
  unsigned long v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<unsigned long>(c - '0');
  }
  if (v == 0 || v > 65535) return std::nullopt;
  return static_cast<uint16_t>(v);
}

inline std::optional<long long> parse_int(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  bool neg = false;
  if (s.front() == '-' || s.front() == '+') {
    neg = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s.empty() || s.size() > 18) return std::nullopt;
  long long v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + (c - '0');
  }
  return neg ? -v : v;
}

inline std::optional<std::string> env_var(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) return std::nullopt;
  return std::string(v);
}

} // namespace common
