#pragma once

#include <filesystem>
#include <format>
#include <random>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Inverse of safe_path_to_string: builds a path from UTF-8 text.
inline fs::path utf8_to_path(std::string_view sv) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(sv.data()),
                                sv.size()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and common keywords.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

// Lexical comparison that tolerates paths which do not exist yet.
inline bool same_resolved_path(const fs::path& a, const fs::path& b) {
  std::error_code ec_a, ec_b;
  const fs::path ra = fs::weakly_canonical(a, ec_a);
  const fs::path rb = fs::weakly_canonical(b, ec_b);
  if (ec_a || ec_b) {
    return fs::absolute(a).lexically_normal() ==
           fs::absolute(b).lexically_normal();
  }
  return ra == rb;
}

// Generates a random hidden name ".tmp_ren_<32 hex><ext>" inside `dir` that
// does not exist on disk yet.
inline fs::path generate_temp_path(const fs::path& dir, std::string_view ext) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  fs::path candidate;
  do {
    const std::string name =
        std::format(".tmp_ren_{:016x}{:016x}{}", rng(), rng(), ext);
    candidate = dir / utf8_to_path(name);
  } while (fs::exists(candidate));
  return candidate;
}
