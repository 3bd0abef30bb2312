#include "NamePlanner.hpp"

#include <format>
#include <stdexcept>

#include "IOManager.hpp"
#include "utils.hpp"

NamePlanner::NamePlanner(std::string prefix, int digits)
    : m_prefix(std::move(prefix)), m_digits(digits) {
  if (m_digits < 1) {
    throw std::invalid_argument("digits must be at least 1");
  }
}

std::string NamePlanner::base_name(const PhotoRecord& rec) const {
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(rec.source_path.extension()));
  std::string base =
      std::format("{}_{:0{}d}", m_prefix, rec.location_sequence, m_digits);
  if (rec.duplicate_index > 0) {
    base += std::format("-{}", rec.duplicate_index);
  }
  return std::format("{}_{}{}", base, rec.place_slug, ext);
}

std::set<std::string> NamePlanner::reserved_names(
    const std::vector<PhotoRecord>& records, const fs::path& destDir) {
  std::set<std::string> reserved;
  std::error_code ec;
  if (!fs::is_directory(destDir, ec)) {
    return reserved;
  }

  for (const auto& entry : fs::directory_iterator(destDir)) {
    if (entry.is_regular_file()) {
      reserved.insert(safe_path_to_string(entry.path().filename()));
    }
  }
  for (const auto& rec : records) {
    if (same_resolved_path(rec.source_path.parent_path(), destDir)) {
      reserved.erase(safe_path_to_string(rec.source_path.filename()));
    }
  }
  return reserved;
}

std::set<std::string> NamePlanner::plan(std::vector<PhotoRecord>& records,
                                        const fs::path& destDir) const {
  const std::set<std::string> reserved = reserved_names(records, destDir);
  std::set<std::string> claimed;

  for (auto& rec : records) {
    auto collides = [&](const std::string& name) {
      if (claimed.count(name)) return true;
      return reserved.count(name) > 0 &&
             !same_resolved_path(destDir / utf8_to_path(name), rec.source_path);
    };

    std::string candidate = base_name(rec);
    if (collides(candidate)) {
      const std::string ext = string_to_lower_ascii(
          safe_path_to_string(rec.source_path.extension()));
      const std::string stem = candidate.substr(0, candidate.size() - ext.size());
      int n = 1;
      do {
        candidate = std::format("{}_dup{}{}", stem, n++, ext);
      } while (collides(candidate));
      IOManager::log(std::format("Name collision for '{}', using '{}'",
                                 rec.original_name, candidate));
    }
    rec.new_name = candidate;
    claimed.insert(candidate);
  }
  return claimed;
}
