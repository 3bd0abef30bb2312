#include "AtomicRenamer.hpp"

#include <format>
#include <set>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {

void rename_checked(const fs::path& from, const fs::path& to) {
  if (fs::exists(to)) {
    throw RenameError(std::format("Refusing to overwrite existing file '{}'",
                                  safe_path_to_string(to)));
  }
  try {
    fs::rename(from, to);
  } catch (const fs::filesystem_error& e) {
    throw RenameError(std::format("Cannot rename '{}' -> '{}': {}",
                                  safe_path_to_string(from),
                                  safe_path_to_string(to), e.what()));
  }
}

}  // namespace

std::vector<JournalEntry> AtomicRenamer::execute_moves(
    const std::vector<RenameMove>& moves) {
  std::vector<JournalEntry> journal;
  execute_moves(moves, journal);
  return journal;
}

void AtomicRenamer::execute_moves(const std::vector<RenameMove>& moves,
                                  std::vector<JournalEntry>& journal) {
  std::vector<const RenameMove*> pending;
  std::set<fs::path> target_dirs;
  for (const auto& move : moves) {
    if (same_resolved_path(move.from, move.to)) continue;
    pending.push_back(&move);
    target_dirs.insert(fs::absolute(move.to.parent_path()).lexically_normal());
  }
  if (pending.empty()) {
    return;
  }

  for (const auto& dir : target_dirs) {
    if (!fs::exists(dir)) {
      std::error_code ec;
      fs::create_directories(dir, ec);
      if (ec) {
        throw RenameError(std::format("Failed to create directory '{}': {}",
                                      safe_path_to_string(dir), ec.message()));
      }
      IOManager::log(
          std::format("[DIR] Creating directory: '{}'", safe_path_to_string(dir)));
    }
  }

  auto in_target_dir = [&](const fs::path& p) {
    for (const auto& dir : target_dirs) {
      if (same_resolved_path(p.parent_path(), dir)) return true;
    }
    return false;
  };

  constexpr size_t kNotParked = static_cast<size_t>(-1);

  // Phase 1: park every source that could be another move's target.
  std::vector<fs::path> current;
  std::vector<size_t> parked_entry;
  current.reserve(pending.size());
  parked_entry.reserve(pending.size());
  for (const RenameMove* move : pending) {
    if (!in_target_dir(move->from)) {
      current.push_back(move->from);
      parked_entry.push_back(kNotParked);
      continue;
    }
    const std::string ext = string_to_lower_ascii(
        safe_path_to_string(move->from.extension()));
    const fs::path temp = generate_temp_path(move->from.parent_path(), ext);
    IOManager::log(std::format("Parking '{}' as '{}'",
                               safe_path_to_string(move->from.filename()),
                               safe_path_to_string(temp.filename())));
    rename_checked(move->from, temp);
    journal.push_back({ActionType::RENAME, move->from, temp});
    current.push_back(temp);
    parked_entry.push_back(journal.size() - 1);
  }

  // Phase 2: every parked or foreign source goes to its final name.
  for (size_t i = 0; i < pending.size(); ++i) {
    const RenameMove& move = *pending[i];
    IOManager::log(std::format("Renaming '{}' -> '{}'",
                               safe_path_to_string(move.from),
                               safe_path_to_string(move.to)));
    rename_checked(current[i], move.to);
    if (parked_entry[i] == kNotParked) {
      journal.push_back({ActionType::RENAME, move.from, move.to});
    } else {
      journal[parked_entry[i]].to = move.to;
    }
  }
}

std::vector<JournalEntry> AtomicRenamer::apply(std::vector<PhotoRecord>& records,
                                               const fs::path& destDir,
                                               bool dryRun) {
  std::vector<JournalEntry> journal;
  apply(records, destDir, dryRun, journal);
  return journal;
}

void AtomicRenamer::apply(std::vector<PhotoRecord>& records,
                          const fs::path& destDir, bool dryRun,
                          std::vector<JournalEntry>& journal) {
  if (dryRun) {
    IOManager::log(std::format("Dry run: {} renames planned, none performed.",
                               records.size()));
    return;
  }

  std::vector<RenameMove> moves;
  moves.reserve(records.size());
  for (const auto& rec : records) {
    moves.push_back({rec.source_path, destDir / utf8_to_path(rec.new_name)});
  }

  execute_moves(moves, journal);

  for (size_t i = 0; i < records.size(); ++i) {
    records[i].source_path = moves[i].to;
  }
  IOManager::log(std::format("Renamed {} photos into '{}'.", journal.size(),
                             safe_path_to_string(destDir)));
}
