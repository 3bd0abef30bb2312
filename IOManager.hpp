#pragma once

#include <functional>
#include <optional>

#include "types.hpp"

namespace IOManager {
void initialize_logger();

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

// Reads the JSON config at configPath on top of `base`. Returns nullopt when
// the file is missing or malformed.
std::optional<RenameOptions> load_config(const fs::path& configPath,
                                         const RenameOptions& base = {});

void write_csv_report(const fs::path& csvPath,
                      const std::vector<PhotoRecord>& records);

std::vector<JournalEntry> load_journal(const fs::path& journalPath);
void save_journal(const fs::path& journalPath,
                  const std::vector<JournalEntry>& journal);

// Reverts every move listed in the journal and removes the journal file.
// Returns false when there was nothing to undo.
bool run_undo(const fs::path& journalPath);
}  // namespace IOManager
