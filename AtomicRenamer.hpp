#pragma once

#include <vector>

#include "types.hpp"

namespace AtomicRenamer {
// Moves every record to destDir / new_name and updates source_path. Sources
// that already sit in destDir are first parked under temporary names, so
// swaps and cycles between planned names are safe. In dry-run mode nothing on
// disk changes. Throws RenameError on any filesystem failure.
std::vector<JournalEntry> apply(std::vector<PhotoRecord>& records,
                                const fs::path& destDir, bool dryRun);

// As above, but progress lands in `journal` as it happens, so the caller
// still holds it when a rename throws.
void apply(std::vector<PhotoRecord>& records, const fs::path& destDir,
           bool dryRun, std::vector<JournalEntry>& journal);

// Two-phase executor shared by apply() and undo. Never replaces an existing
// file. Returns the moves that were performed.
std::vector<JournalEntry> execute_moves(const std::vector<RenameMove>& moves);

// Every entry in `journal` maps an original path to where that file sits
// right now: its temporary name while parked, its target once moved.
// Reversing the entries restores the batch even after a failure.
void execute_moves(const std::vector<RenameMove>& moves,
                   std::vector<JournalEntry>& journal);
}  // namespace AtomicRenamer
