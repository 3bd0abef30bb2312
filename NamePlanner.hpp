#pragma once

#include <set>
#include <string>
#include <vector>

#include "types.hpp"

class NamePlanner {
 public:
  NamePlanner(std::string prefix, int digits);

  // "<prefix>_<seq>[-<dup>]_<slug><ext>" before collision handling.
  std::string base_name(const PhotoRecord& rec) const;

  // Sets new_name on every record. Names are unique within the batch and
  // never take a foreign file's name in destDir. Returns the claimed names.
  std::set<std::string> plan(std::vector<PhotoRecord>& records,
                             const fs::path& destDir) const;

  // Filenames already in destDir that are not sources of this batch.
  static std::set<std::string> reserved_names(
      const std::vector<PhotoRecord>& records, const fs::path& destDir);

 private:
  std::string m_prefix;
  int m_digits;
};
