#pragma once

#include <string>
#include <vector>

#include "GeoTagReader.hpp"
#include "types.hpp"

class RecordBuilder {
 public:
  explicit RecordBuilder(std::vector<std::string> photoExtensions,
                         GeoTagExtractor extractor = GeoTagReader::read);

  // Photo records of inputDir sorted by (capture time, original name);
  // untimed records come last. Throws std::runtime_error if inputDir is not
  // a directory.
  std::vector<PhotoRecord> build(const fs::path& inputDir) const;

 private:
  bool is_photo(const fs::path& path) const;

  std::vector<std::string> m_extensions;
  GeoTagExtractor m_extractor;
};
