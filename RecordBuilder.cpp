#include "RecordBuilder.hpp"

#include <algorithm>
#include <stdexcept>

#include "IOManager.hpp"
#include "utils.hpp"

RecordBuilder::RecordBuilder(std::vector<std::string> photoExtensions,
                             GeoTagExtractor extractor)
    : m_extensions(std::move(photoExtensions)),
      m_extractor(std::move(extractor)) {
  for (auto& ext : m_extensions) {
    ext = string_to_lower_ascii(ext);
  }
}

bool RecordBuilder::is_photo(const fs::path& path) const {
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(path.extension()));
  return std::find(m_extensions.begin(), m_extensions.end(), ext) !=
         m_extensions.end();
}

std::vector<PhotoRecord> RecordBuilder::build(const fs::path& inputDir) const {
  if (!fs::is_directory(inputDir)) {
    throw std::runtime_error(std::format("Input directory does not exist: {}",
                                         safe_path_to_string(inputDir)));
  }

  IOManager::log(std::format("Scanning '{}' for geotagged photos...",
                             safe_path_to_string(inputDir)));

  std::vector<fs::path> photos;
  for (const auto& entry : fs::directory_iterator(
           inputDir, fs::directory_options::skip_permission_denied)) {
    if (entry.is_regular_file() && is_photo(entry.path())) {
      photos.push_back(entry.path());
    }
  }
  std::sort(photos.begin(), photos.end());

  std::vector<PhotoRecord> records;
  size_t without_gps = 0;
  for (const auto& photo : photos) {
    auto tag = m_extractor(photo);
    if (!tag) {
      ++without_gps;
      continue;
    }
    PhotoRecord rec;
    rec.source_path = photo;
    rec.original_name = safe_path_to_string(photo.filename());
    rec.capture_time = tag->capture_time;
    rec.latitude = tag->latitude;
    rec.longitude = tag->longitude;
    records.push_back(std::move(rec));
  }

  std::stable_sort(records.begin(), records.end(),
                   [](const PhotoRecord& a, const PhotoRecord& b) {
                     const auto ta = a.capture_time.value_or(CaptureTime::max());
                     const auto tb = b.capture_time.value_or(CaptureTime::max());
                     if (ta != tb) return ta < tb;
                     return a.original_name < b.original_name;
                   });

  IOManager::log(std::format(
      "Found {} photos, {} with GPS coordinates ({} skipped).", photos.size(),
      records.size(), without_gps));
  return records;
}
