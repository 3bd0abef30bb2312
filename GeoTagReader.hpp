#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "types.hpp"

// Reads coordinates and capture time from a photo's embedded metadata.
using GeoTagExtractor = std::function<std::optional<GeoTag>(const fs::path&)>;

namespace GeoTagReader {
// Exiv2-backed extractor. Missing or malformed metadata yields nullopt.
std::optional<GeoTag> read(const fs::path& path);

// Parses EXIF "YYYY:MM:DD HH:MM:SS".
std::optional<CaptureTime> parse_exif_datetime(std::string_view text);
}  // namespace GeoTagReader
