#include "GeoTagReader.hpp"

#include <charconv>
#include <exiv2/exiv2.hpp>
#include <mutex>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;

bool parse_int(std::string_view text, int& out) {
  if (text.empty() || text.front() < '0' || text.front() > '9') return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

// Degrees/minutes/seconds rationals to decimal degrees.
std::optional<double> dms_to_decimal(const Exiv2::Exifdatum& dms,
                                     const Exiv2::Exifdatum& ref) {
  if (dms.count() < 3) return std::nullopt;
  double parts[3];
  for (size_t i = 0; i < 3; ++i) {
    const Exiv2::Rational r = dms.toRational(i);
    if (r.second == 0) return std::nullopt;
    parts[i] = static_cast<double>(r.first) / static_cast<double>(r.second);
  }
  double value = parts[0] + parts[1] / 60.0 + parts[2] / 3600.0;
  const std::string hemisphere = ref.toString();
  if (hemisphere == "S" || hemisphere == "W") {
    value = -value;
  }
  return value;
}

}  // namespace

std::optional<CaptureTime> GeoTagReader::parse_exif_datetime(
    std::string_view text) {
  // "YYYY:MM:DD HH:MM:SS", optionally NUL-terminated inside the tag value.
  while (!text.empty() && text.back() == '\0') {
    text.remove_suffix(1);
  }
  if (text.size() != 19 || text[4] != ':' || text[7] != ':' || text[10] != ' ' ||
      text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }
  int y, mo, d, h, mi, s;
  if (!parse_int(text.substr(0, 4), y) || !parse_int(text.substr(5, 2), mo) ||
      !parse_int(text.substr(8, 2), d) || !parse_int(text.substr(11, 2), h) ||
      !parse_int(text.substr(14, 2), mi) || !parse_int(text.substr(17, 2), s)) {
    return std::nullopt;
  }
  using namespace std::chrono;
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                           day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
    return std::nullopt;
  }
  return sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
}

std::optional<GeoTag> GeoTagReader::read(const fs::path& path) {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    const auto& exifData = image->exifData();
    if (exifData.empty()) return std::nullopt;

    const auto lat = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitude"));
    const auto lat_ref =
        exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitudeRef"));
    const auto lon = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLongitude"));
    const auto lon_ref =
        exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLongitudeRef"));
    if (lat == exifData.end() || lat_ref == exifData.end() ||
        lon == exifData.end() || lon_ref == exifData.end()) {
      return std::nullopt;
    }

    const auto latitude = dms_to_decimal(*lat, *lat_ref);
    const auto longitude = dms_to_decimal(*lon, *lon_ref);
    if (!latitude || !longitude) return std::nullopt;

    GeoTag tag;
    tag.latitude = *latitude;
    tag.longitude = *longitude;

    const auto taken =
        exifData.findKey(Exiv2::ExifKey("Exif.Photo.DateTimeOriginal"));
    if (taken != exifData.end() && taken->count() > 0) {
      tag.capture_time = parse_exif_datetime(taken->toString());
    }
    return tag;
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}
