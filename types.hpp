#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

// EXIF DateTimeOriginal carries no zone, so capture times are kept as naive
// wall-clock seconds on the system_clock epoch.
using CaptureTime = std::chrono::sys_seconds;

inline constexpr std::string_view kUnknownPlace = "unknown_place";

struct GeoTag {
  double latitude = 0.0;
  double longitude = 0.0;
  std::optional<CaptureTime> capture_time;
};

struct GeocodeResult {
  std::string address;
  std::string place_candidate;
};

struct PhotoRecord {
  fs::path source_path;
  std::string original_name;
  std::optional<CaptureTime> capture_time;
  double latitude = 0.0;
  double longitude = 0.0;
  std::string address;
  std::string place_slug{kUnknownPlace};
  int location_group_id = -1;
  int location_sequence = -1;
  int duplicate_index = 0;
  std::string new_name;
};

struct RenameOptions {
  fs::path input_dir;
  fs::path output_dir;  // empty means rename in place
  std::string prefix = "Photo";
  int digits = 2;
  double same_spot_m = 12.0;
  std::vector<std::string> photo_extensions = {
      ".jpg", ".jpeg", ".tif", ".tiff", ".png", ".webp", ".heic", ".dng"};

  bool geocode_enabled = true;
  double geocode_delay_s = 1.0;
  int geocode_timeout_s = 20;
  std::string user_agent = "geophoto-renamer/1.0 (contact: local-script)";
  std::string geocode_base_url = "https://nominatim.openstreetmap.org";

  std::optional<std::string> forced_place_name;
  int forced_place_first_n = 0;

  bool dry_run = false;
  fs::path csv_out = "photo_index.csv";
  fs::path journal_path = "renamer_journal.json";

  fs::path destination_dir() const {
    return output_dir.empty() ? input_dir : output_dir;
  }
};

struct RunSummary {
  size_t photos_considered = 0;
  size_t groups_formed = 0;
  size_t groups_geocoded = 0;
  size_t renamed = 0;
  bool dry_run = false;
};

struct RenameMove {
  fs::path from;
  fs::path to;
};

enum class ActionType { RENAME };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::RENAME, "RENAME"}});
struct JournalEntry {
  ActionType action;
  fs::path from;
  fs::path to;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(JournalEntry, action, from, to);

// Raised when the filesystem refuses a rename. Fatal to the run.
class RenameError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
