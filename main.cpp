#include <curl/curl.h>

#include <CLI/CLI.hpp>
#include <exception>
#include <exiv2/exiv2.hpp>
#include <iostream>
#include <memory>
#include <print>
#include <vector>

#include "IOManager.hpp"
#include "RenameEngine.hpp"
#include "UI.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

// Keeps libcurl and the Exiv2 XMP parser initialised for the process.
struct LibraryScope {
  LibraryScope() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    Exiv2::XmpParser::initialize();
  }
  ~LibraryScope() {
    Exiv2::XmpParser::terminate();
    curl_global_cleanup();
  }
};

std::optional<RenameOptions> resolve_config(const fs::path& exePath,
                                            const std::string& explicitPath) {
  if (!explicitPath.empty()) {
    return IOManager::load_config(utf8_to_path(explicitPath));
  }

  std::vector<fs::path> configPaths = {exePath / "config.json",
                                       fs::current_path() / "config.json",
                                       exePath.parent_path() / "config.json"};
  for (const auto& configPath : configPaths) {
    IOManager::log(std::format("Trying config path: {}",
                               safe_path_to_string(configPath)));
    if (fs::exists(configPath)) {
      IOManager::log(std::format("Found config.json at: {}",
                                 safe_path_to_string(configPath)));
      return IOManager::load_config(configPath);
    }
  }
  IOManager::log("No config.json found, using built-in defaults.");
  return RenameOptions{};
}

}  // namespace

int main(int argc, char* argv[]) {
  LibraryScope libraries;

  CLI::App app{"Rename geotagged photos by location and export a CSV index."};

  std::string config_path;
  std::string input_dir;
  std::string output_dir;
  std::optional<std::string> prefix;
  std::optional<std::string> place_name;
  std::optional<int> place_name_first_n;
  std::optional<int> digits;
  std::optional<double> same_spot_m;
  std::optional<std::string> csv_out;
  std::optional<double> geocode_delay_s;
  std::optional<int> geocode_timeout_s;
  std::optional<std::string> user_agent;
  std::string undo_journal;
  bool no_geocode = false;
  bool dry_run = false;
  bool tui = false;
  bool verbose = false;

  app.add_option("--config", config_path, "JSON configuration file.");
  app.add_option("--input-dir", input_dir,
                 "Folder that contains photos with GPS EXIF metadata.");
  app.add_option("--output-dir", output_dir,
                 "Where to write renamed photos. Default: rename in place.");
  app.add_option("--prefix", prefix, "Filename prefix.");
  app.add_option("--place-name", place_name,
                 "Force the place suffix for all photos (or the first N).");
  app.add_option("--place-name-first-n", place_name_first_n,
                 "If > 0, force --place-name only for the first N photos.")
      ->check(CLI::NonNegativeNumber);
  app.add_option("--digits", digits, "Zero-padding for location sequence numbers.")
      ->check(CLI::PositiveNumber);
  app.add_option("--same-spot-m", same_spot_m,
                 "Distance in metres to treat photos as the same location.")
      ->check(CLI::NonNegativeNumber);
  app.add_option("--csv-out", csv_out, "CSV output path.");
  app.add_flag("--no-geocode", no_geocode, "Skip reverse geocoding.");
  app.add_option("--geocode-delay-s", geocode_delay_s,
                 "Delay between reverse geocode requests.")
      ->check(CLI::NonNegativeNumber);
  app.add_option("--geocode-timeout-s", geocode_timeout_s,
                 "HTTP timeout for reverse geocoding requests.")
      ->check(CLI::PositiveNumber);
  app.add_option("--user-agent", user_agent,
                 "User-Agent string for Nominatim requests.");
  app.add_flag("--dry-run", dry_run, "Compute names and CSV only.");
  app.add_option("--undo", undo_journal,
                 "Revert the renames recorded in a journal file.");
  app.add_flag("--tui", tui, "Review the plan interactively before renaming.");
  app.add_flag("-v,--verbose", verbose, "Echo the log to stdout.");

  CLI11_PARSE(app, argc, argv);

  try {
    IOManager::initialize_logger();
    IOManager::log("--- GeoPhoto Renamer Started ---");
    if (verbose && !tui) {
      IOManager::set_log_handler(
          [](std::string_view message) { std::println("{}", message); });
    }

    if (!undo_journal.empty()) {
      if (!IOManager::run_undo(utf8_to_path(undo_journal))) {
        std::println(stderr, "Nothing to undo: {}", undo_journal);
        return 1;
      }
      std::println("Undo complete.");
      return 0;
    }

    fs::path exePath = argc > 0 ? fs::path(argv[0]).parent_path() : fs::path{};
    if (exePath.empty()) {
      exePath = fs::current_path();
    }

    auto optionsOpt = resolve_config(exePath, config_path);
    if (!optionsOpt) {
      IOManager::log("CRITICAL: Failed to load configuration.");
      std::println(stderr, "Failed to load configuration. Check renamer.log.");
      return 1;
    }
    RenameOptions options = *optionsOpt;

    if (!input_dir.empty()) options.input_dir = utf8_to_path(input_dir);
    if (!output_dir.empty()) options.output_dir = utf8_to_path(output_dir);
    if (prefix) options.prefix = *prefix;
    if (place_name) options.forced_place_name = *place_name;
    if (place_name_first_n) options.forced_place_first_n = *place_name_first_n;
    if (digits) options.digits = *digits;
    if (same_spot_m) options.same_spot_m = *same_spot_m;
    if (csv_out) options.csv_out = utf8_to_path(*csv_out);
    if (geocode_delay_s) options.geocode_delay_s = *geocode_delay_s;
    if (geocode_timeout_s) options.geocode_timeout_s = *geocode_timeout_s;
    if (user_agent) options.user_agent = *user_agent;
    if (no_geocode) options.geocode_enabled = false;
    options.dry_run = dry_run;

    if (options.input_dir.empty()) {
      std::println(stderr, "No input directory given (--input-dir).");
      return 1;
    }
    if (!fs::is_directory(options.input_dir)) {
      IOManager::log(std::format("CRITICAL: Input directory does not exist: {}",
                                 safe_path_to_string(options.input_dir)));
      std::println(stderr, "Input directory does not exist: {}",
                   safe_path_to_string(options.input_dir));
      return 1;
    }

    RenameEngine engine(options);

    if (tui) {
      IOManager::log("Initializing UI...");
      auto application = std::make_shared<UI>(engine);
      application->run();
      IOManager::log("--- GeoPhoto Renamer Exited Normally ---");
      return 0;
    }

    RenamePlan plan = engine.generate_plan();
    if (plan.records.empty()) {
      std::println(stderr, "No photos with GPS EXIF metadata found in {}.",
                   safe_path_to_string(options.input_dir));
      return 1;
    }

    const RunSummary summary = engine.execute_plan(plan, options.dry_run);

    std::println("Processed photos: {}", summary.photos_considered);
    std::println("CSV written: {}", safe_path_to_string(options.csv_out));
    if (options.geocode_enabled) {
      std::println("Geocoded groups: {}/{}", summary.groups_geocoded,
                   summary.groups_formed);
    }
    std::println("Mode: {}",
                 summary.dry_run ? "DRY RUN (no renaming)" : "RENAMED");

    IOManager::log("--- GeoPhoto Renamer Exited Normally ---");
    return 0;

  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check renamer.log for details.");
    return 1;
  }
}
