#include "IOManager.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>

#include "AtomicRenamer.hpp"
#include "utils.hpp"

namespace {
std::ofstream& get_log_stream() {
  static std::ofstream log_file("renamer.log", std::ios_base::app);
  return log_file;
}

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

std::string csv_field(std::string_view value) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(value);
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

}  // namespace

void IOManager::initialize_logger() { get_log_stream(); }

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  auto& log_stream = get_log_stream();
  if (log_stream.is_open()) {
    log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<RenameOptions> IOManager::load_config(const fs::path& configPath,
                                                    const RenameOptions& base) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    RenameOptions options = base;

    if (configJson.contains("prefix"))
      configJson.at("prefix").get_to(options.prefix);
    if (configJson.contains("digits"))
      configJson.at("digits").get_to(options.digits);
    if (configJson.contains("same_spot_m"))
      configJson.at("same_spot_m").get_to(options.same_spot_m);
    if (configJson.contains("photo_extensions")) {
      options.photo_extensions.clear();
      for (const auto& ext : configJson.at("photo_extensions"))
        options.photo_extensions.push_back(
            string_to_lower_ascii(ext.get<std::string>()));
    }
    if (configJson.contains("csv_out"))
      options.csv_out =
          utf8_to_path(configJson.at("csv_out").get<std::string>());
    if (configJson.contains("journal"))
      options.journal_path =
          utf8_to_path(configJson.at("journal").get<std::string>());

    if (configJson.contains("geocode")) {
      const auto& geo = configJson.at("geocode");
      if (geo.contains("enabled")) geo.at("enabled").get_to(options.geocode_enabled);
      if (geo.contains("delay_s")) geo.at("delay_s").get_to(options.geocode_delay_s);
      if (geo.contains("timeout_s"))
        geo.at("timeout_s").get_to(options.geocode_timeout_s);
      if (geo.contains("user_agent"))
        geo.at("user_agent").get_to(options.user_agent);
      if (geo.contains("base_url"))
        geo.at("base_url").get_to(options.geocode_base_url);
    }
    return options;
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

void IOManager::write_csv_report(const fs::path& csvPath,
                                 const std::vector<PhotoRecord>& records) {
  if (csvPath.has_parent_path()) {
    fs::create_directories(csvPath.parent_path());
  }
  std::ofstream out(csvPath, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error(std::format("Cannot write CSV report to '{}'",
                                         safe_path_to_string(csvPath)));
  }

  out << "original_name,new_name,latitude,longitude,address,place_slug,"
         "location_group_id,location_sequence,duplicate_index,"
         "capture_datetime\r\n";
  for (const auto& rec : records) {
    std::string capture;
    if (rec.capture_time) {
      capture = std::format("{:%Y-%m-%d %H:%M:%S}", *rec.capture_time);
    }
    out << csv_field(rec.original_name) << ',' << csv_field(rec.new_name)
        << ',' << std::format("{:.8f}", rec.latitude) << ','
        << std::format("{:.8f}", rec.longitude) << ','
        << csv_field(rec.address) << ',' << csv_field(rec.place_slug) << ','
        << rec.location_group_id << ',' << rec.location_sequence << ','
        << rec.duplicate_index << ',' << capture << "\r\n";
  }
  log(std::format("CSV report written: {} ({} rows)",
                  safe_path_to_string(csvPath), records.size()));
}

std::vector<JournalEntry> IOManager::load_journal(const fs::path& journalPath) {
  std::ifstream journalFile(journalPath);
  json j = json::parse(journalFile);
  return j.get<std::vector<JournalEntry>>();
}

void IOManager::save_journal(const fs::path& journalPath,
                             const std::vector<JournalEntry>& journal) {
  if (!journal.empty()) {
    if (journalPath.has_parent_path()) {
      fs::create_directories(journalPath.parent_path());
    }
    std::ofstream j_file(journalPath);
    j_file << json(journal).dump(2);
    log(std::format("Journal saved with {} renames to {}.", journal.size(),
                    safe_path_to_string(journalPath)));
  }
}

bool IOManager::run_undo(const fs::path& journalPath) {
  if (!fs::exists(journalPath)) {
    log("No journal file found. Nothing to undo.");
    return false;
  }

  std::vector<JournalEntry> journal;
  try {
    journal = load_journal(journalPath);
  } catch (const json::exception& e) {
    log(std::format("Error reading journal {}: {}",
                    safe_path_to_string(journalPath), e.what()));
    return false;
  }

  std::vector<RenameMove> moves;
  moves.reserve(journal.size());
  for (const auto& entry : journal) {
    if (entry.action == ActionType::RENAME) {
      moves.push_back({entry.to, entry.from});
    }
  }

  log(std::format("Starting undo of {} renames...", moves.size()));
  AtomicRenamer::execute_moves(moves);
  fs::remove(journalPath);
  log("Undo complete. Journal file removed.");
  return true;
}
