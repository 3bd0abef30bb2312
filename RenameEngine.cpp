#include "RenameEngine.hpp"

#include <chrono>
#include <format>

#include "AtomicRenamer.hpp"
#include "IOManager.hpp"
#include "LocationClusterer.hpp"
#include "NamePlanner.hpp"
#include "NominatimGeocoder.hpp"
#include "RecordBuilder.hpp"
#include "utils.hpp"

RenameEngine::RenameEngine(RenameOptions options, GeoTagExtractor extractor,
                           std::unique_ptr<ReverseGeocoder> geocoder,
                           PlaceResolver::Sleeper sleeper)
    : m_options(std::move(options)),
      m_extractor(std::move(extractor)),
      m_geocoder(std::move(geocoder)),
      m_sleeper(std::move(sleeper)) {
  if (m_options.geocode_enabled && !m_geocoder) {
    m_geocoder = std::make_unique<NominatimGeocoder>(
        m_options.geocode_base_url, m_options.user_agent,
        m_options.geocode_timeout_s);
  }
}

RenamePlan RenameEngine::generate_plan() const {
  RenamePlan plan;

  RecordBuilder builder(m_options.photo_extensions, m_extractor);
  plan.records = builder.build(m_options.input_dir);
  plan.summary.photos_considered = plan.records.size();
  if (plan.records.empty()) {
    IOManager::log("No photos with GPS metadata found.");
    return plan;
  }

  LocationClusterer clusterer(m_options.same_spot_m);
  plan.summary.groups_formed = clusterer.assign(plan.records).size();

  const auto delay = std::chrono::milliseconds(
      static_cast<long long>(m_options.geocode_delay_s * 1000.0));
  PlaceResolver resolver(m_options.geocode_enabled ? m_geocoder.get() : nullptr,
                         delay, m_sleeper);
  plan.summary.groups_geocoded = resolver.resolve(plan.records);

  if (m_options.forced_place_name) {
    PlaceResolver::apply_forced_place(plan.records, *m_options.forced_place_name,
                                      m_options.forced_place_first_n);
  }

  NamePlanner planner(m_options.prefix, m_options.digits);
  planner.plan(plan.records, m_options.destination_dir());

  IOManager::log(std::format(
      "Plan ready: {} photos, {} locations, {} geocoded.",
      plan.summary.photos_considered, plan.summary.groups_formed,
      plan.summary.groups_geocoded));
  return plan;
}

RunSummary RenameEngine::execute_plan(RenamePlan& plan, bool dryRun) const {
  plan.summary.dry_run = dryRun;
  if (plan.records.empty()) {
    return plan.summary;
  }

  // The report carries the planned mapping, so it exists before any file
  // moves.
  IOManager::write_csv_report(m_options.csv_out, plan.records);
  if (dryRun) {
    AtomicRenamer::apply(plan.records, m_options.destination_dir(), true);
    return plan.summary;
  }

  std::vector<JournalEntry> journal;
  try {
    AtomicRenamer::apply(plan.records, m_options.destination_dir(), false,
                         journal);
  } catch (const RenameError& e) {
    IOManager::log(std::format("Rename stopped after {} moves: {}",
                               journal.size(), e.what()));
    IOManager::save_journal(m_options.journal_path, journal);
    throw;
  }
  plan.summary.renamed = journal.size();
  IOManager::save_journal(m_options.journal_path, journal);
  return plan.summary;
}
