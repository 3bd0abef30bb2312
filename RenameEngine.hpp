#pragma once

#include <memory>
#include <vector>

#include "GeoTagReader.hpp"
#include "PlaceResolver.hpp"
#include "ReverseGeocoder.hpp"
#include "types.hpp"

struct RenamePlan {
  std::vector<PhotoRecord> records;
  RunSummary summary;
};

class RenameEngine {
 public:
  // With geocoding enabled and no geocoder given, a NominatimGeocoder is built
  // from the options.
  explicit RenameEngine(
      RenameOptions options, GeoTagExtractor extractor = GeoTagReader::read,
      std::unique_ptr<ReverseGeocoder> geocoder = nullptr,
      PlaceResolver::Sleeper sleeper = PlaceResolver::default_sleeper());

  // Scans, clusters, geocodes and names. Does not touch the filesystem.
  RenamePlan generate_plan() const;

  // Writes the CSV report, then renames the planned batch unless dryRun and
  // saves the journal. When a rename fails, the journal of the moves made so
  // far is saved before the RenameError propagates.
  RunSummary execute_plan(RenamePlan& plan, bool dryRun) const;

  const RenameOptions& options() const { return m_options; }

 private:
  RenameOptions m_options;
  GeoTagExtractor m_extractor;
  std::unique_ptr<ReverseGeocoder> m_geocoder;
  PlaceResolver::Sleeper m_sleeper;
};
