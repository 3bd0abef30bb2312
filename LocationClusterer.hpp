#pragma once

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "types.hpp"

struct GroupReference {
  double latitude = 0.0;
  double longitude = 0.0;
};

class LocationClusterer {
 public:
  explicit LocationClusterer(double sameSpotMeters = 12.0);

  // Assigns location_group_id, location_sequence and duplicate_index.
  // Records must be in RecordBuilder order; group discovery follows it.
  // Returns the reference point of every group, indexed by group id.
  std::vector<GroupReference> assign(std::vector<PhotoRecord>& records) const;

  // Great-circle distance in metres.
  static double haversine_m(double lat1, double lon1, double lat2, double lon2);

  // (sequence, duplicate) encoded by a previous run's name
  // "<anything>_<seq>[-<dup>]_<place>.<ext>".
  static std::optional<std::pair<int, int>> parse_previous_name(
      std::string_view filename);

 private:
  void order_group(std::vector<PhotoRecord*>& members, int locationSeq) const;

  double m_threshold;
};
