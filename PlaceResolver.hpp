#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "ReverseGeocoder.hpp"
#include "types.hpp"

class PlaceResolver {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // geocoder may be null, in which case every group keeps unknown_place.
  PlaceResolver(ReverseGeocoder* geocoder, std::chrono::milliseconds delay,
                Sleeper sleeper = default_sleeper());

  // One lookup per location group, in ascending group order, using the
  // group's first member. Returns the number of groups that got a real place.
  size_t resolve(std::vector<PhotoRecord>& records) const;

  // Filesystem-safe slug; "unknown_place" when nothing survives.
  static std::string slugify(std::string_view text);

  // Overrides place_slug with slugify(placeName) for every record, or for the
  // first firstN records when firstN > 0. Records keep RecordBuilder order.
  static void apply_forced_place(std::vector<PhotoRecord>& records,
                                 std::string_view placeName, int firstN);

  static Sleeper default_sleeper();

 private:
  GeocodeResult lookup(const PhotoRecord& reference) const;

  ReverseGeocoder* m_geocoder;
  std::chrono::milliseconds m_delay;
  Sleeper m_sleeper;
};
