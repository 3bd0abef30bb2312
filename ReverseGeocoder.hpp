#pragma once

#include <optional>

#include "types.hpp"

// Looks up a human readable place for a coordinate. Implementations return
// nullopt on any failure.
class ReverseGeocoder {
 public:
  virtual ~ReverseGeocoder() = default;
  virtual std::optional<GeocodeResult> reverse(double latitude,
                                               double longitude) = 0;
};
