#pragma once

#include <string>
#include <string_view>

#include "ReverseGeocoder.hpp"

// OpenStreetMap Nominatim /reverse client.
class NominatimGeocoder : public ReverseGeocoder {
 public:
  NominatimGeocoder(std::string baseUrl, std::string userAgent,
                    int timeoutSeconds);

  std::optional<GeocodeResult> reverse(double latitude,
                                       double longitude) override;

  // Extracts display_name and the most specific place name from a jsonv2
  // response body.
  static std::optional<GeocodeResult> parse_response(std::string_view body);

  std::string build_url(double latitude, double longitude) const;

 private:
  std::string perform_get(const std::string& url, long& http_code) const;

  std::string m_base_url;
  std::string m_user_agent;
  int m_timeout_seconds;
};
