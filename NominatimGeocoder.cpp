#include "NominatimGeocoder.hpp"

#include <curl/curl.h>

#include <format>
#include <nlohmann/json.hpp>

#include "IOManager.hpp"

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb,
                      std::string* response) {
  size_t total = size * nmemb;
  response->append(static_cast<const char*>(contents), total);
  return total;
}

std::string string_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

}  // namespace

NominatimGeocoder::NominatimGeocoder(std::string baseUrl, std::string userAgent,
                                     int timeoutSeconds)
    : m_base_url(std::move(baseUrl)),
      m_user_agent(std::move(userAgent)),
      m_timeout_seconds(timeoutSeconds) {
  while (!m_base_url.empty() && m_base_url.back() == '/') {
    m_base_url.pop_back();
  }
}

std::string NominatimGeocoder::build_url(double latitude,
                                         double longitude) const {
  return std::format(
      "{}/reverse?lat={:.7f}&lon={:.7f}&format=jsonv2&addressdetails=1",
      m_base_url, latitude, longitude);
}

std::string NominatimGeocoder::perform_get(const std::string& url,
                                           long& http_code) const {
  std::string response;
  http_code = 0;

  CURL* curl = curl_easy_init();
  if (!curl) {
    IOManager::log("Failed to initialize cURL for reverse geocoding");
    return "";
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_timeout_seconds));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, m_user_agent.c_str());

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

  CURLcode res = curl_easy_perform(curl);
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    IOManager::log(std::format("Reverse geocode request to {} failed: {}", url,
                               curl_easy_strerror(res)));
    curl_easy_cleanup(curl);
    return "";
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_easy_cleanup(curl);
  return response;
}

std::optional<GeocodeResult> NominatimGeocoder::parse_response(
    std::string_view body) {
  const json root = json::parse(body, nullptr, false);
  if (root.is_discarded() || !root.is_object() || root.contains("error")) {
    return std::nullopt;
  }

  GeocodeResult result;
  result.address = string_field(root, "display_name");

  static const char* const kPlaceKeys[] = {
      "park",          "road",    "pedestrian",   "suburb",
      "neighbourhood", "city_district", "city"};
  if (auto addr = root.find("address");
      addr != root.end() && addr->is_object()) {
    for (const char* key : kPlaceKeys) {
      result.place_candidate = string_field(*addr, key);
      if (!result.place_candidate.empty()) break;
    }
  }
  if (result.place_candidate.empty()) {
    result.place_candidate = string_field(root, "name");
  }
  return result;
}

std::optional<GeocodeResult> NominatimGeocoder::reverse(double latitude,
                                                        double longitude) {
  const std::string url = build_url(latitude, longitude);
  long http_code = 0;
  const std::string body = perform_get(url, http_code);
  if (http_code < 200 || http_code >= 300) {
    if (http_code != 0) {
      IOManager::log(std::format("Reverse geocode {} returned HTTP {}", url,
                                 http_code));
    }
    return std::nullopt;
  }

  auto result = parse_response(body);
  if (!result) {
    IOManager::log(
        std::format("Reverse geocode {} returned an unusable body", url));
  }
  return result;
}
