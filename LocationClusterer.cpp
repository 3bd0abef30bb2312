#include "LocationClusterer.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <numbers>
#include <regex>
#include <stdexcept>

#include "IOManager.hpp"

namespace {
constexpr double kEarthRadiusM = 6371000.0;

double to_radians(double degrees) { return degrees * std::numbers::pi / 180.0; }

// Sort key for the within-group order: timestamped photos first, then photos
// carrying this location's sequence from a previous run, then the rest.
struct MemberKey {
  int tier = 2;
  CaptureTime time{};
  int previous_dup = 0;
  PhotoRecord* rec = nullptr;
};

bool member_less(const MemberKey& a, const MemberKey& b) {
  if (a.tier != b.tier) return a.tier < b.tier;
  if (a.tier == 0 && a.time != b.time) return a.time < b.time;
  if (a.tier == 1 && a.previous_dup != b.previous_dup)
    return a.previous_dup < b.previous_dup;
  return a.rec->original_name < b.rec->original_name;
}

}  // namespace

LocationClusterer::LocationClusterer(double sameSpotMeters)
    : m_threshold(sameSpotMeters) {
  if (!(sameSpotMeters >= 0.0)) {
    throw std::invalid_argument("same-spot threshold must not be negative");
  }
}

double LocationClusterer::haversine_m(double lat1, double lon1, double lat2,
                                      double lon2) {
  const double phi1 = to_radians(lat1);
  const double phi2 = to_radians(lat2);
  const double dphi = to_radians(lat2 - lat1);
  const double dlambda = to_radians(lon2 - lon1);
  const double a = std::sin(dphi / 2.0) * std::sin(dphi / 2.0) +
                   std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2.0) *
                       std::sin(dlambda / 2.0);
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadiusM * c;
}

std::optional<std::pair<int, int>> LocationClusterer::parse_previous_name(
    std::string_view filename) {
  static const std::regex pattern(R"(^.*_(\d+)(?:-(\d+))?_(.+)$)");

  std::string stem(filename);
  if (const auto dot = stem.find_last_of('.');
      dot != std::string::npos && dot != 0) {
    stem.erase(dot);
  }

  std::smatch match;
  if (!std::regex_match(stem, match, pattern)) {
    return std::nullopt;
  }

  auto to_int = [](const std::ssub_match& m, int& out) {
    const std::string text = m.str();
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc();
  };

  int seq = 0;
  int dup = 0;
  if (!to_int(match[1], seq)) return std::nullopt;
  if (match[2].matched && !to_int(match[2], dup)) return std::nullopt;
  return std::make_pair(seq, dup);
}

std::vector<GroupReference> LocationClusterer::assign(
    std::vector<PhotoRecord>& records) const {
  std::vector<GroupReference> groups;

  for (auto& rec : records) {
    int matched = -1;
    for (size_t i = 0; i < groups.size(); ++i) {
      if (haversine_m(rec.latitude, rec.longitude, groups[i].latitude,
                      groups[i].longitude) <= m_threshold) {
        matched = static_cast<int>(i);
        break;
      }
    }
    if (matched < 0) {
      groups.push_back({rec.latitude, rec.longitude});
      matched = static_cast<int>(groups.size()) - 1;
    }
    rec.location_group_id = matched;
    rec.location_sequence = matched + 1;
  }

  std::vector<std::vector<PhotoRecord*>> members(groups.size());
  for (auto& rec : records) {
    members[rec.location_group_id].push_back(&rec);
  }
  for (size_t g = 0; g < members.size(); ++g) {
    order_group(members[g], static_cast<int>(g) + 1);
  }

  IOManager::log(std::format("Clustered {} photos into {} locations ({} m).",
                             records.size(), groups.size(), m_threshold));
  return groups;
}

void LocationClusterer::order_group(std::vector<PhotoRecord*>& members,
                                    int locationSeq) const {
  std::vector<MemberKey> keys;
  keys.reserve(members.size());
  for (PhotoRecord* rec : members) {
    MemberKey key;
    key.rec = rec;
    if (rec->capture_time) {
      key.tier = 0;
      key.time = *rec->capture_time;
    } else if (auto previous = parse_previous_name(rec->original_name);
               previous && previous->first == locationSeq) {
      key.tier = 1;
      key.previous_dup = previous->second;
    }
    keys.push_back(key);
  }

  std::stable_sort(keys.begin(), keys.end(), member_less);

  for (size_t i = 0; i < keys.size(); ++i) {
    keys[i].rec->duplicate_index = static_cast<int>(i);
  }
}
