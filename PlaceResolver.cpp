#include "PlaceResolver.hpp"

#include <algorithm>
#include <format>
#include <thread>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include "IOManager.hpp"

namespace {

// Letters and decimal digits of any script, plus combining marks so vowel
// signs and tone marks stay attached to their base letter.
bool is_slug_char(UChar32 cp) {
  return u_isalnum(cp) || (U_GET_GC_MASK(cp) & U_GC_M_MASK) != 0;
}

}  // namespace

PlaceResolver::PlaceResolver(ReverseGeocoder* geocoder,
                             std::chrono::milliseconds delay, Sleeper sleeper)
    : m_geocoder(geocoder), m_delay(delay), m_sleeper(std::move(sleeper)) {}

PlaceResolver::Sleeper PlaceResolver::default_sleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

std::string PlaceResolver::slugify(std::string_view text) {
  icu::UnicodeString lowered = icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
  lowered.toLower(icu::Locale::getRoot());

  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
  if (U_SUCCESS(status)) {
    icu::UnicodeString composed = nfc->normalize(lowered, status);
    if (U_SUCCESS(status)) {
      lowered = std::move(composed);
    }
  }
  if (U_FAILURE(status)) {
    IOManager::log(std::format("NFC normalisation unavailable: {}",
                               u_errorName(status)));
  }

  icu::UnicodeString slug;
  bool pending_underscore = false;
  for (int32_t i = 0; i < lowered.length(); i = lowered.moveIndex32(i, 1)) {
    const UChar32 cp = lowered.char32At(i);
    if (u_isUWhiteSpace(cp) || cp == u'_') {
      pending_underscore = true;
      continue;
    }
    if (!is_slug_char(cp)) {
      continue;
    }
    if (pending_underscore && !slug.isEmpty()) {
      slug.append(u'_');
    }
    pending_underscore = false;
    slug.append(cp);
  }
  if (slug.isEmpty()) {
    return std::string(kUnknownPlace);
  }
  std::string out;
  slug.toUTF8String(out);
  return out;
}

GeocodeResult PlaceResolver::lookup(const PhotoRecord& reference) const {
  try {
    if (auto result = m_geocoder->reverse(reference.latitude,
                                          reference.longitude)) {
      return {result->address, slugify(result->place_candidate)};
    }
  } catch (const std::exception& e) {
    IOManager::log(std::format("Reverse geocoding ({:.6f}, {:.6f}) failed: {}",
                               reference.latitude, reference.longitude,
                               e.what()));
  }
  return {"", std::string(kUnknownPlace)};
}

size_t PlaceResolver::resolve(std::vector<PhotoRecord>& records) const {
  int group_count = 0;
  for (const auto& rec : records) {
    group_count = std::max(group_count, rec.location_group_id + 1);
  }

  if (!m_geocoder) {
    for (auto& rec : records) {
      rec.address.clear();
      rec.place_slug = std::string(kUnknownPlace);
    }
    return 0;
  }

  size_t success_count = 0;
  for (int group = 0; group < group_count; ++group) {
    auto first = std::find_if(records.begin(), records.end(),
                              [group](const PhotoRecord& r) {
                                return r.location_group_id == group;
                              });
    if (first == records.end()) continue;

    const GeocodeResult place = lookup(*first);
    if (place.place_candidate != kUnknownPlace) {
      ++success_count;
    }
    for (auto& rec : records) {
      if (rec.location_group_id == group) {
        rec.address = place.address;
        rec.place_slug = place.place_candidate;
      }
    }
    IOManager::log(std::format("Location {}: {} ({})", group + 1,
                               place.place_candidate, place.address));

    if (m_delay.count() > 0) {
      m_sleeper(m_delay);
    }
  }
  return success_count;
}

void PlaceResolver::apply_forced_place(std::vector<PhotoRecord>& records,
                                       std::string_view placeName, int firstN) {
  const std::string forced = slugify(placeName);
  size_t count = records.size();
  if (firstN > 0) {
    count = std::min(count, static_cast<size_t>(firstN));
  }
  for (size_t i = 0; i < count; ++i) {
    records[i].place_slug = forced;
  }
  IOManager::log(std::format("Forced place '{}' on {} photos.", forced, count));
}
