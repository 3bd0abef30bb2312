#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../ReverseGeocoder.hpp"
#include "../types.hpp"

namespace fs = std::filesystem;

// Test fixture that handles setting up and tearing down a temporary
// directory for every test.
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = fs::temp_directory_path() /
               (std::string("renamer_test_") + info->test_suite_name() + "_" +
                info->name());
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    // Ignore errors during cleanup as they are not part of the test result.
  }

  // Creates a file whose content is its own name, so moves can be verified.
  fs::path CreateFile(const fs::path& relative_path,
                      const std::string& content = "") {
    fs::path full_path = test_dir / relative_path;
    if (full_path.has_parent_path()) {
      fs::create_directories(full_path.parent_path());
    }
    std::ofstream ofs(full_path, std::ios::binary);
    ofs << (content.empty() ? relative_path.filename().string() : content);
    return full_path;
  }

  static std::string ReadFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), {});
  }

  std::vector<std::string> ListNames(const fs::path& dir) const {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
      names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  fs::path test_dir;
};

inline CaptureTime MakeTime(int y, unsigned m, unsigned d, int h = 12,
                            int min = 0, int s = 0) {
  using namespace std::chrono;
  return sys_days{year{y} / month{m} / day{d}} + hours{h} + minutes{min} +
         seconds{s};
}

inline PhotoRecord MakeRecord(const std::string& name, double lat, double lon,
                              std::optional<CaptureTime> time = std::nullopt,
                              const fs::path& dir = {}) {
  PhotoRecord rec;
  rec.source_path = dir / name;
  rec.original_name = name;
  rec.latitude = lat;
  rec.longitude = lon;
  rec.capture_time = time;
  return rec;
}

// Answers from a fixed table keyed by rounded latitude; unknown coordinates
// fail like an unreachable service.
class FakeGeocoder : public ReverseGeocoder {
 public:
  std::optional<GeocodeResult> reverse(double latitude,
                                       double longitude) override {
    calls.push_back({latitude, longitude});
    if (throw_on_call) {
      throw std::runtime_error("connection reset");
    }
    for (const auto& [lat, result] : places) {
      if (std::abs(lat - latitude) < 1e-3) return result;
    }
    return std::nullopt;
  }

  std::vector<std::pair<double, double>> calls;
  std::map<double, GeocodeResult> places;
  bool throw_on_call = false;
};
