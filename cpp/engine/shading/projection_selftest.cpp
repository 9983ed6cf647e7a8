/*
  Projected Solar Zenith Angle Selftest

  Objective
  ---------
  Framework-free checks for engine/shading/projection:
    1) Reproduce the true-tracking angles published by NREL for a sloped
       single-axis tracker (axis tilt 9.666, azimuth 195) within 1e-3 deg.
    2) Axis-flip antisymmetry: negating the tilt and turning the axis
       azimuth by 180 deg negates the angle.
    3) Literal edge-case table (sun at zenith, +/-90 deg azimuth offsets,
       vertical axis saturation) within 1e-9 deg.
    4) Result kind mirrors the input kind (scalar / array / series).

  Reference data: NREL "Slope-Aware Backtracking for Single-Axis Trackers",
  doi:10.2172/1660126, Jan 1 2019, UTC-5.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/series/series.hpp"
#include "engine/shading/projection.hpp"

namespace rowshade {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << " (tol " << tol << ")\n";
  } else {
    pass(msg);
  }
}

struct TrackingSample {
  const char* time;
  double apparent_elevation;
  double solar_azimuth;
  double true_tracking;
};

constexpr double kAxisTilt = 9.666;
constexpr double kAxisAzimuth = 195.0;

const std::vector<TrackingSample> kNrel = {
    {"2019-01-01T08:00-05:00", 2.404287, 122.791770, -84.440},
    {"2019-01-01T09:00-05:00", 11.263058, 133.288729, -72.604},
    {"2019-01-01T10:00-05:00", 18.733558, 145.285552, -59.861},
    {"2019-01-01T11:00-05:00", 24.109076, 158.939435, -45.578},
    {"2019-01-01T12:00-05:00", 26.810735, 173.931802, -28.764},
    {"2019-01-01T13:00-05:00", 26.482495, 189.371536, -8.475},
    {"2019-01-01T14:00-05:00", 23.170447, 204.136810, 15.120},
    {"2019-01-01T15:00-05:00", 17.296785, 217.446538, 39.562},
    {"2019-01-01T16:00-05:00", 9.461862, 229.102218, 61.587},
    {"2019-01-01T17:00-05:00", 0.524817, 239.330401, 79.530},
};

struct EdgeCase {
  double solar_zenith;
  double solar_azimuth;
  double axis_tilt;
  double axis_azimuth;
  double psza;
};

const std::vector<EdgeCase> kEdgeCases = {
    // s_zen | s_azm | ax_tilt | ax_azm | psza
    {0, 0, 0, 0, 0},
    {0, 180, 0, 0, 0},
    {0, 0, 0, 180, 0},
    {0, 180, 0, 180, 0},
    {45, 0, 0, 180, 0},
    {45, 90, 0, 180, -45},
    {45, 270, 0, 180, 45},
    {45, 90, 90, 180, -90},
    {45, 270, 90, 180, 90},
    {45, 90, 90, 0, 90},
    {45, 270, 90, 0, -90},
    {45, 45, 90, 180, -135},
    {45, 315, 90, 180, 135},
};

void test_nrel_true_tracking() {
  Index idx;
  std::vector<double> zenith, azimuth;
  for (const auto& s : kNrel) {
    idx.push_back(s.time);
    zenith.push_back(90.0 - s.apparent_elevation);
    azimuth.push_back(s.solar_azimuth);
  }
  const Series zen(zenith, idx);
  const Series azi(azimuth, idx);

  const Values psz = projected_solar_zenith_angle(zen, azi, kAxisTilt, kAxisAzimuth);
  expect_true(psz.is_series(), "psza: series in -> series out");
  expect_true(psz.series().index() == idx, "psza: timestamps preserved");
  for (std::size_t i = 0; i < kNrel.size(); ++i) {
    expect_near(psz.series().at(kNrel[i].time), kNrel[i].true_tracking, 1e-3,
                std::string("psza: NREL true tracking at ") + kNrel[i].time);
  }

  const Values flipped = projected_solar_zenith_angle(zen, azi, -kAxisTilt, kAxisAzimuth - 180.0);
  for (std::size_t i = 0; i < kNrel.size(); ++i) {
    expect_near(flipped.at(i), -kNrel[i].true_tracking, 1e-3,
                std::string("psza: flipped axis negates tracking at ") + kNrel[i].time);
    expect_near(flipped.at(i), -psz.at(i), 1e-9, "psza: axis-flip antisymmetry " + std::to_string(i));
  }
}

void test_edge_cases() {
  std::vector<double> zen, azi, tilt, axis_azi;
  for (const auto& c : kEdgeCases) {
    zen.push_back(c.solar_zenith);
    azi.push_back(c.solar_azimuth);
    tilt.push_back(c.axis_tilt);
    axis_azi.push_back(c.axis_azimuth);
  }

  const Values psz = projected_solar_zenith_angle(zen, azi, tilt, axis_azi);
  expect_true(psz.is_array(), "psza: arrays in -> array out");
  for (std::size_t i = 0; i < kEdgeCases.size(); ++i) {
    expect_near(psz.at(i), kEdgeCases[i].psza, 1e-9, "psza: edge case row " + std::to_string(i));
  }

  for (double az : {0.0, 37.0, 180.0, 299.0}) {
    for (double t : {-45.0, 0.0, 20.0, 90.0}) {
      expect_near(projected_solar_zenith_angle(0.0, az, t, 123.0), 0.0, 1e-12,
                  "psza: sun at zenith gives 0 for any axis");
    }
  }
}

void test_datatypes() {
  const TrackingSample& s = kNrel.front();
  const double zenith = 90.0 - s.apparent_elevation;

  const double scalar = projected_solar_zenith_angle(zenith, s.solar_azimuth, kAxisTilt, kAxisAzimuth);
  expect_near(scalar, s.true_tracking, 1e-3, "psza: double overload");

  const Values as_values =
      projected_solar_zenith_angle(Values(zenith), Values(s.solar_azimuth), kAxisTilt, kAxisAzimuth);
  expect_true(as_values.is_scalar(), "psza: scalar Values in -> scalar out");
  expect_near(as_values.scalar(), scalar, 0.0, "psza: scalar Values matches double overload");

  const Values arr = projected_solar_zenith_angle(std::vector<double>{zenith}, s.solar_azimuth,
                                                  kAxisTilt, kAxisAzimuth);
  expect_true(arr.is_array() && arr.size() == 1, "psza: length-1 array in -> length-1 array out");

  const Values ser = projected_solar_zenith_angle(Series(std::vector<double>{zenith}), s.solar_azimuth,
                                                  kAxisTilt, kAxisAzimuth);
  expect_true(ser.is_series() && ser.size() == 1, "psza: length-1 series in -> length-1 series out");
  expect_true(ser.series().index() == Index{"0"}, "psza: default range index carried through");
}

}  // namespace
}  // namespace rowshade

int main() {
  using namespace rowshade;

  test_nrel_true_tracking();
  test_edge_cases();
  test_datatypes();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
