/*
  Shaded Fraction Selftest

  Objective
  ---------
  Framework-free checks for engine/shading/shaded_fraction:
    1) 16-case cross-section table (two rows, sloped terrain, axis offset)
       from doi:10.5281/zenodo.10513987, scalar and series evaluation.
    2) Omitted shading_row_rotation defaults to the shaded rotation.
    3) Output is clipped to [0, 1] and is never NaN, including the shaded row
       edge-on to the sun.
    4) Result kind mirrors the richest input; series labels are preserved.
    5) SunSide case split.
    6) Width, pitch and zenith are required; a RowGeometry record can stand in.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/angles.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"
#include "engine/series/series.hpp"
#include "engine/shading/shaded_fraction.hpp"

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

// Left (L) and right (R) row axis positions and rotations, axis-to-surface
// offset z_0, collector width l, projected solar zenith theta_s, and the
// expected shaded fraction f_s.
struct CrossSectionCase {
  double x_L, z_L, theta_L;
  double x_R, z_R, theta_R;
  double z_0, l, theta_s, f_s;
};

const std::vector<CrossSectionCase> kCases = {
    {1, 0.2, 50, 0, 0, 25, 0, 0.5, 80, 1},
    {1, 0.1, 50, 0, 0, 25, 0.05, 0.5, 80, 0.937191},
    {1, 0, 50, 0, 0.1, 25, 0, 0.5, 80, 0.30605},
    {1, 0, 50, 0, 0.2, 25, 0, 0.5, 80, 0},
    {1, 0.2, -25, 0, 0, -50, 0, 0.5, -80, 0},
    {1, 0.1, -25, 0, 0, -50, 0, 0.5, -80, 0.30605},
    {1, 0, -25, 0, 0.1, -50, 0.1, 0.5, -80, 0.881549},
    {1, 0, -25, 0, 0.2, -50, 0, 0.5, -80, 1},
    {1, 0.2, 5, 0, 0, 25, 0.05, 0.5, 80, 0.832499},
    {1, 0.2, -25, 0, 0, 25, 0.05, 0.5, 80, 0.832499},
    {1, 0.2, 5, 0, 0, -45, 0.05, 0.5, 80, 0.832499},
    {1, 0.2, -25, 0, 0, -45, 0.05, 0.5, 80, 0.832499},
    {1, 0, -25, 0, 0.2, 25, 0.05, 0.5, -80, 0.832499},
    {1, 0, -25, 0, 0.2, -5, 0.05, 0.5, -80, 0.832499},
    {1, 0, 45, 0, 0.2, 25, 0.05, 0.5, -80, 0.832499},
    {1, 0, 45, 0, 0.2, -5, 0.05, 0.5, -80, 0.832499},
};

// Column-wise premises for shaded_fraction1d.
struct Premises {
  std::vector<double> shading_row_rotation;
  std::vector<double> shaded_row_rotation;
  std::vector<double> surface_to_axis_offset;
  std::vector<double> collector_width;
  std::vector<double> solar_zenith;
  std::vector<double> cross_axis_slope;
  std::vector<double> pitch;
  std::vector<double> expected;
};

Premises build_premises() {
  Premises p;
  for (const auto& c : kCases) {
    // The row on the sun's side shades the other one.
    const bool sun_positive = c.theta_s >= 0.0;
    p.shading_row_rotation.push_back(sun_positive ? c.theta_L : c.theta_R);
    p.shaded_row_rotation.push_back(sun_positive ? c.theta_R : c.theta_L);
    p.surface_to_axis_offset.push_back(c.z_0);
    p.collector_width.push_back(c.l);
    // solar_azimuth 180 / axis_azimuth 90 make psza == solar_zenith.
    p.solar_zenith.push_back(c.theta_s);
    p.cross_axis_slope.push_back(atand((c.z_R - c.z_L) / (c.x_L - c.x_R)));
    p.pitch.push_back(c.x_L - c.x_R);
    p.expected.push_back(c.f_s);
  }
  return p;
}

void test_cross_section_table_scalar() {
  const Premises p = build_premises();

  const double sf = shaded_fraction1d(p.shaded_row_rotation[0], p.shading_row_rotation[0],
                                      p.surface_to_axis_offset[0], p.collector_width[0],
                                      p.solar_zenith[0], p.cross_axis_slope[0], p.pitch[0],
                                      180.0, 90.0);
  expect_near(sf, p.expected[0], 1e-7, "shaded_fraction1d: scalar row 0");

  for (std::size_t i = 0; i < p.expected.size(); ++i) {
    const double v = shaded_fraction1d(p.shaded_row_rotation[i], p.shading_row_rotation[i],
                                       p.surface_to_axis_offset[i], p.collector_width[i],
                                       p.solar_zenith[i], p.cross_axis_slope[i], p.pitch[i]);
    expect_near(v, p.expected[i], 1e-6, "shaded_fraction1d: scalar row " + std::to_string(i));
  }

  ShadedFraction1dInputs in{
      .shaded_row_rotation = p.shaded_row_rotation[0],
      .shading_row_rotation = Values(p.shading_row_rotation[0]),
      .surface_to_axis_offset = p.surface_to_axis_offset[0],
      .collector_width = p.collector_width[0],
      .solar_zenith = p.solar_zenith[0],
      .cross_axis_slope = p.cross_axis_slope[0],
      .pitch = p.pitch[0],
  };
  const Values v = shaded_fraction1d(in);
  expect_true(v.is_scalar(), "shaded_fraction1d: all-scalar inputs -> scalar out");
  expect_near(v.scalar(), p.expected[0], 1e-7, "shaded_fraction1d: scalar inputs struct row 0");
}

void test_cross_section_table_series() {
  const Premises p = build_premises();
  Index idx;
  for (std::size_t i = 0; i < kCases.size(); ++i) idx.push_back("case" + std::to_string(i));

  ShadedFraction1dInputs in{
      .shaded_row_rotation = Series(p.shaded_row_rotation, idx),
      .shading_row_rotation = Values(Series(p.shading_row_rotation, idx)),
      .surface_to_axis_offset = Series(p.surface_to_axis_offset, idx),
      .collector_width = Series(p.collector_width, idx),
      .solar_zenith = Series(p.solar_zenith, idx),
      .cross_axis_slope = Series(p.cross_axis_slope, idx),
      .pitch = Series(p.pitch, idx),
      .solar_azimuth = Series(std::vector<double>(kCases.size(), 180.0), idx),
      .axis_azimuth = Series(std::vector<double>(kCases.size(), 90.0), idx),
  };

  const Values sf = shaded_fraction1d(in);
  expect_true(sf.is_series(), "shaded_fraction1d: series in -> series out");
  expect_true(sf.series().index() == idx, "shaded_fraction1d: labels preserved");
  for (std::size_t i = 0; i < p.expected.size(); ++i) {
    expect_near(sf.series().at(idx[i]), p.expected[i], 1e-6, "shaded_fraction1d: series " + idx[i]);
  }
}

void test_unprovided_shading_row_rotation() {
  // rotation, offset, width, zenith, slope, pitch, solar az, axis az, expected
  const std::vector<double> zenith = {60, 79, 90};
  const std::vector<double> expected = {0, 0.5, 1};

  ShadedFraction1dInputs in{
      .shaded_row_rotation = 30.0,
      .surface_to_axis_offset = 0.0,
      .collector_width = 5.7735,
      .solar_zenith = zenith,
      .cross_axis_slope = 0.0,
      .pitch = 5.0,
      .solar_azimuth = 90.0,
      .axis_azimuth = 180.0,
  };
  expect_true(!in.shading_row_rotation.has_value(), "shaded_fraction1d: shading rotation left unset");

  const Values sf = shaded_fraction1d(in);
  expect_true(sf.is_array() && sf.size() == 3, "shaded_fraction1d: array in -> array out");
  for (std::size_t i = 0; i < expected.size(); ++i) {
    expect_near(sf.at(i), expected[i], 1e-2,
                "shaded_fraction1d: unprovided shading rotation at zenith " + std::to_string(zenith[i]));
    expect_near(sf.at(i), shaded_fraction1d(30.0, 30.0, 0.0, 5.7735, zenith[i], 0.0, 5.0, 90.0, 180.0), 0.0,
                "shaded_fraction1d: default equals explicit equal rotation");
  }
}

void test_bounds_and_monotonicity() {
  // Sweep the sun down to the horizon for rows moving in unison.
  double prev = -1.0;
  bool monotonic = true;
  bool bounded = true;
  for (int z = 60; z <= 90; ++z) {
    const double v = shaded_fraction1d(30.0, 30.0, 0.0, 5.7735, z, 0.0, 5.0, 90.0, 180.0);
    if (!(v >= 0.0 && v <= 1.0)) bounded = false;
    if (v < prev) monotonic = false;
    prev = v;
  }
  expect_true(bounded, "shaded_fraction1d: stays within [0, 1]");
  expect_true(monotonic, "shaded_fraction1d: non-decreasing as the sun lowers");

  // Shaded row edge-on to the shadow rays.
  for (double shading : {-60.0, 0.0, 45.0, 90.0}) {
    const double v = shaded_fraction_cross_section(90.0, shading, 0.05, 0.5, 0.0, 0.0, 1.0);
    expect_true(is_finite(v) && v >= 0.0 && v <= 1.0,
                "shaded_fraction_cross_section: edge-on shaded row is finite, shading " + std::to_string(shading));
  }

  // Wide spacing: the shadow never reaches the next row.
  expect_true(shaded_fraction1d(0.0, 0.0, 0.0, 1.0, 30.0, 0.0, 50.0) == 0.0,
              "shaded_fraction1d: distant rows give exactly 0");
  // Low sun with the shading row uphill: overshoot clips to exactly 1.
  expect_true(shaded_fraction1d(30.0, 30.0, 0.0, 1.0, 80.0, -20.0, 1.05) == 1.0,
              "shaded_fraction1d: full occlusion gives exactly 1");
}

void test_sun_side() {
  expect_true(sun_side(12.0) == SunSide::Positive, "sun_side: positive angle");
  expect_true(sun_side(-0.1) == SunSide::Negative, "sun_side: negative angle");
  expect_true(sun_side(0.0) == SunSide::Overhead, "sun_side: zero is overhead");
  expect_true(sun_side(-0.0) == SunSide::Overhead, "sun_side: negative zero is overhead");
  expect_true(std::string(to_string(SunSide::Overhead)) == "Overhead", "sun_side: name");

  // Overhead sun: the axis offset has no effect on the shadow edge.
  const double a = shaded_fraction_cross_section(25.0, 50.0, 0.0, 0.5, 0.0, 0.0, 0.6);
  const double b = shaded_fraction_cross_section(25.0, 50.0, 0.2, 0.5, 0.0, 0.0, 0.6);
  expect_near(a, b, 0.0, "shaded_fraction_cross_section: offset ignored with sun overhead");
}

void test_defaults_and_shapes() {
  TrackerDefaults d;
  ShadedFraction1dInputs in;
  in.solar_azimuth = 12.0;
  in.apply_defaults(d);
  expect_true(in.solar_azimuth.scalar() == 180.0 && in.axis_azimuth.scalar() == 90.0 &&
                  in.axis_tilt.scalar() == 0.0,
              "ShadedFraction1dInputs: apply_defaults restores 180/90/0");

  TrackerDefaults bad;
  bad.axis_tilt_deg = 120.0;
  bool threw = false;
  try {
    in.apply_defaults(bad);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "ShadedFraction1dInputs: invalid defaults throw ValidationError");

  // Mixed scalar + series: the series decides the shape.
  const Series zen({70.0, 80.0, 85.0}, Index{"t0", "t1", "t2"});
  ShadedFraction1dInputs mixed{
      .shaded_row_rotation = 20.0,
      .collector_width = 2.0,
      .solar_zenith = zen,
      .pitch = 5.0,
  };
  const Values out = shaded_fraction1d(mixed);
  expect_true(out.is_series() && out.series().same_index(zen), "shaded_fraction1d: mixed scalar/series keeps labels");

  mixed.pitch = std::vector<double>{5.0, 5.0};
  threw = false;
  try {
    (void)shaded_fraction1d(mixed);
  } catch (const ShapeError&) {
    threw = true;
  }
  expect_true(threw, "shaded_fraction1d: mismatched lengths throw ShapeError");
}

void test_required_inputs() {
  // Row geometry left out: no silent fallback to a unit layout.
  const ShadedFraction1dInputs no_pitch{
      .shaded_row_rotation = 30.0,
      .collector_width = 2.0,
      .solar_zenith = 85.0,
      .solar_azimuth = 90.0,
      .axis_azimuth = 180.0,
  };
  std::string what;
  try {
    (void)shaded_fraction1d(no_pitch);
  } catch (const ValidationError& e) {
    what = e.what();
  }
  expect_true(what == "shaded_fraction1d: pitch is required", "shaded_fraction1d: missing pitch throws ValidationError");

  const ShadedFraction1dInputs no_geometry{
      .shaded_row_rotation = 30.0,
      .solar_zenith = 85.0,
  };
  what.clear();
  try {
    (void)shaded_fraction1d(no_geometry);
  } catch (const ValidationError& e) {
    what = e.what();
  }
  expect_true(what == "shaded_fraction1d: collector_width is required",
              "shaded_fraction1d: missing collector width throws ValidationError");

  const ShadedFraction1dInputs no_sun{
      .shaded_row_rotation = 30.0,
      .collector_width = 2.0,
      .pitch = 5.0,
  };
  what.clear();
  try {
    (void)shaded_fraction1d(no_sun);
  } catch (const ValidationError& e) {
    what = e.what();
  }
  expect_true(what == "shaded_fraction1d: solar_zenith is required",
              "shaded_fraction1d: missing solar zenith throws ValidationError");
}

void test_row_geometry_overload() {
  RowGeometry row;
  row.surface_tilt_deg = 30.0;
  row.pitch = 5.0;
  row.collector_width = 5.7735;
  row.surface_to_axis_offset = 0.1;
  row.cross_axis_slope_deg = 5.0;

  for (double zenith : {60.0, 79.0, 85.0}) {
    expect_near(shaded_fraction1d(row, 25.0, zenith, 90.0, 180.0),
                shaded_fraction1d(30.0, 25.0, 0.1, 5.7735, zenith, 5.0, 5.0, 90.0, 180.0), 0.0,
                "shaded_fraction1d: RowGeometry overload at zenith " + std::to_string(zenith));
  }

  row.cross_axis_slope_deg = 90.0;
  bool threw = false;
  try {
    (void)shaded_fraction1d(row, 25.0, 60.0);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "shaded_fraction1d: invalid RowGeometry throws ValidationError");
}

}  // namespace
}  // namespace rowshade

int main() {
  using namespace rowshade;

  test_cross_section_table_scalar();
  test_cross_section_table_series();
  test_unprovided_shading_row_rotation();
  test_bounds_and_monotonicity();
  test_sun_side();
  test_defaults_and_shapes();
  test_required_inputs();
  test_row_geometry_overload();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
