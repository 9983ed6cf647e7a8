/*
  Ground / Masking Angle Selftest

  Objective
  ---------
  Framework-free checks for engine/shading/masking:
    1) Literal ground-angle and masking-angle values for a 2:1 pitch layout.
    2) Passias average masking angle and its sky-diffuse loss.
    3) GCR = 0 and tilt = 0 map to zero angle / zero loss.
    4) Sky-diffuse loss is monotonic over [0, 90] degrees.
    5) Series inputs come back as Series on the same index.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/row_geometry.hpp"
#include "engine/series/series.hpp"
#include "engine/shading/masking.hpp"

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

// Three hourly samples shared by the masking fixtures.
Index hourly_index() {
  return {"2019-01-01T00:00", "2019-01-01T01:00", "2019-01-01T02:00"};
}

Series surface_tilt_series() {
  return Series({0.0, 20.0, 90.0}, hourly_index());
}

// GCR = 0.5, slant height 0.25
const std::vector<double> kMaskingAngle = {0.0, 11.20223712, 20.55604522};
// GCR = 0.5
const std::vector<double> kAverageMaskingAngle = {0.0, 7.20980655, 13.779867461};
const std::vector<double> kShadingLoss = {0.0, 0.00395338, 0.01439098};

void test_ground_angle() {
  const std::vector<double> x = {0.0, 0.5, 1.0};
  const std::vector<double> expected = {0.0, 5.866738789543952, 9.896090638982903};

  const Values angles = ground_angle(30.0, 0.5, x);
  expect_true(angles.is_array(), "ground_angle: array in -> array out");
  expect_true(angles.size() == 3, "ground_angle: length preserved");
  for (std::size_t i = 0; i < expected.size(); ++i) {
    expect_near(angles.at(i), expected[i], 1e-8, "ground_angle: literal value " + std::to_string(i));
  }

  const Values zero = ground_angle(30.0, 0.0, x);
  for (std::size_t i = 0; i < zero.size(); ++i) {
    expect_true(zero.at(i) == 0.0, "ground_angle: gcr=0 gives 0 at x=" + std::to_string(x[i]));
  }

  const Index where = {"lower-edge", "middle", "upper-edge"};
  const Values along = ground_angle(30.0, 0.5, Series(x, where));
  expect_true(along.is_series(), "ground_angle: series in -> series out");
  expect_true(along.series().index() == where, "ground_angle: index preserved");
  for (std::size_t i = 0; i < expected.size(); ++i) {
    expect_near(along.series().at(where[i]), expected[i], 1e-8, "ground_angle: series value " + where[i]);
  }

  RowGeometry row;
  row.surface_tilt_deg = 30.0;
  row.pitch = 2.0;
  row.collector_width = 1.0;
  expect_near(ground_angle(row, 1.0), expected[2], 1e-12, "ground_angle: RowGeometry overload");
}

void test_masking_angle() {
  const Series tilt = surface_tilt_series();

  const Values actual = masking_angle(tilt, 0.5, 0.25);
  expect_true(actual.is_series(), "masking_angle: series in -> series out");
  expect_true(actual.series().index() == tilt.index(), "masking_angle: index preserved");
  for (std::size_t i = 0; i < kMaskingAngle.size(); ++i) {
    expect_near(actual.at(i), kMaskingAngle[i], 1e-7, "masking_angle: series value " + std::to_string(i));
    expect_near(masking_angle(tilt[i], 0.5, 0.25), kMaskingAngle[i], 1e-7,
                "masking_angle: scalar value " + std::to_string(i));
  }

  for (std::size_t i = 0; i < tilt.size(); ++i) {
    expect_near(masking_angle(tilt[i], 0.0, 0.25), 0.0, 1e-12, "masking_angle: gcr=0 gives 0");
  }
  for (double h : {0.0, 0.25, 0.5, 1.0}) {
    expect_near(masking_angle(0.0, 0.5, h), 0.0, 1e-12, "masking_angle: tilt=0 gives 0");
  }
  expect_near(masking_angle(30.0, 0.5), masking_angle(30.0, 0.5, 0.0), 0.0,
              "masking_angle: slant height defaults to bottom edge");

  // The sequence overload takes the same default.
  const Values bottom = masking_angle(tilt, 0.5);
  expect_true(bottom.is_series() && bottom.series().same_index(tilt), "masking_angle: default slant height keeps labels");
  for (std::size_t i = 0; i < tilt.size(); ++i) {
    expect_near(bottom.at(i), masking_angle(tilt.values()[i], 0.5), 0.0,
                "masking_angle: default slant height matches scalar " + std::to_string(i));
  }
}

void test_masking_angle_passias() {
  const Series tilt = surface_tilt_series();

  const Values actual = masking_angle_passias(tilt, 0.5);
  expect_true(actual.is_series(), "masking_angle_passias: series in -> series out");
  expect_true(actual.series().same_index(tilt), "masking_angle_passias: index preserved");
  for (std::size_t i = 0; i < kAverageMaskingAngle.size(); ++i) {
    expect_near(actual.at(i), kAverageMaskingAngle[i], 1e-7,
                "masking_angle_passias: series value " + std::to_string(i));
    expect_near(masking_angle_passias(tilt[i], 0.5), kAverageMaskingAngle[i], 1e-7,
                "masking_angle_passias: scalar value " + std::to_string(i));
  }

  expect_true(masking_angle_passias(0.0, 0.5) == 0.0, "masking_angle_passias: tilt=0 gives exactly 0");
  expect_true(masking_angle_passias(35.0, 0.0) == 0.0, "masking_angle_passias: gcr=0 gives exactly 0");

  // Averaging over the row can never exceed the angle seen from the bottom edge.
  for (double t : {5.0, 20.0, 45.0, 70.0, 90.0}) {
    const double avg = masking_angle_passias(t, 0.4);
    expect_true(avg > 0.0 && avg < masking_angle(t, 0.4, 0.0),
                "masking_angle_passias: between 0 and bottom-edge angle at tilt " + std::to_string(t));
  }

  RowGeometry row;
  row.surface_tilt_deg = 20.0;
  row.pitch = 4.0;
  row.collector_width = 2.0;
  expect_near(masking_angle_passias(row), kAverageMaskingAngle[1], 1e-7,
              "masking_angle_passias: RowGeometry overload uses gcr()");
}

void test_sky_diffuse_passias() {
  const Series avg(kAverageMaskingAngle, hourly_index());

  const Values loss = sky_diffuse_passias(avg);
  expect_true(loss.is_series(), "sky_diffuse_passias: series in -> series out");
  expect_true(loss.series().same_index(avg), "sky_diffuse_passias: index preserved");
  for (std::size_t i = 0; i < kShadingLoss.size(); ++i) {
    expect_near(loss.at(i), kShadingLoss[i], 1e-8, "sky_diffuse_passias: series value " + std::to_string(i));
    expect_near(sky_diffuse_passias(avg[i]), kShadingLoss[i], 1e-8,
                "sky_diffuse_passias: scalar value " + std::to_string(i));
  }

  expect_true(sky_diffuse_passias(0.0) == 0.0, "sky_diffuse_passias: zero angle gives zero loss");

  bool monotonic = true;
  double prev = sky_diffuse_passias(0.0);
  for (int a = 1; a <= 90; ++a) {
    const double cur = sky_diffuse_passias(static_cast<double>(a));
    if (cur < prev) monotonic = false;
    prev = cur;
  }
  expect_true(monotonic, "sky_diffuse_passias: non-decreasing over [0, 90]");
  expect_near(sky_diffuse_passias(90.0), 0.5, 1e-12, "sky_diffuse_passias: 90 deg loses half the sky");
}

void test_shape_mismatch() {
  bool threw = false;
  try {
    (void)masking_angle(surface_tilt_series(), std::vector<double>{0.5, 0.5}, 0.25);
  } catch (const ShapeError&) {
    threw = true;
  }
  expect_true(threw, "masking_angle: mismatched sequence lengths throw ShapeError");

  threw = false;
  try {
    const Series other({0.5, 0.5, 0.5}, Index{"a", "b", "c"});
    (void)masking_angle_passias(surface_tilt_series(), other);
  } catch (const ShapeError&) {
    threw = true;
  }
  expect_true(threw, "masking_angle_passias: mismatched series labels throw ShapeError");
}

}  // namespace
}  // namespace rowshade

int main() {
  using namespace rowshade;

  test_ground_angle();
  test_masking_angle();
  test_masking_angle_passias();
  test_sky_diffuse_passias();
  test_shape_mismatch();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
