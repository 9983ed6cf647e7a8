/*
  Core Selftest

  Objective
  ---------
  Framework-free checks for engine/core:
    1) Degree trigonometry matches the radian library and stays in domain.
    2) RowGeometry GCR and validation (including the "no neighbour" pitch).
    3) Settings validation rejects nonsense values.
    4) Logging never throws and honours the level filter.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "engine/core/angles.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/row_geometry.hpp"
#include "engine/core/settings.hpp"

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

template <class Fn>
void expect_validation_error(Fn&& fn, std::string_view msg) {
  bool threw = false;
  try {
    fn();
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, msg);
}

void test_angles() {
  expect_near(sind(30.0), 0.5, 1e-15, "sind(30)");
  expect_near(cosd(60.0), 0.5, 1e-15, "cosd(60)");
  expect_near(tand(45.0), 1.0, 1e-15, "tand(45)");
  expect_near(atand(1.0), 45.0, 1e-12, "atand(1)");
  expect_near(atand(-1e300), -90.0, 1e-12, "atand saturates at -90");
  expect_near(atan2d(-1.0, -1.0), -135.0, 1e-12, "atan2d covers the third quadrant");
  expect_near(asind(1.0 + 1e-15), 90.0, 1e-12, "asind clips rounding noise above 1");
  expect_near(acosd(-1.0 - 1e-15), 180.0, 1e-12, "acosd clips rounding noise below -1");
  expect_near(degrees(radians(123.456)), 123.456, 1e-12, "degrees(radians(x)) == x");

  expect_true(sign(3.0) == 1 && sign(-2.0) == -1 && sign(0.0) == 0 && sign(-0.0) == 0, "sign: three-way");
  expect_true(clamp01(-0.2) == 0.0 && clamp01(1.7) == 1.0 && clamp01(0.3) == 0.3, "clamp01");
  expect_true(!is_finite(std::numeric_limits<double>::quiet_NaN()) && is_finite(1.0), "is_finite");
}

void test_row_geometry() {
  RowGeometry row;
  row.surface_tilt_deg = 25.0;
  row.pitch = 5.0;
  row.collector_width = 2.0;
  row.validate_or_throw();
  expect_near(row.gcr(), 0.4, 1e-15, "RowGeometry: gcr = width / pitch");

  RowGeometry lone = row;
  lone.pitch = std::numeric_limits<double>::infinity();
  lone.validate_or_throw();
  expect_true(lone.gcr() == 0.0, "RowGeometry: infinite pitch gives gcr 0");

  expect_validation_error([&] { RowGeometry r = row; r.pitch = 0.0; r.validate_or_throw(); },
                          "RowGeometry: zero pitch rejected");
  expect_validation_error([&] { RowGeometry r = row; r.collector_width = -1.0; r.validate_or_throw(); },
                          "RowGeometry: negative width rejected");
  expect_validation_error([&] { RowGeometry r = row; r.cross_axis_slope_deg = 90.0; r.validate_or_throw(); },
                          "RowGeometry: vertical terrain rejected");
  expect_validation_error(
      [&] { RowGeometry r = row; r.surface_to_axis_offset = std::nan(""); r.validate_or_throw(); },
      "RowGeometry: NaN offset rejected");
}

void test_settings() {
  EvalSettings s = EvalSettings::defaults();
  s.validate_or_throw();
  expect_true(s.tracker.solar_azimuth_deg == 180.0 && s.tracker.axis_azimuth_deg == 90.0,
              "EvalSettings: default 180/90 azimuth pairing");

  expect_validation_error([] { EvalSettings e; e.output.precision = 0; e.validate_or_throw(); },
                          "OutputSettings: precision 0 rejected");
  expect_validation_error([] { EvalSettings e; e.output.delimiter = '\n'; e.validate_or_throw(); },
                          "OutputSettings: newline delimiter rejected");
  expect_validation_error([] { EvalSettings e; e.tracker.axis_tilt_deg = 95.0; e.validate_or_throw(); },
                          "TrackerDefaults: axis tilt beyond vertical rejected");
}

void test_logging() {
  const LogLevel before = get_log_level();
  set_log_level(LogLevel::ERROR);
  expect_true(get_log_level() == LogLevel::ERROR, "logging: level round-trips");
  log_debug("filtered out");
  log_info("filtered out");
  log_warn("filtered out");
  expect_true(std::string(to_string(LogLevel::WARN)) == "WARN", "logging: level tag");
  set_log_level(before);
}

}  // namespace
}  // namespace rowshade

int main() {
  using namespace rowshade;

  test_angles();
  test_row_geometry();
  test_settings();
  test_logging();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
