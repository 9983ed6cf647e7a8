/*
  Values CSV Selftest

  Objective
  ---------
  Framework-free checks for engine/exports/values_csv:
    1) Series rows carry their labels; arrays get positional labels.
    2) NaN/Inf never reach the output as literals.
    3) Labels needing quotes are quoted; header can be disabled.
    4) Multi-column tables align their columns or throw ShapeError.

  Non-zero return code indicates failure.
*/

#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/exports/values_csv.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void test_series_rows() {
  const Series s({0.25, 0.5}, Index{"2019-01-01T08:00", "2019-01-01T09:00"});
  OutputSettings opt;
  opt.precision = 3;
  expect_eq_str(values_to_csv(s, "shaded_fraction", opt),
                "label,shaded_fraction\n2019-01-01T08:00,0.250\n2019-01-01T09:00,0.500\n",
                "CSV: series labels become the first column");
}

void test_scalar_and_array() {
  OutputSettings opt;
  opt.precision = 2;
  opt.include_header = false;
  expect_eq_str(values_to_csv(1.0, "x", opt), "0,1.00\n", "CSV: scalar renders as one row");
  expect_eq_str(values_to_csv(std::vector<double>{1.0, 2.5}, "x", opt), "0,1.00\n1,2.50\n",
                "CSV: array gets positional labels");
}

void test_non_finite_and_escaping() {
  OutputSettings opt;
  opt.include_header = false;
  const Series s({std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()},
                 Index{"a,b", "say \"hi\""});
  const std::string out = values_to_csv(s, "v", opt);
  expect_true(out.find("nan") == std::string::npos && out.find("inf") == std::string::npos,
              "CSV: no nan/inf literals");
  expect_eq_str(out, "\"a,b\",\n\"say \"\"hi\"\"\",\n", "CSV: labels quoted and escaped");

  bool threw = false;
  try {
    OutputSettings bad;
    bad.precision = 99;
    (void)values_to_csv(1.0, "x", bad);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "CSV: invalid settings throw ValidationError");
}

void test_columns() {
  const Values angle = Series({7.25, 13.5}, Index{"t0", "t1"});
  const Values loss = std::vector<double>{0.004, 0.0144};
  OutputSettings opt;
  opt.precision = 4;

  std::ostringstream oss;
  write_columns_csv(oss, {{"angle", &angle}, {"loss", &loss}}, opt);
  expect_eq_str(oss.str(), "label,angle,loss\nt0,7.2500,0.0040\nt1,13.5000,0.0144\n",
                "CSV: columns share the series labels");

  const Values scale = 2.0;
  std::ostringstream broadcast;
  opt.include_header = false;
  write_columns_csv(broadcast, {{"loss", &loss}, {"scale", &scale}}, opt);
  expect_eq_str(broadcast.str(), "0,0.0040,2.0000\n1,0.0144,2.0000\n", "CSV: scalar column repeats");

  const Values shorter = std::vector<double>{1.0};
  bool threw = false;
  try {
    std::ostringstream sink;
    write_columns_csv(sink, {{"loss", &loss}, {"short", &shorter}}, opt);
  } catch (const ShapeError&) {
    threw = true;
  }
  expect_true(threw, "CSV: columns of different lengths throw ShapeError");
}

}  // namespace
}  // namespace rowshade

int main() {
  using namespace rowshade;

  test_series_rows();
  test_scalar_and_array();
  test_non_finite_and_escaping();
  test_columns();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
