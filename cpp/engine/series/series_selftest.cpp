/*
  Series / Elementwise Selftest

  Objective
  ---------
  Framework-free checks for the aligned-sequence layer:
    1) Series construction, default range index, label lookup.
    2) Values kind reporting and typed access failures.
    3) Broadcasting: richest kind wins, scalars broadcast, element i of the
       output pairs with element i of every input.
    4) Shape contract: mismatched lengths or labels throw ShapeError.

  Non-zero return code indicates failure.
*/

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/series/elementwise.hpp"
#include "engine/series/series.hpp"

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

template <class Fn>
void expect_shape_error(Fn&& fn, std::string_view msg) {
  bool threw = false;
  try {
    fn();
  } catch (const ShapeError&) {
    threw = true;
  }
  expect_true(threw, msg);
}

double add3(double a, double b, double c) { return a + 10.0 * b + 100.0 * c; }

void test_series_basics() {
  const Series plain(std::vector<double>{1.0, 2.0, 3.0});
  expect_true(plain.size() == 3, "Series: size");
  expect_true(plain.index() == Index{"0", "1", "2"}, "Series: default range index");
  expect_true(plain.at("2") == 3.0, "Series: label lookup");

  const Series labeled({4.0, 5.0}, Index{"a", "b"});
  expect_true(labeled[1] == 5.0 && labeled.at("a") == 4.0, "Series: labeled access");
  expect_true(!labeled.same_index(plain), "Series: different index detected");

  const Series sharing({7.0, 8.0}, labeled.shared_index());
  expect_true(sharing.same_index(labeled), "Series: shared index is the same index");
  expect_true(Series().empty(), "Series: default is empty");

  expect_shape_error([] { Series bad({1.0, 2.0}, Index{"only"}); }, "Series: index/values length mismatch throws");
  expect_shape_error([&] { (void)labeled.at("zzz"); }, "Series: missing label throws");
}

void test_values_kinds() {
  const Values s = 2.5;
  const Values a = std::vector<double>{1.0, 2.0};
  const Values r = Series(std::vector<double>{1.0});

  expect_true(s.is_scalar() && s.size() == 1 && s.at(7) == 2.5, "Values: scalar broadcasts at any position");
  expect_true(a.is_array() && a.size() == 2 && a.at(1) == 2.0, "Values: array");
  expect_true(r.is_series() && r.size() == 1, "Values: series");
  expect_true(std::string(to_string(a.kind())) == "array", "Values: kind name");
  expect_true(a.to_vector() == std::vector<double>{1.0, 2.0}, "Values: to_vector from array");
  expect_true(s.to_vector() == std::vector<double>{2.5}, "Values: to_vector from scalar");

  expect_shape_error([&] { (void)s.array(); }, "Values: scalar read as array throws");
  expect_shape_error([&] { (void)a.series(); }, "Values: array read as series throws");
  expect_shape_error([&] { (void)r.scalar(); }, "Values: series read as scalar throws");
}

void test_broadcasting() {
  const Values out_s = elementwise("add3", add3, Values(1.0), Values(2.0), Values(3.0));
  expect_true(out_s.is_scalar() && out_s.scalar() == 321.0, "elementwise: all scalar -> scalar");

  const Values out_a = elementwise("add3", add3, Values(std::vector<double>{1.0, 2.0}), Values(0.0),
                                   Values(std::vector<double>{3.0, 4.0}));
  expect_true(out_a.is_array() && out_a.array() == std::vector<double>{301.0, 402.0},
              "elementwise: arrays pair positionally, scalars broadcast");

  const Series ser({1.0, 2.0}, Index{"t0", "t1"});
  const Values out_r = elementwise("add3", add3, Values(std::vector<double>{5.0, 6.0}), Values(ser), Values(0.0));
  expect_true(out_r.is_series(), "elementwise: series outranks array");
  expect_true(out_r.series().same_index(ser), "elementwise: output carries the series index");
  expect_true(out_r.series().at("t1") == 26.0, "elementwise: label t1 pairs with position 1");

  expect_shape_error(
      [] {
        (void)elementwise("add3", add3, Values(std::vector<double>{1.0}), Values(std::vector<double>{1.0, 2.0}),
                          Values(0.0));
      },
      "elementwise: array length mismatch throws");
  expect_shape_error(
      [&] {
        const Series other({1.0, 2.0}, Index{"x", "y"});
        (void)elementwise("add3", add3, Values(ser), Values(other), Values(0.0));
      },
      "elementwise: series label mismatch throws");
  expect_shape_error(
      [&] { (void)elementwise("add3", add3, Values(ser), Values(std::vector<double>{1.0, 2.0, 3.0}), Values(0.0)); },
      "elementwise: array vs series length mismatch throws");

  bool named = false;
  try {
    (void)elementwise("my_op", add3, Values(std::vector<double>{1.0}), Values(std::vector<double>{1.0, 2.0}),
                      Values(0.0));
  } catch (const ShapeError& e) {
    named = std::string(e.what()).find("my_op") != std::string::npos;
  }
  expect_true(named, "elementwise: error names the operation");

  const Values empty = elementwise("add3", add3, Values(std::vector<double>{}), Values(1.0), Values(1.0));
  expect_true(empty.is_array() && empty.size() == 0, "elementwise: empty sequence -> empty result");
}

}  // namespace
}  // namespace rowshade

int main() {
  using namespace rowshade;

  test_series_basics();
  test_values_kinds();
  test_broadcasting();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
