#pragma once
/*
================================================================================
Series: Labeled Sequence + Scalar/Array/Series Carrier
FILE: cpp/engine/series/series.hpp

Purpose:
  - Series: ordered doubles aligned to a label index (e.g. timestamps). The
    index is shared between a Series and every result derived from it.
  - Values: exactly one of scalar / plain array / Series. Every public shading
    function has a Values overload whose result mirrors the richest input.

Ranking (used for result shape):
  Scalar < Array < Series
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rowshade {

using Label = std::string;
using Index = std::vector<Label>;

class Series {
 public:
  Series();

  // Range index "0".."n-1".
  explicit Series(std::vector<double> values);

  // Throws ShapeError when index and values differ in length.
  Series(std::vector<double> values, Index index);
  Series(std::vector<double> values, std::shared_ptr<const Index> index);

  std::size_t size() const noexcept { return values_.size(); }
  bool empty() const noexcept { return values_.empty(); }

  double operator[](std::size_t i) const { return values_[i]; }

  // Label lookup. Throws ShapeError when the label is absent.
  double at(const Label& label) const;

  const std::vector<double>& values() const noexcept { return values_; }
  const Index& index() const noexcept { return *index_; }
  const std::shared_ptr<const Index>& shared_index() const noexcept { return index_; }

  // Same length and equal labels in the same order.
  bool same_index(const Series& other) const noexcept;

  static std::shared_ptr<const Index> range_index(std::size_t n);

 private:
  std::vector<double> values_;
  std::shared_ptr<const Index> index_;
};

class Values {
 public:
  enum class Kind : std::uint8_t { Scalar = 0, Array = 1, Series = 2 };

  Values(double v) : data_(v) {}
  Values(std::vector<double> v) : data_(std::move(v)) {}
  Values(rowshade::Series s) : data_(std::move(s)) {}

  Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }
  bool is_scalar() const noexcept { return kind() == Kind::Scalar; }
  bool is_array() const noexcept { return kind() == Kind::Array; }
  bool is_series() const noexcept { return kind() == Kind::Series; }

  // 1 for scalars.
  std::size_t size() const noexcept;

  // Element i; scalars broadcast to every position.
  double at(std::size_t i) const noexcept;

  // Typed access. Throws ShapeError on the wrong kind.
  double scalar() const;
  const std::vector<double>& array() const;
  const rowshade::Series& series() const;

  // Values in order regardless of kind (a scalar gives one element).
  std::vector<double> to_vector() const;

 private:
  std::variant<double, std::vector<double>, rowshade::Series> data_;
};

const char* to_string(Values::Kind k) noexcept;

} // namespace rowshade
