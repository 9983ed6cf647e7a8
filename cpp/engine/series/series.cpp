#include "engine/series/series.hpp"

#include "engine/core/errors.hpp"

#include <sstream>
#include <utility>

namespace rowshade {

Series::Series() : index_(range_index(0)) {}

Series::Series(std::vector<double> values)
    : values_(std::move(values)), index_(range_index(values_.size())) {}

Series::Series(std::vector<double> values, Index index)
    : Series(std::move(values), std::make_shared<const Index>(std::move(index))) {}

Series::Series(std::vector<double> values, std::shared_ptr<const Index> index)
    : values_(std::move(values)), index_(std::move(index)) {
  if (!index_) index_ = range_index(values_.size());
  if (index_->size() != values_.size()) {
    std::ostringstream oss;
    oss << "Series: index length " << index_->size()
        << " does not match values length " << values_.size();
    throw ShapeError(oss.str());
  }
}

double Series::at(const Label& label) const {
  const Index& idx = *index_;
  for (std::size_t i = 0; i < idx.size(); ++i) {
    if (idx[i] == label) return values_[i];
  }
  throw ShapeError("Series::at: label '" + label + "' not in index");
}

bool Series::same_index(const Series& other) const noexcept {
  if (index_ == other.index_) return true;
  return *index_ == *other.index_;
}

std::shared_ptr<const Index> Series::range_index(std::size_t n) {
  Index idx;
  idx.reserve(n);
  for (std::size_t i = 0; i < n; ++i) idx.push_back(std::to_string(i));
  return std::make_shared<const Index>(std::move(idx));
}

// ------------------------------- Values --------------------------------------

const char* to_string(Values::Kind k) noexcept {
  switch (k) {
    case Values::Kind::Scalar: return "scalar";
    case Values::Kind::Array:  return "array";
    case Values::Kind::Series: return "series";
    default:                   return "unknown";
  }
}

std::size_t Values::size() const noexcept {
  switch (kind()) {
    case Kind::Array:  return std::get<std::vector<double>>(data_).size();
    case Kind::Series: return std::get<rowshade::Series>(data_).size();
    default:           return 1;
  }
}

double Values::at(std::size_t i) const noexcept {
  switch (kind()) {
    case Kind::Array:  return std::get<std::vector<double>>(data_)[i];
    case Kind::Series: return std::get<rowshade::Series>(data_)[i];
    default:           return std::get<double>(data_);
  }
}

double Values::scalar() const {
  if (!is_scalar()) {
    throw ShapeError(std::string("Values: expected scalar, holds ") + to_string(kind()));
  }
  return std::get<double>(data_);
}

const std::vector<double>& Values::array() const {
  if (!is_array()) {
    throw ShapeError(std::string("Values: expected array, holds ") + to_string(kind()));
  }
  return std::get<std::vector<double>>(data_);
}

const rowshade::Series& Values::series() const {
  if (!is_series()) {
    throw ShapeError(std::string("Values: expected series, holds ") + to_string(kind()));
  }
  return std::get<rowshade::Series>(data_);
}

std::vector<double> Values::to_vector() const {
  switch (kind()) {
    case Kind::Array:  return std::get<std::vector<double>>(data_);
    case Kind::Series: return std::get<rowshade::Series>(data_).values();
    default:           return {std::get<double>(data_)};
  }
}

} // namespace rowshade
