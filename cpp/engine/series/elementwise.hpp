#pragma once
/*
================================================================================
Series: Elementwise Broadcasting
FILE: cpp/engine/series/elementwise.hpp

Contract:
  - Scalars broadcast against any sequence.
  - All non-scalar arguments of one call must have the same length.
  - All Series arguments of one call must carry equal indices.
  - The result takes the richest kind among the arguments; a Series result
    shares the index of the first Series argument.
  - Any violation throws ShapeError naming the operation and argument.

The kernel is the plain double formula; this layer only walks positions, so
the i-th output always corresponds to the i-th input of every argument.
================================================================================
*/

#include "engine/series/series.hpp"

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace rowshade {

struct BroadcastShape {
  Values::Kind kind = Values::Kind::Scalar;
  std::size_t size = 1;
  const Series* labels = nullptr;  // first Series argument, if any
};

// Throws ShapeError if the arguments cannot be aligned.
BroadcastShape resolve_shape(const char* op, std::initializer_list<const Values*> args);
BroadcastShape resolve_shape(const char* op, const std::vector<const Values*>& args);

template <class Kernel, std::same_as<Values>... Vs>
Values elementwise(const char* op, Kernel&& kernel, const Vs&... args) {
  const BroadcastShape shape = resolve_shape(op, {&args...});

  if (shape.kind == Values::Kind::Scalar) {
    return Values(kernel(args.at(0)...));
  }

  std::vector<double> out(shape.size);
  for (std::size_t i = 0; i < shape.size; ++i) {
    out[i] = kernel(args.at(i)...);
  }

  if (shape.kind == Values::Kind::Array) {
    return Values(std::move(out));
  }
  return Values(Series(std::move(out), shape.labels->shared_index()));
}

} // namespace rowshade
