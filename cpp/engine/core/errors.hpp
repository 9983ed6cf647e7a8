#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Provide uniform exception types so validation and shape failures are:
      * searchable
      * catchable by category
      * reportable to the CLI cleanly

Policy:
  - Math kernels do not throw for numeric input. Degenerate geometry maps to a
    limiting value (usually 0) instead of NaN/Inf.
  - Exceptions are reserved for the boundary: invalid configuration, and
    sequence arguments whose lengths/labels disagree.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace rowshade {

// Base error for the engine.
class RowShadeError : public std::runtime_error {
 public:
  explicit RowShadeError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public RowShadeError {
 public:
  explicit ValidationError(std::string msg) : RowShadeError(std::move(msg)) {}
};

// Thrown when aligned sequences passed together disagree in length or labels,
// or when a Values carrier is read as the wrong kind.
class ShapeError : public RowShadeError {
 public:
  explicit ShapeError(std::string msg) : RowShadeError(std::move(msg)) {}
};

} // namespace rowshade
