#pragma once
/*
================================================================================
Core: Evaluation Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize the knobs the CLI and tools feed into the shading engine:
      * tracker defaults used when a caller omits solar/axis azimuth
      * output formatting for CSV tables
      * log verbosity
  - The math functions themselves take every value as an argument; nothing
    here is global state.

Hardening:
  - validate_or_throw() catches nonsensical values early (ValidationError).
================================================================================
*/

#include "engine/core/angles.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace rowshade {

// ----------------------------- Tracker defaults ------------------------------
// The 180/90 azimuth pairing is the documented default of shaded_fraction1d.
// With a horizontal axis it makes the projected solar zenith angle equal the
// solar zenith angle, so cross-section test tables can be fed in directly.
struct TrackerDefaults {
  double solar_azimuth_deg = 180.0;
  double axis_azimuth_deg = 90.0;
  double axis_tilt_deg = 0.0;

  void validate_or_throw() const {
    if (!is_finite(solar_azimuth_deg)) {
      throw ValidationError("TrackerDefaults: solar_azimuth_deg must be finite");
    }
    if (!is_finite(axis_azimuth_deg)) {
      throw ValidationError("TrackerDefaults: axis_azimuth_deg must be finite");
    }
    if (!is_finite(axis_tilt_deg) || axis_tilt_deg < -90.0 || axis_tilt_deg > 90.0) {
      throw ValidationError("TrackerDefaults: axis_tilt_deg must be in [-90, 90]");
    }
  }
};

// ----------------------------- Output ----------------------------------------
struct OutputSettings {
  int precision = 6;          // digits after the decimal point in CSV output
  char delimiter = ',';
  bool include_header = true;

  void validate_or_throw() const {
    if (precision < 1 || precision > 17) {
      throw ValidationError("OutputSettings: precision must be in [1, 17]");
    }
    if (delimiter == '\n' || delimiter == '\r' || delimiter == '"') {
      throw ValidationError("OutputSettings: delimiter must not be a newline or quote");
    }
  }
};

// ----------------------------- EvalSettings ----------------------------------
struct EvalSettings {
  TrackerDefaults tracker;
  OutputSettings output;
  LogLevel log_level = LogLevel::WARN;  // stdout carries CSV results

  void validate_or_throw() const {
    tracker.validate_or_throw();
    output.validate_or_throw();
  }

  static EvalSettings defaults() {
    EvalSettings s;
    return s;
  }
};

} // namespace rowshade
