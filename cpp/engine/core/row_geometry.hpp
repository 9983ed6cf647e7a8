#pragma once
/*
================================================================================
Core: Row Geometry Record
FILE: cpp/engine/core/row_geometry.hpp

Purpose:
  - Canonical description of one collector row in a field of parallel rows.
  - Single source of truth for the ground coverage ratio (GCR).

Units:
  - Angles in degrees. Lengths in any consistent unit (pitch, collector width
    and surface-to-axis offset must share it).

Notes:
  - pitch = +inf is accepted and means "no neighbouring row" (GCR = 0).
================================================================================
*/

#include <cmath>

#include "engine/core/angles.hpp"
#include "engine/core/errors.hpp"

namespace rowshade {

struct RowGeometry {
  double surface_tilt_deg = 0.0;        // signed rotation from horizontal
  double pitch = 1.0;                   // row-to-row spacing, axis to axis
  double collector_width = 0.5;         // cross-section width of the collector
  double surface_to_axis_offset = 0.0;  // rotation axis to collector surface
  double cross_axis_slope_deg = 0.0;    // terrain slope perpendicular to the axis

  // Ground coverage ratio, collector_width / pitch.
  double gcr() const noexcept {
    if (std::isinf(pitch)) return 0.0;
    return collector_width / pitch;
  }

  void validate_or_throw() const {
    if (!is_finite(surface_tilt_deg) || surface_tilt_deg < -180.0 || surface_tilt_deg > 180.0) {
      throw ValidationError("RowGeometry: surface_tilt_deg must be in [-180, 180]");
    }
    if (std::isnan(pitch) || !(pitch > 0.0)) {
      throw ValidationError("RowGeometry: pitch must be > 0");
    }
    if (!is_finite(collector_width) || !(collector_width > 0.0)) {
      throw ValidationError("RowGeometry: collector_width must be > 0");
    }
    if (!is_finite(surface_to_axis_offset)) {
      throw ValidationError("RowGeometry: surface_to_axis_offset must be finite");
    }
    if (!is_finite(cross_axis_slope_deg) || std::fabs(cross_axis_slope_deg) >= 90.0) {
      throw ValidationError("RowGeometry: cross_axis_slope_deg must be in (-90, 90)");
    }
  }
};

} // namespace rowshade
