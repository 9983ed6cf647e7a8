#pragma once
/*
================================================================================
Shading: One-Dimensional Shaded Fraction Between Adjacent Rows
FILE: cpp/engine/shading/shaded_fraction.hpp

Fraction of a collector row's width that lies in the shadow of the adjacent
row, in the cross-section perpendicular to the rotation axes.

Cross-section model:
  - Two rows on terrain sloped cross_axis_slope degrees, axes `pitch` apart
    (measured horizontally).
  - Each collector has width w and sits surface_to_axis_offset above its
    rotation axis; rotations are signed angles from horizontal.
  - The shadow direction is the projected solar zenith angle psi of the
    rotation axis. The shading row is the one on the sun's side.

Closed form (all lengths normalized by w):

  t* = 1/2 + K / |cos(theta_shaded - psi)|

  K  = |cos(theta_shading - psi)| / 2
     + side * (z0 / w) * (sin(theta_shaded - psi) - sin(theta_shading - psi))
     - (pitch / w) * cos(psi - slope) / cos(slope)

  side is +1, 0 or -1 for SunSide::Positive, Overhead, Negative.
  The result is t* clipped to [0, 1].

Degenerate cases:
  - Shaded row edge-on to the sun (cos(theta_shaded - psi) == 0): the limit of
    t*, i.e. 1 when K > 0 and 0 otherwise.
  - Rows whose shadow misses the other row clip to exactly 0; full occlusion
    clips to exactly 1.

References:
  K. Anderson, "Shade fraction for a row of single-axis trackers on sloped
  terrain", 2024 (test data doi:10.5281/zenodo.10513987)
================================================================================
*/

#include "engine/core/row_geometry.hpp"
#include "engine/core/settings.hpp"
#include "engine/series/series.hpp"

#include <cstdint>
#include <optional>

namespace rowshade {

// Which side of the rotation axis the sun is on, from the sign of the
// projected solar zenith angle.
enum class SunSide : std::int8_t { Negative = -1, Overhead = 0, Positive = 1 };

SunSide sun_side(double projected_solar_zenith) noexcept;

const char* to_string(SunSide s) noexcept;

// Cross-section kernel: takes the projected solar zenith angle directly.
double shaded_fraction_cross_section(double shaded_row_rotation,
                                     double shading_row_rotation,
                                     double surface_to_axis_offset,
                                     double collector_width,
                                     double projected_solar_zenith,
                                     double cross_axis_slope,
                                     double pitch) noexcept;

// Full scalar entry point: projects the sun position first.
double shaded_fraction1d(double shaded_row_rotation,
                         double shading_row_rotation,
                         double surface_to_axis_offset,
                         double collector_width,
                         double solar_zenith,
                         double cross_axis_slope,
                         double pitch,
                         double solar_azimuth = 180.0,
                         double axis_azimuth = 90.0,
                         double axis_tilt = 0.0) noexcept;

// Scalar-or-sequence arguments. Fill with designated initializers:
//   shaded_fraction1d({.shaded_row_rotation = s, .collector_width = 0.5, ...})
// collector_width, solar_zenith and pitch have no default; leaving one unset
// makes shaded_fraction1d throw ValidationError.
struct ShadedFraction1dInputs {
  Values shaded_row_rotation = 0.0;
  // Absent: the rows rotate in unison (shading == shaded rotation).
  std::optional<Values> shading_row_rotation;
  Values surface_to_axis_offset = 0.0;
  std::optional<Values> collector_width;
  std::optional<Values> solar_zenith;
  Values cross_axis_slope = 0.0;
  std::optional<Values> pitch;
  Values solar_azimuth = 180.0;
  Values axis_azimuth = 90.0;
  Values axis_tilt = 0.0;

  // Replace the azimuth/tilt defaults with the configured ones.
  void apply_defaults(const TrackerDefaults& d);
};

Values shaded_fraction1d(const ShadedFraction1dInputs& in);

// Layout record for the shaded row: its rotation, width, offset, pitch and
// slope come from `row`. Throws ValidationError if `row` is invalid.
double shaded_fraction1d(const RowGeometry& row,
                         double shading_row_rotation,
                         double solar_zenith,
                         double solar_azimuth = 180.0,
                         double axis_azimuth = 90.0,
                         double axis_tilt = 0.0);

} // namespace rowshade
