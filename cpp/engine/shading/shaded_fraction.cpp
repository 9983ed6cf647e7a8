#include "engine/shading/shaded_fraction.hpp"

#include "engine/core/angles.hpp"
#include "engine/core/errors.hpp"
#include "engine/series/elementwise.hpp"
#include "engine/shading/projection.hpp"

#include <cmath>
#include <string>

namespace rowshade {

SunSide sun_side(double projected_solar_zenith) noexcept {
  if (projected_solar_zenith > 0.0) return SunSide::Positive;
  if (projected_solar_zenith < 0.0) return SunSide::Negative;
  return SunSide::Overhead;
}

const char* to_string(SunSide s) noexcept {
  switch (s) {
    case SunSide::Negative: return "Negative";
    case SunSide::Overhead: return "Overhead";
    case SunSide::Positive: return "Positive";
    default:                return "Unknown";
  }
}

namespace {

// Offset term weight. With the sun overhead both rows' surfaces project onto
// the same line and the offset does not move the shadow edge.
double side_weight(SunSide side) noexcept {
  switch (side) {
    case SunSide::Positive: return 1.0;
    case SunSide::Negative: return -1.0;
    case SunSide::Overhead:
    default:                return 0.0;
  }
}

const Values& required(const std::optional<Values>& v, const char* name) {
  if (!v) {
    throw ValidationError(std::string("shaded_fraction1d: ") + name + " is required");
  }
  return *v;
}

} // namespace

double shaded_fraction_cross_section(double shaded_row_rotation,
                                     double shading_row_rotation,
                                     double surface_to_axis_offset,
                                     double collector_width,
                                     double projected_solar_zenith,
                                     double cross_axis_slope,
                                     double pitch) noexcept {
  const double psi = projected_solar_zenith;
  const double shading_rel = shading_row_rotation - psi;
  const double shaded_rel = shaded_row_rotation - psi;

  const double offset_w = surface_to_axis_offset / collector_width;
  const double pitch_w = pitch / collector_width;

  // Shadow edge position along the shaded row, scaled by |cos(shaded_rel)|.
  const double k = 0.5 * std::fabs(cosd(shading_rel))
                 + side_weight(sun_side(psi)) * offset_w * (sind(shaded_rel) - sind(shading_rel))
                 - pitch_w * cosd(psi - cross_axis_slope) / cosd(cross_axis_slope);

  const double cos_shaded = std::fabs(cosd(shaded_rel));
  if (cos_shaded == 0.0) {
    return k > 0.0 ? 1.0 : 0.0;
  }

  const double t = 0.5 + k / cos_shaded;
  if (!is_finite(t)) {
    return k > 0.0 ? 1.0 : 0.0;
  }
  return clamp01(t);
}

double shaded_fraction1d(double shaded_row_rotation,
                         double shading_row_rotation,
                         double surface_to_axis_offset,
                         double collector_width,
                         double solar_zenith,
                         double cross_axis_slope,
                         double pitch,
                         double solar_azimuth,
                         double axis_azimuth,
                         double axis_tilt) noexcept {
  const double psi = projected_solar_zenith_angle(solar_zenith, solar_azimuth, axis_tilt, axis_azimuth);
  return shaded_fraction_cross_section(shaded_row_rotation,
                                       shading_row_rotation,
                                       surface_to_axis_offset,
                                       collector_width,
                                       psi,
                                       cross_axis_slope,
                                       pitch);
}

void ShadedFraction1dInputs::apply_defaults(const TrackerDefaults& d) {
  d.validate_or_throw();
  solar_azimuth = d.solar_azimuth_deg;
  axis_azimuth = d.axis_azimuth_deg;
  axis_tilt = d.axis_tilt_deg;
}

Values shaded_fraction1d(const ShadedFraction1dInputs& in) {
  const Values& collector_width = required(in.collector_width, "collector_width");
  const Values& solar_zenith = required(in.solar_zenith, "solar_zenith");
  const Values& pitch = required(in.pitch, "pitch");
  const Values& shading = in.shading_row_rotation ? *in.shading_row_rotation : in.shaded_row_rotation;

  return elementwise(
      "shaded_fraction1d",
      [](double shaded, double shading_rot, double offset, double width, double zenith,
         double slope, double pitch, double sun_azi, double axis_azi, double tilt) {
        return shaded_fraction1d(shaded, shading_rot, offset, width, zenith, slope, pitch,
                                 sun_azi, axis_azi, tilt);
      },
      in.shaded_row_rotation, shading, in.surface_to_axis_offset, collector_width,
      solar_zenith, in.cross_axis_slope, pitch, in.solar_azimuth, in.axis_azimuth,
      in.axis_tilt);
}

double shaded_fraction1d(const RowGeometry& row,
                         double shading_row_rotation,
                         double solar_zenith,
                         double solar_azimuth,
                         double axis_azimuth,
                         double axis_tilt) {
  row.validate_or_throw();
  return shaded_fraction1d(row.surface_tilt_deg,
                           shading_row_rotation,
                           row.surface_to_axis_offset,
                           row.collector_width,
                           solar_zenith,
                           row.cross_axis_slope_deg,
                           row.pitch,
                           solar_azimuth,
                           axis_azimuth,
                           axis_tilt);
}

} // namespace rowshade
