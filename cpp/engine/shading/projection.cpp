#include "engine/shading/projection.hpp"

#include "engine/core/angles.hpp"
#include "engine/series/elementwise.hpp"

namespace rowshade {

SunVector sun_vector(double solar_zenith, double solar_azimuth) noexcept {
  SunVector v;
  const double sz = sind(solar_zenith);
  v.x = sz * sind(solar_azimuth);
  v.y = sz * cosd(solar_azimuth);
  v.z = cosd(solar_zenith);
  return v;
}

double projected_solar_zenith_angle(double solar_zenith,
                                    double solar_azimuth,
                                    double axis_tilt,
                                    double axis_azimuth) noexcept {
  const SunVector s = sun_vector(solar_zenith, solar_azimuth);

  const double sin_aa = sind(axis_azimuth);
  const double cos_aa = cosd(axis_azimuth);
  const double sin_at = sind(axis_tilt);
  const double cos_at = cosd(axis_tilt);

  // Sun components in the tracker frame; the component along the axis (y')
  // drops out of the projection.
  const double x_prime = s.x * cos_aa - s.y * sin_aa;
  const double z_prime = s.x * sin_aa * sin_at + s.y * sin_at * cos_aa + s.z * cos_at;

  return atan2d(x_prime, z_prime);
}

Values projected_solar_zenith_angle(const Values& solar_zenith,
                                    const Values& solar_azimuth,
                                    const Values& axis_tilt,
                                    const Values& axis_azimuth) {
  return elementwise(
      "projected_solar_zenith_angle",
      [](double zen, double azi, double tilt, double axis_azi) {
        return projected_solar_zenith_angle(zen, azi, tilt, axis_azi);
      },
      solar_zenith, solar_azimuth, axis_tilt, axis_azimuth);
}

} // namespace rowshade
