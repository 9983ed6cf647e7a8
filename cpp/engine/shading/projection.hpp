#pragma once
/*
================================================================================
Shading: Projected Solar Zenith Angle
FILE: cpp/engine/shading/projection.hpp

Collapses the sun position onto the plane perpendicular to a tracker rotation
axis. The result is the rotation at which a single-axis tracker would face the
sun ("true tracking"), and the shadow direction used by row-to-row shading.

Frame (right-handed):
  - +y along the rotation axis: from north, rotated clockwise by axis_azimuth
    and tilted from horizontal by axis_tilt.
  - +x 90 degrees clockwise from +y, horizontal (y south => x west).
  - +z normal to both, pointing up.

Sign: positive when the sun lies on the +x side of the axis. Negating
axis_tilt and turning axis_azimuth by 180 degrees negates the result.

Range: (-180, 180]. Sun at zenith gives 0 for any axis.

References:
  K. Anderson and M. Mikofski, "Slope-Aware Backtracking for Single-Axis
  Trackers", NREL/TP-5K00-76626, 2020. doi:10.2172/1660126
================================================================================
*/

#include "engine/series/series.hpp"

namespace rowshade {

struct SunVector {
  double x = 0.0;
  double y = 0.0;
  double z = 1.0;
};

// Unit vector toward the sun in the east(x)/north(y)/up(z) frame.
SunVector sun_vector(double solar_zenith, double solar_azimuth) noexcept;

double projected_solar_zenith_angle(double solar_zenith,
                                    double solar_azimuth,
                                    double axis_tilt,
                                    double axis_azimuth) noexcept;

Values projected_solar_zenith_angle(const Values& solar_zenith,
                                    const Values& solar_azimuth,
                                    const Values& axis_tilt,
                                    const Values& axis_azimuth);

} // namespace rowshade
