#include "engine/shading/masking.hpp"

#include "engine/core/angles.hpp"
#include "engine/series/elementwise.hpp"

#include <cmath>

namespace rowshade {

double ground_angle(double surface_tilt, double gcr, double slant_height) {
  // Point on the row relative to the next row's base, in units of pitch.
  const double x1 = gcr * slant_height * sind(surface_tilt);
  const double x2 = gcr * slant_height * cosd(surface_tilt) + 1.0;
  return atan2d(x1, x2);
}

double masking_angle(double surface_tilt, double gcr, double slant_height) {
  // Remaining slant above the observation point, in units of pitch.
  const double above = gcr * (1.0 - slant_height);
  const double numerator = above * sind(surface_tilt);
  const double denominator = 1.0 - above * cosd(surface_tilt);
  // Identical to atan(num/den) for den > 0 (gcr < 1); stays 0 for gcr = 0.
  return atan2d(numerator, denominator);
}

double masking_angle_passias(double surface_tilt, double gcr) {
  if (gcr == 0.0 || surface_tilt == 0.0) return 0.0;

  // Average over u in [0, 1] of atan(u sin b / (X - u cos b)), X = 1/gcr.
  const double X = 1.0 / gcr;
  const double s = sind(surface_tilt);
  const double c = cosd(surface_tilt);
  if (s == 0.0) return 0.0;

  const double top = std::atan2(s, X - c);
  const double log_term = 0.5 * X * s * std::log((1.0 - 2.0 * X * c + X * X) / (X * X));
  const double atan_term = X * c * (std::atan((1.0 - X * c) / (X * s)) + std::atan(c / s));

  return degrees(top - log_term - atan_term);
}

double sky_diffuse_passias(double masking_angle) {
  const double c = cosd(0.5 * masking_angle);
  return 1.0 - c * c;
}

// ----------------------------- aligned sequences -----------------------------

Values ground_angle(const Values& surface_tilt, const Values& gcr, const Values& slant_height) {
  return elementwise(
      "ground_angle",
      [](double t, double g, double x) { return ground_angle(t, g, x); },
      surface_tilt, gcr, slant_height);
}

Values masking_angle(const Values& surface_tilt, const Values& gcr, const Values& slant_height) {
  return elementwise(
      "masking_angle",
      [](double t, double g, double h) { return masking_angle(t, g, h); },
      surface_tilt, gcr, slant_height);
}

Values masking_angle_passias(const Values& surface_tilt, const Values& gcr) {
  return elementwise(
      "masking_angle_passias",
      [](double t, double g) { return masking_angle_passias(t, g); },
      surface_tilt, gcr);
}

Values sky_diffuse_passias(const Values& masking_angle) {
  return elementwise(
      "sky_diffuse_passias",
      [](double a) { return sky_diffuse_passias(a); },
      masking_angle);
}

} // namespace rowshade
