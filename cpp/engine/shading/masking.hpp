#pragma once
/*
================================================================================
Shading: Ground Angle, Masking Angle, Passias Diffuse Loss
FILE: cpp/engine/shading/masking.hpp

Geometry (cross-section perpendicular to the rows, flat terrain):
  - Rows of slant length 1 (normalized), tilted surface_tilt degrees, spaced
    1/gcr apart.
  - A point on a row is addressed by its fractional slant position along the
    row: 0 = bottom edge, 1 = top edge.

Functions:
  - ground_angle          angle from the horizontal to the line joining a
                          point at slant fraction x of the row top edge to
                          the base of the next row
  - masking_angle         elevation of the neighbouring row's top edge seen
                          from a point at slant fraction `slant_height`
  - masking_angle_passias that elevation averaged over the whole slant
                          length (closed-form integral)
  - sky_diffuse_passias   isotropic-sky diffuse loss for an average masking
                          angle: 1 - cos^2(angle / 2)

Zero-GCR policy:
  - gcr = 0 means "no neighbouring row": every angle is 0 and every loss 0.

References:
  D. Passias and B. Kallback, "Shading effects in rows of solar cell panels",
  Solar Cells 11, 1984. doi:10.1016/0379-6787(84)90017-6
================================================================================
*/

#include "engine/core/row_geometry.hpp"
#include "engine/series/series.hpp"

namespace rowshade {

// ----------------------------- scalar kernels --------------------------------

double ground_angle(double surface_tilt, double gcr, double slant_height);

double masking_angle(double surface_tilt, double gcr, double slant_height = 0.0);

double masking_angle_passias(double surface_tilt, double gcr);

double sky_diffuse_passias(double masking_angle);

// ----------------------------- aligned sequences -----------------------------

Values ground_angle(const Values& surface_tilt, const Values& gcr, const Values& slant_height);

Values masking_angle(const Values& surface_tilt, const Values& gcr,
                     const Values& slant_height = Values(0.0));

Values masking_angle_passias(const Values& surface_tilt, const Values& gcr);

Values sky_diffuse_passias(const Values& masking_angle);

// ----------------------------- row records -----------------------------------

inline double ground_angle(const RowGeometry& row, double slant_height) {
  return ground_angle(row.surface_tilt_deg, row.gcr(), slant_height);
}

inline double masking_angle_passias(const RowGeometry& row) {
  return masking_angle_passias(row.surface_tilt_deg, row.gcr());
}

} // namespace rowshade
