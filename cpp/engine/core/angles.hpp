#pragma once
/*
================================================================================
Core: Degree-Based Trigonometry + Numeric Guards
FILE: cpp/engine/core/angles.hpp

Purpose:
  - Every public angle in rowshade is in degrees. These wrappers keep the
    degree/radian conversion at one place so formulas never mix units.
  - Small numeric guards (finite check, clamp, three-way sign) shared by the
    shading kernels.

Conventions:
  - atand returns (-90, 90); atan2d returns (-180, 180].
  - asind/acosd clip their argument to [-1, 1] first, so rounding noise just
    outside the domain never yields NaN.
================================================================================
*/

#include <cmath>
#include <type_traits>

namespace rowshade {

inline constexpr double kPi = 3.141592653589793238462643383279502884;

inline constexpr double deg_to_rad = kPi / 180.0;
inline constexpr double rad_to_deg = 180.0 / kPi;

inline constexpr double radians(double deg) noexcept { return deg * deg_to_rad; }
inline constexpr double degrees(double rad) noexcept { return rad * rad_to_deg; }

inline bool is_finite(double x) noexcept { return std::isfinite(x) != 0; }

template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

inline constexpr double clamp01(double x) noexcept { return clamp(x, 0.0, 1.0); }

// -1, 0 or +1. Zero (of either sign) maps to 0.
inline constexpr int sign(double x) noexcept { return (x > 0.0) - (x < 0.0); }

inline double sind(double deg) noexcept { return std::sin(radians(deg)); }
inline double cosd(double deg) noexcept { return std::cos(radians(deg)); }
inline double tand(double deg) noexcept { return std::tan(radians(deg)); }

inline double asind(double x) noexcept { return degrees(std::asin(clamp(x, -1.0, 1.0))); }
inline double acosd(double x) noexcept { return degrees(std::acos(clamp(x, -1.0, 1.0))); }
inline double atand(double x) noexcept { return degrees(std::atan(x)); }
inline double atan2d(double y, double x) noexcept { return degrees(std::atan2(y, x)); }

} // namespace rowshade
