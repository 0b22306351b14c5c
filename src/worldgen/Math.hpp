// src/worldgen/Math.hpp
#pragma once
#include <cmath>

namespace orbis::worldgen {

inline constexpr double kPi    = 3.141592653589793238462643383279502884;
inline constexpr double kTwoPi = 2.0 * kPi;

// Small 3D vector for sphere geometry (double precision: tile areas are summed
// over hundreds of thousands of spherical triangles).
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

inline constexpr Vec3 make3(double x, double y, double z) noexcept { return {x, y, z}; }
inline constexpr Vec3 add(const Vec3& a, const Vec3& b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline constexpr Vec3 sub(const Vec3& a, const Vec3& b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline constexpr Vec3 mul(const Vec3& a, double s) noexcept { return {a.x * s, a.y * s, a.z * s}; }
inline constexpr double dot(const Vec3& a, const Vec3& b) noexcept { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline constexpr Vec3 cross(const Vec3& a, const Vec3& b) noexcept {
    return { a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x };
}
inline double length(const Vec3& a) noexcept { return std::sqrt(dot(a, a)); }

// Zero vectors map to +Z; callers that must reject them check length() first.
inline Vec3 normalize(const Vec3& a) noexcept {
    const double L = length(a);
    return (L > 0.0) ? make3(a.x / L, a.y / L, a.z / L) : make3(0.0, 0.0, 1.0);
}

// Solid angle of the spherical triangle (a, b, c) on the unit sphere
// (Van Oosterom & Strackee). Vertices must be unit vectors.
inline double solid_angle(const Vec3& a, const Vec3& b, const Vec3& c) noexcept {
    const double numer = std::abs(dot(a, cross(b, c)));
    const double denom = 1.0 + dot(a, b) + dot(b, c) + dot(c, a);
    return 2.0 * std::atan2(numer, denom);
}

} // namespace orbis::worldgen
