#pragma once

#include <cmath>

namespace keyshell::core {

constexpr double kPi = 3.14159265358979323846;

inline double deg_to_rad(double degrees) { return degrees / 180.0 * kPi; }

inline double rad_to_deg(double radians) { return radians / kPi * 180.0; }

struct Vec2d {
  double x = 0.0;
  double y = 0.0;
};

struct Vec3d {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

inline Vec3d operator+(const Vec3d& a, const Vec3d& b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3d operator-(const Vec3d& a, const Vec3d& b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3d operator*(const Vec3d& a, double s) {
  return {a.x * s, a.y * s, a.z * s};
}

inline bool operator==(const Vec3d& a, const Vec3d& b) {
  return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline double dot(const Vec3d& a, const Vec3d& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vec3d cross(const Vec3d& a, const Vec3d& b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline double length(const Vec3d& a) { return std::sqrt(dot(a, a)); }

// Row-major 3x3 rotation.
struct Mat3d {
  double m[3][3] = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};

  static Mat3d identity() { return {}; }
};

inline Vec3d operator*(const Mat3d& a, const Vec3d& v) {
  return {
      a.m[0][0] * v.x + a.m[0][1] * v.y + a.m[0][2] * v.z,
      a.m[1][0] * v.x + a.m[1][1] * v.y + a.m[1][2] * v.z,
      a.m[2][0] * v.x + a.m[2][1] * v.y + a.m[2][2] * v.z,
  };
}

inline Mat3d operator*(const Mat3d& a, const Mat3d& b) {
  Mat3d r{};
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      r.m[i][j] = a.m[i][0] * b.m[0][j] + a.m[i][1] * b.m[1][j] + a.m[i][2] * b.m[2][j];
    }
  }
  return r;
}

inline Mat3d rotation_x(double angle) {
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  Mat3d r{};
  r.m[1][1] = c;
  r.m[1][2] = -s;
  r.m[2][1] = s;
  r.m[2][2] = c;
  return r;
}

inline Mat3d rotation_y(double angle) {
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  Mat3d r{};
  r.m[0][0] = c;
  r.m[0][2] = s;
  r.m[2][0] = -s;
  r.m[2][2] = c;
  return r;
}

inline Mat3d rotation_z(double angle) {
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  Mat3d r{};
  r.m[0][0] = c;
  r.m[0][1] = -s;
  r.m[1][0] = s;
  r.m[1][1] = c;
  return r;
}

// Rotation about an arbitrary axis (Rodrigues). A zero axis yields identity.
inline Mat3d rotation_about(const Vec3d& axis, double angle) {
  const double len = length(axis);
  if (len <= 1e-12) {
    return Mat3d::identity();
  }
  const Vec3d u = axis * (1.0 / len);
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  const double t = 1.0 - c;
  Mat3d r{};
  r.m[0][0] = c + u.x * u.x * t;
  r.m[0][1] = u.x * u.y * t - u.z * s;
  r.m[0][2] = u.x * u.z * t + u.y * s;
  r.m[1][0] = u.y * u.x * t + u.z * s;
  r.m[1][1] = c + u.y * u.y * t;
  r.m[1][2] = u.y * u.z * t - u.x * s;
  r.m[2][0] = u.z * u.x * t - u.y * s;
  r.m[2][1] = u.z * u.y * t + u.x * s;
  r.m[2][2] = c + u.z * u.z * t;
  return r;
}

// Reflection across the plane through the origin with the given normal.
inline Vec3d reflect(const Vec3d& normal, const Vec3d& p) {
  const double len2 = dot(normal, normal);
  if (len2 <= 1e-24) {
    return p;
  }
  return p - normal * (2.0 * dot(p, normal) / len2);
}

struct AABBd {
  Vec3d min{};
  Vec3d max{};
};

}  // namespace keyshell::core
