#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>
#include <string>

#include "keyshell/core/parameters.hpp"
#include "keyshell/core/shape.hpp"
#include "keyshell/core/types.hpp"

namespace keyshell::core {

// Rigid transform: world = rotation * local + translation.
struct Pose {
  Mat3d rotation{};
  Vec3d translation{};

  [[nodiscard]] Vec3d apply(const Vec3d& local) const { return rotation * local + translation; }
};

// Point-space transform operations. They mirror the Shape operations in
// shape.hpp so one placement definition can drive both.
inline Vec3d translate(const Vec3d& offset, const Vec3d& point) { return point + offset; }
inline Vec3d rotate_x(double angle, const Vec3d& point) { return rotation_x(angle) * point; }
inline Vec3d rotate_y(double angle, const Vec3d& point) { return rotation_y(angle) * point; }
inline Vec3d rotate_z(double angle, const Vec3d& point) { return rotation_z(angle) * point; }

inline Pose translate(const Vec3d& offset, const Pose& pose) { return {pose.rotation, pose.translation + offset}; }
inline Pose rotate_x(double angle, const Pose& pose) {
  const Mat3d r = rotation_x(angle);
  return {r * pose.rotation, r * pose.translation};
}
inline Pose rotate_y(double angle, const Pose& pose) {
  const Mat3d r = rotation_y(angle);
  return {r * pose.rotation, r * pose.translation};
}
inline Pose rotate_z(double angle, const Pose& pose) {
  const Mat3d r = rotation_z(angle);
  return {r * pose.rotation, r * pose.translation};
}

template <typename T>
concept Placeable = requires(const T& value, const Vec3d& offset, double angle) {
  { translate(offset, value) } -> std::same_as<T>;
  { rotate_x(angle, value) } -> std::same_as<T>;
  { rotate_y(angle, value) } -> std::same_as<T>;
  { rotate_z(angle, value) } -> std::same_as<T>;
};

class CurvatureModel {
 public:
  CurvatureModel() : CurvatureModel(MakeDefaultShapeParameters()) {}
  explicit CurvatureModel(ShapeParameters params);

  // Places `value` at the key address. Column must index the per-column
  // tables; ValidateShapeParameters guarantees that for 0 <= column < ncols.
  template <Placeable T>
  [[nodiscard]] T place(int column, int row, const T& value) const {
    const ShapeParameters& p = params_;
    const double row_angle = p.alpha * (p.centerrow - row);
    const double column_angle = p.beta * (p.centercol - column);
    const Vec3d& column_offset = p.column_offsets[static_cast<std::size_t>(column)];

    T placed = value;
    switch (p.column_style) {
      case ColumnStyle::kStandard:
        placed = translate({wide_key_shift(p, column, row), 0.0, -row_radius_}, placed);
        placed = rotate_x(row_angle, placed);
        placed = translate({0.0, 0.0, row_radius_}, placed);
        placed = translate({0.0, 0.0, -column_radius_}, placed);
        placed = rotate_y(column_angle, placed);
        placed = translate({0.0, 0.0, column_radius_}, placed);
        placed = translate(column_offset, placed);
        break;
      case ColumnStyle::kOrthographic: {
        const double column_z_delta = column_radius_ * (1.0 - std::cos(column_angle));
        placed = translate({0.0, 0.0, -row_radius_}, placed);
        placed = rotate_x(row_angle, placed);
        placed = translate({0.0, 0.0, row_radius_}, placed);
        placed = rotate_y(column_angle, placed);
        placed = translate({-(column - p.centercol) * column_x_delta_, 0.0, column_z_delta}, placed);
        placed = translate(column_offset, placed);
        break;
      }
      case ColumnStyle::kFixed: {
        const auto index = static_cast<std::size_t>(column);
        const double fixed_z = p.fixed_z[index];
        placed = rotate_y(p.fixed_angles[index], placed);
        placed = translate({p.fixed_x[index], 0.0, fixed_z}, placed);
        placed = translate({0.0, 0.0, -(row_radius_ + fixed_z)}, placed);
        placed = rotate_x(row_angle, placed);
        placed = translate({0.0, 0.0, row_radius_ + fixed_z}, placed);
        placed = rotate_y(p.fixed_tenting, placed);
        placed = translate({0.0, column_offset.y, 0.0}, placed);
        break;
      }
    }
    placed = rotate_y(p.tenting_angle, placed);
    return translate({0.0, 0.0, p.keyboard_z_offset}, placed);
  }

  [[nodiscard]] Pose pose(int column, int row) const { return place(column, row, Pose{}); }
  [[nodiscard]] Vec3d key_position(int column, int row, const Vec3d& local) const {
    return place(column, row, local);
  }
  [[nodiscard]] Shape key_place(int column, int row, const Shape& shape) const { return place(column, row, shape); }

  // Outer corner of the first column, pulled in by the left wall offsets.
  [[nodiscard]] Vec3d left_key_position(int row, double direction) const {
    const Vec3d corner{mount_width(params_) * -0.5, direction * mount_height(params_) * 0.5, 0.0};
    return key_position(0, row, corner) - Vec3d{params_.left_wall_x_offset, 0.0, params_.left_wall_z_offset};
  }

  // Bounds-checked pose lookup for addresses that did not come from the
  // layout enumeration.
  [[nodiscard]] bool checked_pose(int column, int row, Pose* out_pose, std::string* error_message) const;

  [[nodiscard]] const ShapeParameters& params() const { return params_; }
  [[nodiscard]] double row_radius() const { return row_radius_; }
  [[nodiscard]] double column_radius() const { return column_radius_; }

 private:
  ShapeParameters params_{};
  double row_radius_ = 0.0;
  double column_radius_ = 0.0;
  double column_x_delta_ = 0.0;
};

}  // namespace keyshell::core
