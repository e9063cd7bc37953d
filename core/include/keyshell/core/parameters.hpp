#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "keyshell/core/result.hpp"
#include "keyshell/core/types.hpp"

namespace keyshell::core {

enum class ColumnStyle : std::uint8_t {
  kStandard = 0,
  kOrthographic = 1,
  kFixed = 2,
};

std::string_view to_string(ColumnStyle style);
bool parse_column_style(std::string_view text, ColumnStyle* out_style);

struct ThumbKeySpec {
  Vec3d pre_offset{};
  Vec3d rotation_deg{};
  Vec3d offset{};
  bool double_width = false;
};

struct ScrewInsertSpec {
  int column = 0;
  int row = 0;
  Vec3d offset{};
};

struct SwitchHoleSpec {
  double keyswitch_width = 14.15;
  double keyswitch_height = 14.15;
  double sa_profile_key_height = 12.7;
  double plate_thickness = 4.0;
  double side_nub_thickness = 4.0;
  double retention_tab_thickness = 1.5;
  bool create_side_nubs = true;
};

struct ShapeParameters {
  int nrows = 5;
  int ncols = 7;

  double alpha = kPi / 12.0;  // column curvature
  double beta = kPi / 36.0;   // row curvature
  double centerrow = 2.0;     // front-back tilt
  double centercol = 4.0;     // left-right tilt / tenting
  double tenting_angle = kPi / 12.0;

  bool pinky_15u = true;
  int first_15u_row = 0;
  int last_15u_row = 3;

  bool extra_row = false;
  bool inner_column = true;

  ColumnStyle column_style = ColumnStyle::kStandard;
  std::vector<Vec3d> column_offsets{};

  Vec3d thumb_offsets{6.0, -3.0, 7.0};
  std::array<ThumbKeySpec, 4> thumb_keys{{
      {{0.0, 0.0, 0.0}, {10.0, -23.0, 10.0}, {-9.0, -16.0, 3.0}, true},
      {{0.0, 0.0, 0.0}, {10.0, -2.0, 12.5}, {-30.5, -25.0, -2.0}, true},
      {{0.0, 0.0, 1.5}, {10.0, 15.0, 15.5}, {-52.75, -26.4, 3.0}, false},
      {{0.0, 0.0, -1.5}, {10.0, 15.0, 15.5}, {-48.7, -45.25, -1.5}, false},
  }};

  double keyboard_z_offset = 10.0;
  double extra_width = 2.5;
  double extra_height = 1.0;

  double wall_z_offset = -2.0;
  double wall_xy_offset = 0.5;
  double wall_thickness = 2.0;
  double left_wall_x_offset = 0.0;
  double left_wall_z_offset = 0.5;
  double floor_z = -10.0;

  // Column style kFixed. Fixed z overrides the z portion of the column offsets.
  std::vector<double> fixed_angles{deg_to_rad(10.0), deg_to_rad(10.0), 0.0, 0.0, 0.0, deg_to_rad(-15.0),
                                   deg_to_rad(-15.0)};
  std::vector<double> fixed_x{-41.5, -22.5, 0.0, 20.3, 41.4, 65.5, 89.6};
  std::vector<double> fixed_z{12.1, 8.3, 0.0, 5.0, 10.7, 14.5, 17.5};
  double fixed_tenting = 0.0;

  SwitchHoleSpec switch_hole{};
  double web_thickness = 4.5;
  double post_size = 0.1;
  double wide_key_shift = 4.7625;

  // Filled by default_screw_inserts(); anchored to the last row/column.
  std::vector<ScrewInsertSpec> screw_inserts{};
  double base_plate_thickness = 2.6;
};

struct KeyAddress {
  int column = 0;
  int row = 0;

  bool operator==(const KeyAddress& other) const { return column == other.column && row == other.row; }
};

// Hand-tuned per-column offsets of the default layout.
std::vector<Vec3d> default_column_offsets(bool inner_column, int ncols);

// Default parameters with the column offset table filled in.
ShapeParameters MakeDefaultShapeParameters();

// Screw insert anchors follow the last row/column of the matrix.
std::vector<ScrewInsertSpec> default_screw_inserts(int ncols, int nrows);

[[nodiscard]] ValidationResult ValidateShapeParameters(const ShapeParameters& params);

// Derived layout indices.
inline int last_row(const ShapeParameters& p) { return p.nrows - 1; }
inline int corner_row(const ShapeParameters& p) { return last_row(p) - 1; }
inline int last_column(const ShapeParameters& p) { return p.ncols - 1; }
inline int extra_corner_row(const ShapeParameters& p) { return p.extra_row ? last_row(p) : corner_row(p); }
inline int inner_column_offset(const ShapeParameters& p) { return p.inner_column ? 1 : 0; }

// Switch mount dimensions.
inline double mount_width(const ShapeParameters& p) { return p.switch_hole.keyswitch_width + 3.2; }
inline double mount_height(const ShapeParameters& p) { return p.switch_hole.keyswitch_height + 2.7; }
inline double cap_top_height(const ShapeParameters& p) {
  return p.switch_hole.plate_thickness + p.switch_hole.sa_profile_key_height;
}
inline double retention_tab_hole_thickness(const ShapeParameters& p) {
  return p.switch_hole.plate_thickness + 0.5 - p.switch_hole.retention_tab_thickness;
}
inline double post_adjust(const ShapeParameters& p) { return p.post_size / 2.0; }

// Radii chosen so that mount edges stay tangent to the arc.
double row_radius(const ShapeParameters& p);
double column_radius(const ShapeParameters& p);
double column_x_delta(const ShapeParameters& p);

// Toggle predicates.
bool has_wide_pinky_rows(const ShapeParameters& p);
bool is_wide_key(const ShapeParameters& p, int column, int row);
double wide_key_shift(const ShapeParameters& p, int column, int row);
bool is_inner_key(const ShapeParameters& p, int column, int row);
bool is_key_present(const ShapeParameters& p, int column, int row);

// Present main-matrix addresses (inner column included), column-major.
std::vector<KeyAddress> enumerate_key_addresses(const ShapeParameters& p);

}  // namespace keyshell::core
