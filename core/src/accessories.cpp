#include "keyshell/core/accessories.hpp"

#include <cmath>
#include <initializer_list>
#include <vector>

#include "keyshell/core/mesh.hpp"

namespace keyshell::core {

namespace {

double inches(double value) { return value * kMillimetersPerInch; }

Shape rotated_cylinder(double radius, double height) {
  return rotate_x(deg_to_rad(90.0), Shape::Cylinder(radius, radius, height));
}

// Screw insert dimensions (heat-set insert, hole depth 4.4, wall 1.65).
constexpr double kInsertHeight = 6.0;
constexpr double kInsertBottomRadius = 4.0 / 2.0;
constexpr double kInsertTopRadius = 3.9 / 2.0;
constexpr double kInsertWall = 1.65;

constexpr double kControlSwitchRadius = 6.1;

}  // namespace

Vec3d screw_insert_position(const CurvatureModel& model, const ScrewInsertSpec& spec) {
  const ShapeParameters& p = model.params();
  const bool shift_right = spec.column == last_column(p);
  const bool shift_left = spec.column == 0;
  const bool shift_up = !(shift_right || shift_left) && spec.row == 0;
  const bool shift_down = !(shift_right || shift_left) && spec.row >= last_row(p);

  if (shift_up) {
    return model.key_position(spec.column, spec.row,
                              wall_locate2(p, 0.0, 1.0) + Vec3d{0.0, mount_height(p) / 2.0, 0.0});
  }
  if (shift_down) {
    return model.key_position(spec.column, spec.row,
                              wall_locate2(p, 0.0, -2.5) - Vec3d{0.0, mount_height(p) / 2.0, 0.0});
  }
  if (shift_left) {
    return model.left_key_position(spec.row, 0.0) + wall_locate3(p, -1.0, 0.0);
  }
  return model.key_position(spec.column, spec.row,
                            wall_locate2(p, 1.0, 0.0) + Vec3d{mount_width(p) / 2.0, 0.0, 0.0});
}

Shape screw_insert_shapes(const CurvatureModel& model, double bottom_radius, double top_radius, double height) {
  std::vector<Shape> inserts;
  for (const ScrewInsertSpec& spec : model.params().screw_inserts) {
    const Vec3d position = screw_insert_position(model, spec);
    inserts.push_back(translate(spec.offset + Vec3d{position.x, position.y, height / 2.0},
                                Shape::Cylinder(bottom_radius, top_radius, height)));
  }
  return union_of(inserts);
}

ScrewInsertShapes BuildScrewInserts(const CurvatureModel& model) {
  ScrewInsertShapes shapes;
  shapes.outers = screw_insert_shapes(model, kInsertBottomRadius + kInsertWall, kInsertTopRadius + kInsertWall,
                                      kInsertHeight + 1.0);
  shapes.holes = screw_insert_shapes(model, kInsertBottomRadius, kInsertTopRadius, kInsertHeight);
  return shapes;
}

ControllerHolder MakeControllerHolder(const Vec3d& position, double orientation_deg) {
  const Vec3d board{18.4, 33.7, 2.0};
  const Vec3d pin_clearance{4.0, board.y, 2.5};
  const double support_extent = 25.0;
  const double retainer_extent = 1.0;
  const double wall = 2.0;
  const double wall_height = 2.1;  // above the board
  const Vec3d box = board + Vec3d{wall * 2.0, wall, pin_clearance.z + wall_height};

  const auto transform = [&](const Shape& shape) {
    Shape placed = translate(box * -0.5, shape);
    placed = rotate_z(deg_to_rad(orientation_deg), placed);
    placed = translate({0.0, -box.y / 2.0, box.z / 2.0}, placed);
    return translate(position, placed);
  };

  const double support_width = board.x - 2.0 * pin_clearance.x;

  ControllerHolder out;
  out.holder = transform(union_of({
      difference(corner_cube(box), {translate({wall, 0.0, 0.0}, corner_cube(board + Vec3d{0.0, 0.0, box.z}))}),
      translate({wall + pin_clearance.x, 0.0, 0.0}, corner_cube({support_width, support_extent, pin_clearance.z})),
      translate({wall + pin_clearance.x, board.y - retainer_extent, pin_clearance.z + board.z},
                corner_cube({support_width, retainer_extent, retainer_extent})),
  }));

  const double jack_width = 9.525;
  const double jack_height = 3.5;
  const double jack_radius = jack_height / 2.0;
  const double jack_wall = 1.0;
  const double clearance_buffer = 2.75;
  const double clearance_width = jack_width + clearance_buffer * 2.0;
  const double clearance_height = jack_height + clearance_buffer * 2.0;

  const Shape jack = union_of({
      translate({jack_radius, wall, jack_radius}, rotated_cylinder(jack_radius, 2.0 * wall)),
      translate({jack_width - jack_radius, wall, jack_radius}, rotated_cylinder(jack_radius, 2.0 * wall)),
      translate({jack_radius, 0.0, 0.0}, corner_cube({jack_width - 2.0 * jack_radius, 2.0 * wall, jack_height})),
  });
  const Vec3d flip{0.0, -1.0, 0.0};
  out.usb_cutout = transform(union_of({
      mirror(flip, translate({(box.x - jack_width) / 2.0, -0.1, pin_clearance.z}, jack)),
      mirror(flip, translate({(box.x - clearance_width) / 2.0, jack_wall,
                              pin_clearance.z + jack_height / 2.0 - clearance_height / 2.0},
                             corner_cube({clearance_width, 2.0 * wall, clearance_height}))),
  }));
  out.retainer = transform(translate({(box.x - jack_width) / 2.0, 0.0, pin_clearance.z + jack_height},
                                     corner_cube({jack_width, retainer_extent, retainer_extent})));
  return out;
}

Vec3d controller_reference(const CurvatureModel& model) {
  const ShapeParameters& p = model.params();
  const Vec3d key = model.key_position(inner_column_offset(p), 0, {});
  return {key.x, key.y + mount_height(p) / 2.0 + post_adjust(p), 0.0};
}

ControllerHolder BuildControllerHolder(const CurvatureModel& model) {
  return MakeControllerHolder(controller_reference(model) + Vec3d{-2.0, -1.7375, 0.0}, 180.0);
}

Shape BuildControlSwitchHoles(const CurvatureModel& model) {
  std::vector<Shape> holes;
  for (const int column : {2, 3}) {
    const Vec3d position{model.key_position(column, 0, {1.75, 0.0, 0.0}).x,
                         model.key_position(column, 0, {0.0, 2.0, 0.0}).y, 8.75};
    holes.push_back(translate(position, rotated_cylinder(kControlSwitchRadius, 20.0)));
  }
  return union_of(holes);
}

Shape MakeStabilizerCutout(const ShapeParameters& p, double spacing) {
  const double plate = p.switch_hole.plate_thickness;
  const double web = p.web_thickness;
  const double tab_hole = retention_tab_hole_thickness(p);
  const double plate_z = plate - web / 2.0;

  const double main_height = inches(0.484);
  const double main_width = inches(0.262);
  const Shape main_cutout = translate({main_height - inches(0.26) - main_height / 2.0, spacing / 2.0, plate_z},
                                      Shape::Cube({main_height, main_width, web}));

  const double secondary_height = inches(0.26) + (inches(0.53) - main_height);
  const Shape secondary_cutout = translate({-secondary_height / 2.0, spacing / 2.0, plate_z},
                                           Shape::Cube({secondary_height, inches(0.12), web}));

  const Shape side_cutout =
      translate({0.9, 0.0, plate_z}, Shape::Cube({2.8, spacing + 0.8 * 2.0 + main_width, web}));

  const double connector_height = 10.7;
  const Shape connector_cutout = translate({connector_height / 2.0 - 5.97, 0.0, plate_z},
                                           Shape::Cube({connector_height, spacing, web}));

  const double bar_height = (mount_width(p) + 3.0) / 2.0;
  const Shape bar_clearance = translate({-bar_height / 2.0, 0.0, tab_hole / 2.0 - 0.5},
                                        Shape::Cube({bar_height, spacing + main_width, web}));

  const double switch_height = p.switch_hole.keyswitch_height + kPlate2uKeyswitchHeightOffset;
  const double tab_depth = (mount_width(p) - switch_height) / 2.0;
  const Shape main_retention_tab = translate({-(switch_height + tab_depth) / 2.0, 0.0, web - tab_hole / 2.0},
                                             Shape::Cube({tab_depth, spacing - main_width, plate - tab_hole}));

  const Shape retention_tab =
      translate({5.53, spacing / 2.0, tab_hole / 2.0 - 0.5}, Shape::Cube({3.2, 3.0, tab_hole}));

  const Shape cutout = union_of({
      main_cutout,
      secondary_cutout,
      side_cutout,
      connector_cutout,
      difference(bar_clearance, {main_retention_tab}),
      retention_tab,
  });
  return union_of({cutout, mirror({0.0, 1.0, 0.0}, cutout)});
}

Shape stabilizer_cutout_2u(const ShapeParameters& p) { return MakeStabilizerCutout(p, inches(0.94)); }

PalmRest BuildPalmRest(double thickness) {
  // Contact points measured on the default case.
  const Vec2d outside_case{61.5737, -51.3762};
  const Vec2d thumb_case{-51.5458, -103.431};
  const Vec2d internal_corner{-51.5458, -46.3762};
  const double rest_length = 63.5;

  const auto add = [](const Vec2d& a, const Vec2d& b) { return Vec2d{a.x + b.x, a.y + b.y}; };

  const Vec2d lower_right_one = add(outside_case, {0.0, -rest_length});
  const Vec2d lower_right_two =
      add(lower_right_one, {kMillimetersPerInch * -std::sqrt(0.1), kMillimetersPerInch * -2.0 * std::sqrt(0.1)});
  const double diagonal = std::sqrt(rest_length * rest_length / 2.0);
  const Vec2d lower_left_one = add(add(thumb_case, {diagonal, -diagonal}), {7.5, 10.0});
  const double skew = kPi / 4.0 - std::atan(0.5);
  const Vec2d lower_left_two =
      add(lower_left_one, {kMillimetersPerInch * std::sqrt(0.5) * std::cos(skew),
                           -kMillimetersPerInch * std::sqrt(0.5) * std::sin(skew)});

  PalmRest rest;
  rest.body = linear_extrude(thickness, false,
                             Profile::Polygon({
                                 lower_left_one,
                                 lower_left_two,
                                 lower_right_two,
                                 lower_right_one,
                                 add(outside_case, {4.0963, 9.8962}),
                                 internal_corner,
                                 add(thumb_case, {-30.8642, 14.441}),
                             }));
  rest.screw_positions = {
      add(outside_case, {-15.0, -25.4}),
      add(outside_case, {-83.0, -53.0}),
      add(outside_case, {-34.1, -67.15}),
  };
  return rest;
}

Shape BuildPlateScrewHoles(const CurvatureModel& model, const PalmRest& palm_rest, double plate_thickness) {
  const double head_radius = 5.7 / 2.0;
  const double head_base_radius = 3.2 / 2.0;
  const double head_height = 2.3;

  std::vector<Shape> holes = {
      screw_insert_shapes(model, head_radius, head_base_radius, head_height),
      screw_insert_shapes(model, head_base_radius, head_base_radius, plate_thickness),
  };
  for (const Vec2d& screw : palm_rest.screw_positions) {
    const Vec3d at{screw.x, screw.y, 0.0};
    holes.push_back(translate(at, Shape::Cylinder(head_base_radius, head_base_radius, 10.0, 30, false)));
    holes.push_back(translate(at, Shape::Cylinder(head_radius, head_base_radius, head_height, 30, false)));
  }
  return union_of(holes);
}

Accessories BuildAccessories(const CurvatureModel& model) {
  const ShapeParameters& p = model.params();
  Accessories parts;
  parts.screw_inserts = BuildScrewInserts(model);
  parts.controller = BuildControllerHolder(model);
  parts.control_switches = BuildControlSwitchHoles(model);
  parts.stabilizer_cutout_2u = stabilizer_cutout_2u(p);
  parts.palm_rest = BuildPalmRest(p.base_plate_thickness);
  return parts;
}

}  // namespace keyshell::core
