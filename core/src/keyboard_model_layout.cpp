#include "keyshell/core/keyboard_model.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace keyshell::core {

std::vector<KeyAddress> KeyboardModel::key_addresses() const { return enumerate_key_addresses(params_); }

Shape KeyboardModel::plate_1u(double height_offset) const {
  const SwitchHoleSpec& hole = params_.switch_hole;
  const double plate = hole.plate_thickness;
  const double width = hole.keyswitch_width;
  const double height = hole.keyswitch_height + height_offset;
  const double nub = hole.side_nub_thickness;
  const double tab_hole = retention_tab_hole_thickness(params_);

  const Shape top_wall = translate({0.0, 1.5 / 2.0 + height / 2.0, plate / 2.0 - 0.25},
                                   Shape::Cube({width + 3.0, 1.5, plate + 0.5}));
  const Shape left_wall = translate({1.8 / 2.0 + width / 2.0, 0.0, plate / 2.0 - 0.25},
                                    Shape::Cube({1.8, height + 3.0, plate + 0.5}));

  std::vector<Shape> half_parts = {top_wall, left_wall};
  if (hole.create_side_nubs) {
    const Shape nub_cylinder =
        translate({width / 2.0, 0.0, 1.0}, rotate(kPi / 2.0, {1.0, 0.0, 0.0}, Shape::Cylinder(1.0, 1.0, 2.75, 100)));
    const Shape nub_block = translate({1.5 / 2.0 + width / 2.0, 0.0, nub / 2.0}, Shape::Cube({1.5, 2.75, nub}));
    half_parts.push_back(translate({0.0, 0.0, plate - nub}, hull({nub_block, nub_cylinder})));
  }
  const Shape plate_half = union_of(half_parts);

  const Shape top_nub = translate({width / 2.5, 0.0, tab_hole / 2.0 - 0.5}, Shape::Cube({5.0, 5.0, tab_hole}));
  const Shape top_nub_pair =
      union_of({top_nub, mirror({0.0, 1.0, 0.0}, mirror({1.0, 0.0, 0.0}, top_nub))});

  return difference(union_of({plate_half, mirror({0.0, 1.0, 0.0}, mirror({1.0, 0.0, 0.0}, plate_half))}),
                    {rotate(kPi / 2.0, {0.0, 0.0, 1.0}, top_nub_pair)});
}

Shape KeyboardModel::plate_2u() const {
  const double plate = params_.switch_hole.plate_thickness;
  const double web = params_.web_thickness;
  const double sa_double_length = 37.5;
  const double plate_height = (sa_double_length - mount_height(params_)) / 2.0;
  const double plate_width = mount_width(params_);

  const Shape top_plate = translate({0.0, (plate_height + mount_height(params_)) / 2.0, plate - web / 2.0},
                                    Shape::Cube({plate_width, plate_height, web}));
  const double side_plate_width =
      (plate_width - (params_.switch_hole.keyswitch_height + 3.0 + kPlate2uKeyswitchHeightOffset)) / 2.0;
  const Shape side_plate = translate({plate_width / 2.0 - side_plate_width / 2.0, 0.0, plate - web / 2.0},
                                     Shape::Cube({side_plate_width, mount_height(params_), web}));

  return union_of({
      rotate(kPi / 2.0, {0.0, 0.0, 1.0}, plate_1u(kPlate2uKeyswitchHeightOffset)),
      top_plate,
      mirror({0.0, 1.0, 0.0}, union_of({top_plate, side_plate, mirror({1.0, 0.0, 0.0}, side_plate)})),
  });
}

Shape KeyboardModel::keyhole_fill() const {
  const SwitchHoleSpec& hole = params_.switch_hole;
  return translate({0.0, 0.0, hole.plate_thickness / 2.0},
                   Shape::Cube({hole.keyswitch_height, hole.keyswitch_width, hole.plate_thickness}));
}

Shape KeyboardModel::BuildKeyHoles() const {
  const Shape plate = plate_1u();
  std::vector<Shape> holes;
  for (const KeyAddress& address : key_addresses()) {
    holes.push_back(curvature_.key_place(address.column, address.row, plate));
  }
  spdlog::debug("matrix layout: {} key mounts", holes.size());
  return union_of(holes);
}

Shape KeyboardModel::BuildKeyFills() const {
  const Shape fill = keyhole_fill();
  std::vector<Shape> fills;
  for (const KeyAddress& address : key_addresses()) {
    fills.push_back(curvature_.key_place(address.column, address.row, fill));
  }
  fills.push_back(thumb_1u_layout(fill));
  fills.push_back(thumb_2u_layout(rotate(kPi / 2.0, {0.0, 0.0, 1.0}, fill)));
  return union_of(fills);
}

Shape KeyboardModel::thumb_1u_layout(const Shape& shape) const {
  std::vector<Shape> placed;
  for (int index = 0; index < static_cast<int>(params_.thumb_keys.size()); ++index) {
    if (!params_.thumb_keys[static_cast<std::size_t>(index)].double_width) {
      placed.push_back(thumb_place(index, shape));
    }
  }
  return union_of(placed);
}

Shape KeyboardModel::thumb_2u_layout(const Shape& shape) const {
  std::vector<Shape> placed;
  for (int index = 0; index < static_cast<int>(params_.thumb_keys.size()); ++index) {
    if (params_.thumb_keys[static_cast<std::size_t>(index)].double_width) {
      placed.push_back(thumb_place(index, shape));
    }
  }
  return union_of(placed);
}

Shape KeyboardModel::BuildThumb() const { return union_of({thumb_1u_layout(plate_1u()), thumb_2u_layout(plate_2u())}); }

}  // namespace keyshell::core
