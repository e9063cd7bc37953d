#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "keyshell/core/config_loader.hpp"
#include "keyshell/core/curvature.hpp"
#include "keyshell/core/keyboard_model.hpp"
#include "keyshell/core/mesh.hpp"
#include "keyshell/core/parameters.hpp"
#include "keyshell/core/shape.hpp"
#include "keyshell/core/stl_writer.hpp"

namespace {

using keyshell::core::AABBd;
using keyshell::core::ColumnStyle;
using keyshell::core::Corner;
using keyshell::core::CurvatureModel;
using keyshell::core::HullSet;
using keyshell::core::KeyboardModel;
using keyshell::core::MeshComponent;
using keyshell::core::PlacedPost;
using keyshell::core::Placement;
using keyshell::core::PostStyle;
using keyshell::core::Profile;
using keyshell::core::Shape;
using keyshell::core::ShapeParameters;
using keyshell::core::Vec3d;
using keyshell::core::WallBrace;
using keyshell::core::WallSegment;
using keyshell::core::WallSide;
using keyshell::core::WallSideKind;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

bool has_issue_code(const keyshell::core::ValidationResult& validation, const std::string& code) {
  for (const auto& issue : validation.issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool almost_equal(const Vec3d& a, const Vec3d& b, double eps = 1e-9) {
  return almost_equal(a.x, b.x, eps) && almost_equal(a.y, b.y, eps) && almost_equal(a.z, b.z, eps);
}

Vec3d box_center(const AABBd& box) { return (box.min + box.max) * 0.5; }

// Bounding box center; for a placed cube this is where its own center lands.
Vec3d placed_center(const Shape& shape) { return box_center(shape.bounds()); }

bool same_solid(const Shape& a, const Shape& b) {
  return a.vertex_count() == b.vertex_count() && a.triangle_count() == b.triangle_count() &&
         almost_equal(a.bounds().min, b.bounds().min) && almost_equal(a.bounds().max, b.bounds().max) &&
         almost_equal(a.volume(), b.volume());
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool contains(const std::string& value, const std::string& needle) {
  return value.find(needle) != std::string::npos;
}

ShapeParameters params_with_style(ColumnStyle style) {
  ShapeParameters params = keyshell::core::MakeDefaultShapeParameters();
  params.column_style = style;
  return params;
}

KeyboardModel make_model(const ShapeParameters& params) {
  const auto created = KeyboardModel::Create(params);
  return created.value;
}

WallSegment key_wall(int column, int row, double dx, double dy, Corner corner, PostStyle style = PostStyle::kWeb) {
  return {Placement::Key(column, row), dx, dy, {corner, style}};
}

WallSegment thumb_wall(int index, double dx, double dy, Corner corner, PostStyle style = PostStyle::kWeb) {
  return {Placement::Thumb(index), dx, dy, {corner, style}};
}

bool same_segment_list(const std::vector<WallSegment>& a, const std::vector<WallSegment>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!(a[i].placement == b[i].placement) || !(a[i].post == b[i].post) || a[i].dx != b[i].dx ||
        a[i].dy != b[i].dy) {
      return false;
    }
  }
  return true;
}

bool same_segments(const std::vector<WallSide>& a, const std::vector<WallSide>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].kind != b[i].kind || a[i].joint_to_next != b[i].joint_to_next ||
        !same_segment_list(a[i].segments, b[i].segments)) {
      return false;
    }
  }
  return true;
}

bool same_hull_sets(const std::vector<HullSet>& a, const std::vector<HullSet>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].component != b[i].component || a[i].floor_projected != b[i].floor_projected ||
        a[i].posts != b[i].posts) {
      return false;
    }
  }
  return true;
}

// Intent: Shape placement, point placement and the composed pose must agree for every column style.
bool test_placement_paths_agree_for_all_styles() {
  const Vec3d local{3.5, -2.25, 1.0};
  for (const ColumnStyle style : {ColumnStyle::kStandard, ColumnStyle::kOrthographic, ColumnStyle::kFixed}) {
    const CurvatureModel model(params_with_style(style));
    for (int column = 0; column < model.params().ncols; ++column) {
      for (int row = 0; row < model.params().nrows; ++row) {
        const Vec3d point = model.key_position(column, row, local);
        const Vec3d posed = model.pose(column, row).apply(local);
        const Vec3d placed = placed_center(model.key_place(column, row, translate(local, Shape::Cube({1.0, 1.0, 1.0}))));
        if (!almost_equal(point, posed, 1e-6) || !almost_equal(point, placed, 1e-6)) {
          return false;
        }
      }
    }
  }
  return true;
}

// Intent: The orthographic style coincides with the standard style on the center column.
bool test_orthographic_matches_standard_at_center_column() {
  const CurvatureModel standard(params_with_style(ColumnStyle::kStandard));
  const CurvatureModel ortho(params_with_style(ColumnStyle::kOrthographic));
  const int center = static_cast<int>(standard.params().centercol);
  for (int row = 0; row < standard.params().nrows; ++row) {
    const Vec3d local{1.0, 2.0, 3.0};
    if (!almost_equal(standard.key_position(center, row, local), ortho.key_position(center, row, local), 1e-9)) {
      return false;
    }
  }
  return true;
}

// Intent: The fixed style reads its per-column tables directly; the center row has no radius terms.
bool test_fixed_style_uses_column_tables() {
  const ShapeParameters params = params_with_style(ColumnStyle::kFixed);
  const CurvatureModel model(params);
  const int center_row = static_cast<int>(params.centerrow);
  for (int column = 0; column < params.ncols; ++column) {
    const auto index = static_cast<std::size_t>(column);
    const Vec3d column_base = keyshell::core::rotate_y(
        params.fixed_tenting, Vec3d{params.fixed_x[index], 0.0, params.fixed_z[index]});
    const Vec3d expected =
        keyshell::core::rotate_y(params.tenting_angle, column_base + Vec3d{0.0, params.column_offsets[index].y, 0.0}) +
        Vec3d{0.0, 0.0, params.keyboard_z_offset};
    if (!almost_equal(model.key_position(column, center_row, {}), expected, 1e-9)) {
      return false;
    }
  }
  return true;
}

// Intent: Out-of-range columns are reported by the bounds-checked lookup instead of wrapping.
bool test_checked_pose_rejects_out_of_range_columns() {
  const CurvatureModel model;
  keyshell::core::Pose pose;
  std::string error;
  if (model.checked_pose(model.params().ncols, 0, &pose, &error) ||
      !starts_with(error, "curvature model: column 7 outside column offset table")) {
    return false;
  }

  ShapeParameters fixed = params_with_style(ColumnStyle::kFixed);
  fixed.fixed_z.resize(3);
  const CurvatureModel fixed_model(fixed);
  error.clear();
  if (fixed_model.checked_pose(4, 0, &pose, &error) || !contains(error, "fixed column table (3 entries)")) {
    return false;
  }
  error.clear();
  return model.checked_pose(2, 1, &pose, &error) && error.empty() &&
         almost_equal(pose.translation, model.key_position(2, 1, {}), 1e-9);
}

// Intent: The outer column shifts 1.5u mounts outward only inside the configured row range.
bool test_wide_pinky_keys_shift_outward() {
  ShapeParameters wide = keyshell::core::MakeDefaultShapeParameters();
  ShapeParameters narrow = wide;
  narrow.pinky_15u = false;
  const CurvatureModel wide_model(wide);
  const CurvatureModel narrow_model(narrow);
  const int last_column = keyshell::core::last_column(wide);

  const double shift =
      keyshell::core::length(wide_model.key_position(last_column, 0, {}) - narrow_model.key_position(last_column, 0, {}));
  const bool outside_range_unchanged = almost_equal(wide_model.key_position(last_column, 4, {}),
                                                    narrow_model.key_position(last_column, 4, {}), 1e-9);
  return almost_equal(shift, wide.wide_key_shift, 1e-9) && outside_range_unchanged &&
         keyshell::core::is_wide_key(wide, last_column, 3) && !keyshell::core::is_wide_key(wide, last_column, 4);
}

// Intent: Default layout omits the bottom-row cells outside the two center columns and the inner column's lower rows.
bool test_default_layout_key_set() {
  const ShapeParameters params = keyshell::core::MakeDefaultShapeParameters();
  const auto addresses = keyshell::core::enumerate_key_addresses(params);
  const auto present = [&](int column, int row) {
    return std::find(addresses.begin(), addresses.end(), keyshell::core::KeyAddress{column, row}) != addresses.end();
  };
  return addresses.size() == 29 && present(0, 0) && present(0, 2) && !present(0, 3) && present(3, 4) &&
         present(4, 4) && !present(2, 4) && !present(5, 4) && present(6, 3);
}

// Intent: Parameter validation reports each configuration inconsistency with its own code.
bool test_parameter_validation_codes() {
  ShapeParameters small = keyshell::core::MakeDefaultShapeParameters();
  small.nrows = 2;
  ShapeParameters flat = keyshell::core::MakeDefaultShapeParameters();
  flat.alpha = 0.0;
  ShapeParameters short_offsets = keyshell::core::MakeDefaultShapeParameters();
  short_offsets.column_offsets.resize(3);
  ShapeParameters short_fixed = params_with_style(ColumnStyle::kFixed);
  short_fixed.fixed_x.resize(3);
  ShapeParameters empty_pinky = keyshell::core::MakeDefaultShapeParameters();
  empty_pinky.first_15u_row = 3;
  empty_pinky.last_15u_row = 1;
  ShapeParameters wide_pinky = keyshell::core::MakeDefaultShapeParameters();
  wide_pinky.last_15u_row = 10;
  ShapeParameters thin_wall = keyshell::core::MakeDefaultShapeParameters();
  thin_wall.wall_thickness = 0.0;

  const auto empty_result = keyshell::core::ValidateShapeParameters(empty_pinky);
  return keyshell::core::ValidateShapeParameters(keyshell::core::MakeDefaultShapeParameters()).issues.empty() &&
         has_issue_code(keyshell::core::ValidateShapeParameters(small), "MatrixTooSmall") &&
         has_issue_code(keyshell::core::ValidateShapeParameters(flat), "DegenerateCurvature") &&
         has_issue_code(keyshell::core::ValidateShapeParameters(short_offsets), "ColumnOffsetTableTooShort") &&
         has_issue_code(keyshell::core::ValidateShapeParameters(short_fixed), "FixedColumnTableTooShort") &&
         has_issue_code(empty_result, "PinkyRangeEmpty") && empty_result.ok() &&
         has_issue_code(keyshell::core::ValidateShapeParameters(wide_pinky), "PinkyRangeOutOfBounds") &&
         has_issue_code(keyshell::core::ValidateShapeParameters(thin_wall), "NonPositiveWallThickness");
}

// Intent: Create refuses invalid parameters and names every error in its message.
bool test_create_rejects_invalid_parameters() {
  ShapeParameters params = keyshell::core::MakeDefaultShapeParameters();
  params.nrows = 2;
  params.beta = 0.0;
  const auto created = KeyboardModel::Create(params);
  return !created.ok && has_issue_code(created.validation, "MatrixTooSmall") &&
         has_issue_code(created.validation, "DegenerateCurvature") && contains(created.error, "; ") &&
         KeyboardModel::Create(keyshell::core::MakeDefaultShapeParameters()).ok;
}

// Intent: Thumb keys place shapes and points identically around the thumb origin.
bool test_thumb_placement_paths_agree() {
  const KeyboardModel model;
  const Vec3d local{2.0, -1.0, 0.5};
  for (int index = 0; index < 4; ++index) {
    const Vec3d point = model.thumb_place(index, local);
    const Vec3d placed = placed_center(model.thumb_place(index, translate(local, Shape::Cube({1.0, 1.0, 1.0}))));
    if (!almost_equal(point, placed, 1e-6)) {
      return false;
    }
  }
  const auto& spec = model.params().thumb_keys[0];
  return almost_equal(model.thumb_place(0, Vec3d{}), model.thumb_origin() + spec.offset, 1e-9);
}

// Intent: Sliding triangle windows that repeat a post are dropped instead of producing flat hulls.
bool test_triangle_strip_skips_repeated_posts() {
  const PlacedPost a{Placement::Thumb(1), {Corner::kBottomLeft, PostStyle::kWeb}, {}};
  const PlacedPost b{Placement::Thumb(1), {Corner::kTopLeft, PostStyle::kWeb}, {}};
  const PlacedPost c{Placement::Thumb(2), {Corner::kTopRight, PostStyle::kWeb}, {}};
  const PlacedPost d{Placement::Thumb(3), {Corner::kTopRight, PostStyle::kWeb}, {}};
  std::vector<HullSet> sets;
  keyshell::core::append_triangle_strip(MeshComponent::kThumbCluster, {a, a, b, c, c, d}, &sets);
  return sets.size() == 1 && sets[0].posts == std::vector<PlacedPost>{a, b, c} &&
         sets[0].component == MeshComponent::kThumbCluster && !sets[0].floor_projected;
}

// Intent: Every connector and wall hull of the default keyboard spans a plane.
bool test_default_mesh_has_no_degenerate_hulls() {
  const KeyboardModel model;
  const auto validation = model.ValidateMesh();
  return validation.ok() && !has_issue_code(validation, "HullDegenerate") &&
         !has_issue_code(validation, "PerimeterOpen");
}

// Intent: Toggle variants still produce a closed wall and non-degenerate hulls.
bool test_toggle_variants_validate() {
  std::vector<ShapeParameters> variants;
  ShapeParameters extra = keyshell::core::MakeDefaultShapeParameters();
  extra.extra_row = true;
  variants.push_back(extra);
  ShapeParameters no_inner = keyshell::core::MakeDefaultShapeParameters();
  no_inner.inner_column = false;
  no_inner.column_offsets = keyshell::core::default_column_offsets(false, no_inner.ncols);
  variants.push_back(no_inner);
  ShapeParameters middle_pinky = keyshell::core::MakeDefaultShapeParameters();
  middle_pinky.first_15u_row = 1;
  middle_pinky.last_15u_row = 2;
  variants.push_back(middle_pinky);
  variants.push_back(params_with_style(ColumnStyle::kOrthographic));
  variants.push_back(params_with_style(ColumnStyle::kFixed));

  for (const ShapeParameters& params : variants) {
    const auto created = KeyboardModel::Create(params);
    if (!created.ok || !created.value.ValidateMesh().ok()) {
      return false;
    }
  }
  return true;
}

// Intent: Consecutive wall braces share endpoints all the way around, and a missing brace is reported.
bool test_perimeter_closure() {
  const KeyboardModel model;
  std::vector<WallBrace> braces = model.wall_braces();
  if (braces.empty() || !model.check_perimeter_closure(braces).ok()) {
    return false;
  }
  const std::size_t segments = [&]() {
    std::size_t count = 0;
    for (const WallSide& side : model.wall_sides()) {
      count += side.segments.size();
    }
    return count;
  }();
  if (braces.size() != segments) {
    return false;
  }

  braces.erase(braces.begin() + 1);
  const auto broken = model.check_perimeter_closure(braces);
  return has_issue_code(broken, "PerimeterOpen") && contains(broken.error_summary(), "wall tracer: back wall");
}

// Intent: The thumb side joins the left wall with a floor-projected hull.
bool test_thumb_to_left_joint_is_floor_join() {
  const KeyboardModel model;
  for (const WallBrace& brace : model.wall_braces()) {
    if (brace.side == keyshell::core::WallSideKind::kThumb && brace.to.placement == Placement::Key(0, 2)) {
      const auto sets = keyshell::core::brace_hull_sets(model.params(), brace);
      return brace.kind == keyshell::core::BraceKind::kFloorJoin && sets.size() == 1 && sets[0].floor_projected &&
             sets[0].posts.size() == 7;
    }
  }
  return false;
}

// Intent: An empty 1.5u row range yields exactly the uniform-width walls and connectors.
bool test_empty_pinky_range_matches_baseline() {
  ShapeParameters empty = keyshell::core::MakeDefaultShapeParameters();
  empty.first_15u_row = 3;
  empty.last_15u_row = 1;
  ShapeParameters baseline = keyshell::core::MakeDefaultShapeParameters();
  baseline.pinky_15u = false;

  const KeyboardModel empty_model = make_model(empty);
  const KeyboardModel baseline_model = make_model(baseline);
  return empty_model.pinky_connector_sets().empty() &&
         same_segments(empty_model.wall_sides(), baseline_model.wall_sides()) &&
         same_hull_sets(empty_model.ConnectorHullSets(), baseline_model.ConnectorHullSets()) &&
         same_solid(empty_model.BuildWalls(), baseline_model.BuildWalls());
}

// Intent: The 1.5u pinky range adds wide posts to the right wall and blending connectors.
bool test_pinky_range_extends_right_wall() {
  const KeyboardModel model;
  const auto sides = model.wall_sides();
  const WallSide& right = sides[1];
  const std::size_t wide_posts = static_cast<std::size_t>(std::count_if(
      right.segments.begin(), right.segments.end(),
      [](const WallSegment& segment) { return segment.post.style == PostStyle::kWide; }));
  // Rows 0..3, two posts each.
  return right.kind == keyshell::core::WallSideKind::kRight && wide_posts == 8 &&
         !model.pinky_connector_sets().empty() && sides[0].segments.back().post.style == PostStyle::kWide;
}

// Intent: Thumb wall braces on 2u keys run along the 2u plate edge, not the 1u web posts inside it.
bool test_thumb_wall_uses_2u_posts() {
  const KeyboardModel model;
  const auto sides = model.wall_sides();
  const WallSide& thumb = sides[3];
  if (thumb.kind != WallSideKind::kThumb || thumb.segments.empty()) {
    return false;
  }
  std::size_t thumb_posts = 0;
  for (const WallSegment& segment : thumb.segments) {
    if (segment.placement.kind != keyshell::core::PlacementKind::kThumb) {
      return false;
    }
    const auto index = static_cast<std::size_t>(segment.placement.thumb_index);
    const PostStyle expected = model.params().thumb_keys[index].double_width ? PostStyle::kThumb : PostStyle::kWeb;
    if (segment.post.style != expected) {
      return false;
    }
    thumb_posts += segment.post.style == PostStyle::kThumb ? 1 : 0;
  }

  // The 2u front edge sits mount-height / 0.9 from the key center.
  const double height = keyshell::core::mount_height(model.params());
  const PlacedPost edge{Placement::Thumb(0), {Corner::kBottomLeft, PostStyle::kThumb}, {}};
  const PlacedPost inner{Placement::Thumb(0), {Corner::kBottomLeft, PostStyle::kWeb}, {}};
  const double gap = keyshell::core::length(model.post_position(edge) - model.post_position(inner));
  return thumb_posts == 5 && almost_equal(gap, height / 0.9 - height / 2.0, 1e-9);
}

// Intent: The default perimeter visits exactly the posts of the hand-built case walls, side by side.
bool test_default_wall_segments_golden() {
  const KeyboardModel model;
  const auto sides = model.wall_sides();
  if (sides.size() != 5) {
    return false;
  }
  constexpr Corner kTL = Corner::kTopLeft;
  constexpr Corner kTR = Corner::kTopRight;
  constexpr Corner kBL = Corner::kBottomLeft;
  constexpr Corner kBR = Corner::kBottomRight;
  constexpr PostStyle kWide = PostStyle::kWide;
  constexpr PostStyle kThumb = PostStyle::kThumb;

  std::vector<WallSegment> back;
  for (int column = 0; column < 7; ++column) {
    back.push_back(key_wall(column, 0, 0.0, 1.0, kTL));
    back.push_back(key_wall(column, 0, 0.0, 1.0, kTR));
  }
  back.push_back(key_wall(6, 0, 0.0, 1.0, kTR, kWide));

  std::vector<WallSegment> right;
  for (int row = 0; row <= 3; ++row) {
    right.push_back(key_wall(6, row, 1.0, 0.0, kTR, kWide));
    right.push_back(key_wall(6, row, 1.0, 0.0, kBR, kWide));
  }

  const std::vector<WallSegment> front = {
      key_wall(6, 3, 0.0, -1.0, kBR, kWide), key_wall(6, 3, 0.0, -1.0, kBR), key_wall(6, 3, 0.0, -1.0, kBL),
      key_wall(5, 3, 0.0, -1.0, kBR),        key_wall(5, 3, 0.0, -1.0, kBL), key_wall(4, 4, 0.0, -1.0, kBR),
      key_wall(4, 4, 0.0, -1.0, kBL),
  };

  const std::vector<WallSegment> thumb = {
      thumb_wall(0, 0.0, -1.0, kBR, kThumb), thumb_wall(0, 0.0, -1.0, kBL, kThumb),
      thumb_wall(1, 0.0, -1.0, kBR, kThumb), thumb_wall(1, 0.0, -1.0, kBL, kThumb),
      thumb_wall(3, 0.0, -1.0, kBR),         thumb_wall(3, 0.0, -1.0, kBL),
      thumb_wall(3, -1.0, 0.0, kBL),         thumb_wall(3, -1.0, 0.0, kTL),
      thumb_wall(2, -1.0, 0.0, kBL),         thumb_wall(2, -1.0, 0.0, kTL),
      thumb_wall(2, 0.0, 1.0, kTL),          thumb_wall(2, 0.0, 1.0, kTR),
      thumb_wall(1, -1.0, 0.0, kTL, kThumb),
  };

  std::vector<WallSegment> left;
  for (int row = 2; row >= 0; --row) {
    left.push_back(key_wall(0, row, -1.0, 0.0, kBL));
    left.push_back(key_wall(0, row, -1.0, 0.0, kTL));
  }

  return sides[0].kind == WallSideKind::kBack && same_segment_list(sides[0].segments, back) &&
         sides[1].kind == WallSideKind::kRight && same_segment_list(sides[1].segments, right) &&
         sides[2].kind == WallSideKind::kFront && same_segment_list(sides[2].segments, front) &&
         sides[3].kind == WallSideKind::kThumb && same_segment_list(sides[3].segments, thumb) &&
         sides[4].kind == WallSideKind::kLeft && same_segment_list(sides[4].segments, left) &&
         model.wall_braces().size() == 49;
}

// Intent: The evaluated web stands on the floor plane and stays within a post's reach of the traced hull points.
bool test_default_web_bounds_follow_hull_points() {
  const KeyboardModel model;
  const ShapeParameters& p = model.params();
  constexpr double kInf = std::numeric_limits<double>::infinity();
  AABBd points{{kInf, kInf, kInf}, {-kInf, -kInf, -kInf}};
  const auto extend = [&](const Vec3d& at) {
    points.min = {std::min(points.min.x, at.x), std::min(points.min.y, at.y), std::min(points.min.z, at.z)};
    points.max = {std::max(points.max.x, at.x), std::max(points.max.y, at.y), std::max(points.max.z, at.z)};
  };
  std::vector<HullSet> sets = model.ConnectorHullSets();
  const std::vector<HullSet> walls = model.WallHullSets();
  sets.insert(sets.end(), walls.begin(), walls.end());
  for (const HullSet& set : sets) {
    for (const PlacedPost& post : set.posts) {
      const Vec3d at = model.post_position(post);
      extend(at);
      if (set.floor_projected) {
        extend({at.x, at.y, p.floor_z});
      }
    }
  }

  // Post cubes and plate corners reach at most half the web thickness past a post center.
  const double reach = 3.0;
  const auto hugs = [&](double actual_min, double actual_max, double min, double max) {
    return actual_min <= min + 1e-9 && actual_min >= min - reach && actual_max >= max - 1e-9 &&
           actual_max <= max + reach;
  };
  const AABBd web = model.BuildWeb().bounds();
  const AABBd shell = model.BuildCaseShell().bounds();
  return hugs(web.min.x, web.max.x, points.min.x, points.max.x) &&
         hugs(web.min.y, web.max.y, points.min.y, points.max.y) &&
         hugs(web.min.z, web.max.z, points.min.z, points.max.z) && almost_equal(web.min.z, p.floor_z, 1e-6) &&
         almost_equal(shell.min.z, 0.0, 1e-6) && shell.max.z <= web.max.z + 1e-6;
}

// Intent: The default keyboard web evaluates to one connected solid.
bool test_default_web_is_single_island() {
  const KeyboardModel model;
  const auto stats = model.mesh_stats();
  return model.BuildWeb().backend_error().empty() && stats.web_islands == 1 && stats.web_vertices > 0 &&
         stats.key_count == 33 && stats.connector_sets > 0 && stats.wall_sets >= stats.wall_braces;
}

// Intent: Generation is a pure function of the parameters.
bool test_generation_is_deterministic() {
  const KeyboardModel first;
  const KeyboardModel second = make_model(keyshell::core::MakeDefaultShapeParameters());
  return same_solid(first.BuildConnectors(), second.BuildConnectors()) &&
         same_solid(first.BuildWalls(), second.BuildWalls()) && same_solid(first.BuildThumb(), second.BuildThumb());
}

// Intent: Artifact names follow the requested halves and test pieces.
bool test_build_artifacts_names() {
  const KeyboardModel model;
  const auto full = model.BuildArtifacts();
  keyshell::core::BuildOptions options;
  options.include_left = true;
  options.include_test_pieces = false;
  const auto halves = model.BuildArtifacts(options);
  if (!full.ok || !halves.ok) {
    return false;
  }

  std::vector<std::string> full_names;
  for (const auto& artifact : full.value) {
    full_names.push_back(artifact.name);
  }
  std::vector<std::string> half_names;
  for (const auto& artifact : halves.value) {
    half_names.push_back(artifact.name);
  }
  const std::vector<std::string> expected_full = {"right",
                                                  "right-plate",
                                                  "stabilizer-unit-test",
                                                  "countersink-unit-test",
                                                  "nicenano-integration-test-plate",
                                                  "nicenano-integration-test-wall"};
  const std::vector<std::string> expected_halves = {"right", "right-plate", "left", "left-plate"};
  // The left half is the right half reflected across the YZ plane.
  const AABBd right = halves.value[0].shape.bounds();
  const AABBd left = halves.value[2].shape.bounds();
  return full_names == expected_full && half_names == expected_halves && almost_equal(left.min.x, -right.max.x, 1e-6) &&
         almost_equal(left.max.x, -right.min.x, 1e-6) && almost_equal(left.min.y, right.min.y, 1e-6) &&
         almost_equal(left.max.z, right.max.z, 1e-6);
}

// Intent: Empty operands vanish from booleans and transforms of nothing stay empty.
bool test_shape_empty_operands() {
  const Shape cube = Shape::Cube({1.0, 2.0, 3.0});
  return almost_equal(keyshell::core::union_of({Shape{}, cube, Shape{}}).volume(), 6.0, 1e-9) &&
         keyshell::core::union_of({}).empty() && almost_equal(difference(cube, {}).volume(), 6.0, 1e-9) &&
         keyshell::core::intersection({cube, Shape{}}).empty() && translate({1.0, 0.0, 0.0}, Shape{}).empty() &&
         keyshell::core::hull({}).empty() && project(Shape{}).empty() &&
         linear_extrude(1.0, false, Profile{}).empty() && Shape{}.component_count() == 0;
}

// Intent: Booleans, hulls, extrusion and projection produce the expected solids.
bool test_shape_backend_operations() {
  const Shape cube = Shape::Cube({2.0, 2.0, 2.0});
  const Shape overlapping = keyshell::core::union_of({cube, translate({1.0, 0.0, 0.0}, cube)});
  const Shape apart = keyshell::core::union_of({cube, translate({5.0, 0.0, 0.0}, cube)});
  const Shape hollowed = difference(cube, {Shape::Cube({1.0, 1.0, 1.0})});
  const Shape unit = Shape::Cube({1.0, 1.0, 1.0});
  const Shape stretched = keyshell::core::hull({unit, translate({3.0, 0.0, 0.0}, unit)});
  const Shape block = Shape::Cube({2.0, 3.0, 4.0});
  const Shape extruded = linear_extrude(5.0, false, project(block));
  const Profile clockwise = Profile::Polygon({{0.0, 0.0}, {0.0, 1.0}, {1.0, 0.0}});
  const Profile counter_clockwise = Profile::Polygon({{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}});
  const Shape mirrored = mirror({1.0, 0.0, 0.0}, translate({5.0, 0.0, 0.0}, unit));
  // Half a turn about the xy diagonal swaps x and y.
  const Shape turned = rotate(keyshell::core::kPi, {1.0, 1.0, 0.0}, translate({1.0, 0.0, 0.0}, unit));
  const AABBd cone = Shape::Cylinder(1.0, 2.0, 3.0, 30, false).bounds();

  return almost_equal(overlapping.volume(), 12.0, 1e-9) && overlapping.component_count() == 1 &&
         apart.component_count() == 2 && almost_equal(hollowed.volume(), 7.0, 1e-9) &&
         almost_equal(stretched.volume(), 4.0, 1e-9) && almost_equal(project(block).area(), 6.0, 1e-9) &&
         almost_equal(extruded.volume(), 30.0, 1e-9) && almost_equal(extruded.bounds().min.z, 0.0) &&
         almost_equal(extruded.bounds().max.z, 5.0) && almost_equal(clockwise.area(), 0.5, 1e-12) &&
         almost_equal(counter_clockwise.area(), 0.5, 1e-12) &&
         almost_equal(placed_center(mirrored), {-5.0, 0.0, 0.0}, 1e-9) &&
         almost_equal(placed_center(turned), {0.0, 1.0, 0.0}, 1e-6) && almost_equal(cone.min.z, 0.0) &&
         almost_equal(cone.max.z, 3.0) && almost_equal(cone.max.x, 2.0, 1e-6) && cube.backend_error().empty();
}

// Intent: The STL writer emits the binary header, triangle count and one 50-byte record per triangle.
bool test_stl_writer_output() {
  const Shape cube = Shape::Cube({1.0, 1.0, 1.0});
  std::ostringstream out;
  std::string error;
  if (!keyshell::core::write_stl(out, cube, &error) || !error.empty()) {
    return false;
  }
  const std::string bytes = out.str();
  if (bytes.size() < 84) {
    return false;
  }
  std::uint32_t triangles = 0;
  std::memcpy(&triangles, bytes.data() + 80, sizeof(triangles));

  std::ostringstream empty_out;
  std::string empty_error;
  const bool empty_written = keyshell::core::write_stl(empty_out, Shape{}, &empty_error);
  return starts_with(bytes, "keyshell") && triangles == cube.triangle_count() && triangles == 12 &&
         bytes.size() == 84 + 50 * static_cast<std::size_t>(triangles) && !empty_written &&
         contains(empty_error, "mesh is empty") && empty_out.str().empty();
}

// Intent: Parameter files override defaults and regenerate the tables that follow the matrix size.
bool test_config_file_overrides() {
  const auto loaded = keyshell::core::LoadShapeParameters(
      "nrows = 6\n"
      "alpha-deg = 30\n"
      "column-style = fixed\n"
      "inner-column = false\n"
      "thumb-offsets = 1, 2.5, -3\n"
      "fixed-angles-deg = 10,10,0,0,0,-15,-15\n");
  if (!loaded.ok) {
    return false;
  }
  const ShapeParameters& p = loaded.value;
  return p.nrows == 6 && almost_equal(p.centerrow, 3.0) && almost_equal(p.alpha, keyshell::core::kPi / 6.0) &&
         p.column_style == ColumnStyle::kFixed && !p.inner_column && p.column_offsets.size() == 7 &&
         almost_equal(p.column_offsets[2], {0.0, 2.82, -4.5}) && almost_equal(p.thumb_offsets, {1.0, 2.5, -3.0}) &&
         almost_equal(p.fixed_angles[5], keyshell::core::deg_to_rad(-15.0)) && p.screw_inserts.size() == 5 &&
         p.screw_inserts[1].row == 5;
}

// Intent: Malformed parameter values fail the load with the offending key in the message.
bool test_config_rejects_malformed_values() {
  const auto short_vector = keyshell::core::LoadShapeParameters("thumb-offsets = 1,2\n");
  const auto bad_number = keyshell::core::LoadShapeParameters("fixed-x = 1,two,3\n");
  const auto bad_style = keyshell::core::LoadShapeParameters("column-style = spiral\n");
  const auto unknown = keyshell::core::LoadShapeParameters("not-a-parameter = 1\n");
  const auto offsets = keyshell::core::LoadShapeParameters("column-offsets = 0,0,0; 0,1\n");
  return !short_vector.ok && contains(short_vector.error, "thumb-offsets") && !bad_number.ok &&
         contains(bad_number.error, "fixed-x") && contains(bad_number.error, "two") && !bad_style.ok &&
         contains(bad_style.error, "column-style") && !unknown.ok && !offsets.ok &&
         contains(offsets.error, "column-offsets");
}

// Intent: Command-line values override parameters and set the generator options.
bool test_command_line_options() {
  const char* argv[] = {"keyshell", "--ncols", "8", "--left", "--no-test-pieces", "--output-dir", "out",
                        "--column-offsets", "0,0,0;0,0,0;0,0,0;0,0,0;0,0,0;0,0,0;0,0,0;1,2,3"};
  const auto loaded = keyshell::core::LoadGeneratorConfig(static_cast<int>(std::size(argv)), argv);
  if (!loaded.ok) {
    return false;
  }
  const auto& config = loaded.value;
  const auto bad = keyshell::core::LoadGeneratorConfig(3, std::vector<const char*>{"keyshell", "--nrows", "x"}.data());
  return config.params.ncols == 8 && config.params.column_offsets.size() == 8 &&
         almost_equal(config.params.column_offsets[7], {1.0, 2.0, 3.0}) && config.build.include_left &&
         !config.build.include_test_pieces && config.output_dir == "out" && config.log_level == "info" &&
         !config.validate_only && !bad.ok && contains(bad.error, "nrows");
}

}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Curvature_PlacementPathsAgree", "Shape, point and pose placement agree for all styles", test_placement_paths_agree_for_all_styles},
      {"Curvature_OrthoMatchesStandardAtCenter", "Orthographic equals standard on the center column", test_orthographic_matches_standard_at_center_column},
      {"Curvature_FixedStyleTables", "Fixed style reads its per-column tables", test_fixed_style_uses_column_tables},
      {"Curvature_CheckedPoseBounds", "Out-of-range columns are reported", test_checked_pose_rejects_out_of_range_columns},
      {"Curvature_WidePinkyShift", "1.5u keys shift only inside the row range", test_wide_pinky_keys_shift_outward},
      {"Layout_DefaultKeySet", "Default layout has the expected present keys", test_default_layout_key_set},
      {"Parameters_ValidationCodes", "Each inconsistency has its own code", test_parameter_validation_codes},
      {"Model_CreateRejectsInvalid", "Create refuses invalid parameters", test_create_rejects_invalid_parameters},
      {"Thumb_PlacementPathsAgree", "Thumb shape and point placement agree", test_thumb_placement_paths_agree},
      {"Mesh_TriangleStripSkipsRepeats", "Repeated-post windows are dropped", test_triangle_strip_skips_repeated_posts},
      {"Mesh_DefaultHullsNonDegenerate", "Default hull inputs all span a plane", test_default_mesh_has_no_degenerate_hulls},
      {"Mesh_ToggleVariantsValidate", "Toggle variants validate cleanly", test_toggle_variants_validate},
      {"Walls_PerimeterClosure", "Wall braces close the perimeter loop", test_perimeter_closure},
      {"Walls_ThumbLeftFloorJoin", "Thumb side meets the left wall at the floor", test_thumb_to_left_joint_is_floor_join},
      {"Walls_EmptyPinkyRangeBaseline", "Empty 1.5u range equals uniform-width topology", test_empty_pinky_range_matches_baseline},
      {"Walls_PinkyRangeRightWall", "1.5u range adds wide right wall posts", test_pinky_range_extends_right_wall},
      {"Walls_ThumbUses2uPosts", "2u thumb keys brace from their plate edge", test_thumb_wall_uses_2u_posts},
      {"Walls_DefaultSegmentsGolden", "Default perimeter matches the case wall list", test_default_wall_segments_golden},
      {"Mesh_DefaultWebBounds", "Web bounds follow the traced hull points", test_default_web_bounds_follow_hull_points},
      {"Mesh_DefaultSingleIsland", "Default web is one connected solid", test_default_web_is_single_island},
      {"Assembly_Deterministic", "Generation is deterministic", test_generation_is_deterministic},
      {"Assembly_ArtifactNames", "Artifacts follow the build options", test_build_artifacts_names},
      {"Shape_EmptyOperands", "Empty operands are dropped", test_shape_empty_operands},
      {"Shape_BackendOperations", "Booleans, hulls and extrusions evaluate correctly", test_shape_backend_operations},
      {"StlWriter_Output", "Binary STL layout", test_stl_writer_output},
      {"Config_FileOverrides", "Parameter file overrides and regenerates tables", test_config_file_overrides},
      {"Config_MalformedValues", "Malformed values name the key", test_config_rejects_malformed_values},
      {"Config_CommandLine", "Command line sets parameters and options", test_command_line_options},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}
