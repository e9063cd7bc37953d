#include "keyshell/core/keyboard_model.hpp"

#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace keyshell::core {

KeyboardModel::KeyboardModel() : KeyboardModel(MakeDefaultShapeParameters()) {}

KeyboardModel::KeyboardModel(ShapeParameters params) : params_(std::move(params)), curvature_(params_) {
  const ShapeParameters& p = params_;
  const Vec3d anchor{mount_width(p) / 2.0, -mount_height(p) / 2.0, 0.0};
  thumb_origin_ = curvature_.key_position(inner_column_offset(p) + 1, corner_row(p), anchor) + p.thumb_offsets;
}

GenerateResult<KeyboardModel> KeyboardModel::Create(const ShapeParameters& params) {
  GenerateResult<KeyboardModel> result;
  result.validation = ValidateShapeParameters(params);
  for (const ValidationIssue& issue : result.validation.issues) {
    if (issue.severity == ValidationSeverity::kWarning) {
      spdlog::warn("{}: {}", issue.code, issue.message);
    }
  }
  if (result.validation.has_errors()) {
    result.error = result.validation.error_summary();
    return result;
  }

  result.value = KeyboardModel(params);
  result.ok = true;
  return result;
}

Shape KeyboardModel::web_post() const {
  const double web = params_.web_thickness;
  return translate({0.0, 0.0, web / -2.0 + params_.switch_hole.plate_thickness},
                   Shape::Cube({params_.post_size, params_.post_size, web}));
}

Shape KeyboardModel::post_shape(const PlacedPost& post) const {
  const Shape local = translate(post.shift, translate(corner_post_offset(params_, post.post), web_post()));
  return place(post.placement, local);
}

Vec3d KeyboardModel::post_position(const PlacedPost& post) const {
  return place(post.placement, corner_post_center(params_, post.post) + post.shift);
}

PlacedPost KeyboardModel::key_post(int column, int row, Corner corner, PostStyle style) const {
  return {Placement::Key(column, row), {corner, style}, {}};
}

PlacedPost KeyboardModel::thumb_post(int index, Corner corner) const {
  const bool double_width = params_.thumb_keys[static_cast<std::size_t>(index)].double_width;
  return {Placement::Thumb(index), {corner, double_width ? PostStyle::kThumb : PostStyle::kWeb}, {}};
}

std::vector<Vec3d> KeyboardModel::hull_points(const HullSet& set) const {
  std::vector<Vec3d> points;
  points.reserve(set.posts.size() * 2);
  for (const PlacedPost& post : set.posts) {
    points.push_back(post_position(post));
  }
  if (set.floor_projected) {
    const std::size_t count = points.size();
    for (std::size_t i = 0; i < count; ++i) {
      points.push_back({points[i].x, points[i].y, params_.floor_z});
    }
  }
  return points;
}

Shape KeyboardModel::bottom_hull(const std::vector<Shape>& shapes) const {
  // Thin slab under the shapes' footprint, on the projection plane.
  const double height = 0.001;
  const Shape floor =
      translate({0.0, 0.0, height / 2.0 + params_.floor_z}, linear_extrude(height, true, project(union_of(shapes))));
  std::vector<Shape> parts = shapes;
  parts.push_back(floor);
  return hull(parts);
}

Shape KeyboardModel::hull_shape(const HullSet& set) const {
  std::vector<Shape> posts;
  posts.reserve(set.posts.size());
  for (const PlacedPost& post : set.posts) {
    posts.push_back(post_shape(post));
  }
  return set.floor_projected ? bottom_hull(posts) : hull(posts);
}

ValidationResult KeyboardModel::ValidateMesh() const {
  ValidationResult result;

  const auto check_sets = [&](const std::vector<HullSet>& sets) {
    for (const HullSet& set : sets) {
      if (has_three_non_collinear(hull_points(set))) {
        continue;
      }
      std::string posts;
      for (const PlacedPost& post : set.posts) {
        if (!posts.empty()) {
          posts += ", ";
        }
        posts += describe(post);
      }
      result.add_error("HullDegenerate",
                       std::string(to_string(set.component)) + ": degenerate hull over [" + posts + "]");
    }
  };
  check_sets(ConnectorHullSets());
  check_sets(WallHullSets());

  result.append(check_perimeter_closure(wall_braces()));

  const Shape web = BuildWeb();
  const std::string backend_error = web.backend_error();
  if (!backend_error.empty()) {
    result.add_error("BackendError", "web: " + backend_error);
    return result;
  }
  const std::size_t islands = web.component_count();
  if (islands > 1) {
    result.add_warning("WebIslands", "web splits into " + std::to_string(islands) + " disconnected solids");
  }
  return result;
}

Shape KeyboardModel::BuildWeb() const {
  return union_of({BuildKeyHoles(), BuildConnectors(), BuildThumb(), BuildWalls()});
}

std::size_t KeyboardModel::count_web_islands() const { return BuildWeb().component_count(); }

MeshStats KeyboardModel::mesh_stats() const {
  MeshStats stats;
  stats.key_count = key_addresses().size() + params_.thumb_keys.size();
  stats.connector_sets = ConnectorHullSets().size();
  stats.wall_braces = wall_braces().size();
  stats.wall_sets = WallHullSets().size();
  const Shape web = BuildWeb();
  stats.web_islands = web.component_count();
  stats.web_vertices = web.vertex_count();
  return stats;
}

}  // namespace keyshell::core
