#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "keyshell/core/accessories.hpp"
#include "keyshell/core/curvature.hpp"
#include "keyshell/core/mesh.hpp"
#include "keyshell/core/parameters.hpp"
#include "keyshell/core/result.hpp"
#include "keyshell/core/shape.hpp"
#include "keyshell/core/types.hpp"

namespace keyshell::core {

struct KeyboardArtifact {
  std::string name{};  // file stem, e.g. "right-plate"
  Shape shape{};
};

struct BuildOptions {
  bool include_left = false;
  bool include_test_pieces = true;
};

struct MeshStats {
  std::size_t key_count = 0;
  std::size_t connector_sets = 0;
  std::size_t wall_braces = 0;
  std::size_t wall_sets = 0;
  std::size_t web_islands = 0;
  std::size_t web_vertices = 0;
};

// One keyboard half generated from immutable shape parameters. Every
// accessor is a pure function of the parameters.
class KeyboardModel {
 public:
  KeyboardModel();

  // Validates the parameters; ok=false lists every error issue.
  static GenerateResult<KeyboardModel> Create(const ShapeParameters& params);

  [[nodiscard]] const ShapeParameters& params() const { return params_; }
  [[nodiscard]] const CurvatureModel& curvature() const { return curvature_; }

  // Placement.
  [[nodiscard]] Vec3d thumb_origin() const { return thumb_origin_; }

  template <Placeable T>
  [[nodiscard]] T thumb_place(int index, const T& value) const {
    const ThumbKeySpec& spec = params_.thumb_keys[static_cast<std::size_t>(index)];
    T placed = translate(spec.pre_offset, value);
    placed = rotate_x(deg_to_rad(spec.rotation_deg.x), placed);
    placed = rotate_y(deg_to_rad(spec.rotation_deg.y), placed);
    placed = rotate_z(deg_to_rad(spec.rotation_deg.z), placed);
    placed = translate(thumb_origin_, placed);
    return translate(spec.offset, placed);
  }

  template <Placeable T>
  [[nodiscard]] T place(const Placement& placement, const T& value) const {
    if (placement.kind == PlacementKind::kThumb) {
      return thumb_place(placement.thumb_index, value);
    }
    return curvature_.place(placement.column, placement.row, value);
  }

  [[nodiscard]] Shape web_post() const;
  [[nodiscard]] Shape post_shape(const PlacedPost& post) const;
  [[nodiscard]] Vec3d post_position(const PlacedPost& post) const;

  // Matrix layout and key mounts.
  [[nodiscard]] std::vector<KeyAddress> key_addresses() const;
  [[nodiscard]] Shape plate_1u(double height_offset = 0.0) const;
  [[nodiscard]] Shape plate_2u() const;
  [[nodiscard]] Shape keyhole_fill() const;
  [[nodiscard]] Shape BuildKeyHoles() const;
  [[nodiscard]] Shape BuildKeyFills() const;

  // Thumb cluster.
  [[nodiscard]] Shape thumb_1u_layout(const Shape& shape) const;
  [[nodiscard]] Shape thumb_2u_layout(const Shape& shape) const;
  [[nodiscard]] Shape BuildThumb() const;

  // Connector meshing.
  [[nodiscard]] std::vector<HullSet> matrix_connector_sets() const;
  [[nodiscard]] std::vector<HullSet> inner_connector_sets() const;
  [[nodiscard]] std::vector<HullSet> extra_row_connector_sets() const;
  [[nodiscard]] std::vector<HullSet> pinky_connector_sets() const;
  [[nodiscard]] std::vector<HullSet> thumb_connector_sets() const;
  [[nodiscard]] std::vector<HullSet> inner_filler_sets() const;
  [[nodiscard]] std::vector<HullSet> ConnectorHullSets() const;
  [[nodiscard]] Shape hull_shape(const HullSet& set) const;
  [[nodiscard]] Shape BuildConnectors() const;

  // Wall tracer.
  [[nodiscard]] std::vector<WallSide> wall_sides() const;
  [[nodiscard]] std::vector<WallBrace> wall_braces() const;
  [[nodiscard]] std::vector<HullSet> WallHullSets() const;
  [[nodiscard]] Shape BuildWalls() const;
  [[nodiscard]] ValidationResult check_perimeter_closure(const std::vector<WallBrace>& braces) const;

  // Key mounts, connectors, thumb plates and walls without accessories.
  [[nodiscard]] Shape BuildWeb() const;

  // Mesh consistency.
  [[nodiscard]] ValidationResult ValidateMesh() const;
  // Connected solids in the evaluated web.
  [[nodiscard]] std::size_t count_web_islands() const;
  [[nodiscard]] MeshStats mesh_stats() const;

  // Assembly.
  [[nodiscard]] Accessories accessories() const;
  [[nodiscard]] Shape BuildCaseShell() const;
  [[nodiscard]] Shape BuildBasePlate() const;
  [[nodiscard]] GenerateResult<std::vector<KeyboardArtifact>> BuildArtifacts(const BuildOptions& options = {}) const;

 private:
  explicit KeyboardModel(ShapeParameters params);

  [[nodiscard]] PlacedPost key_post(int column, int row, Corner corner, PostStyle style = PostStyle::kWeb) const;
  [[nodiscard]] PlacedPost thumb_post(int index, Corner corner) const;
  [[nodiscard]] std::vector<Vec3d> hull_points(const HullSet& set) const;
  [[nodiscard]] Shape bottom_hull(const std::vector<Shape>& shapes) const;
  [[nodiscard]] Shape BuildCaseShell(const Accessories& parts) const;
  [[nodiscard]] Shape BuildBasePlate(const Accessories& parts) const;

  ShapeParameters params_{};
  CurvatureModel curvature_{};
  Vec3d thumb_origin_{};
};

}  // namespace keyshell::core
