#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "keyshell/core/parameters.hpp"
#include "keyshell/core/result.hpp"
#include "keyshell/core/types.hpp"

namespace keyshell::core {

enum class Corner : std::uint8_t {
  kTopLeft = 0,
  kTopRight = 1,
  kBottomLeft = 2,
  kBottomRight = 3,
};

enum class PostStyle : std::uint8_t {
  kWeb = 0,    // 1u mount corner
  kWide = 1,   // 1.5u pinky mount corner
  kThumb = 2,  // 2u thumb mount corner
};

struct CornerPost {
  Corner corner = Corner::kTopLeft;
  PostStyle style = PostStyle::kWeb;

  bool operator==(const CornerPost& other) const { return corner == other.corner && style == other.style; }
};

std::string_view to_string(Corner corner);
std::string_view to_string(PostStyle style);

// Post offset from the mount's local origin, before the web post's own
// z lift.
Vec3d corner_post_offset(const ShapeParameters& p, const CornerPost& post);

// Local center of the web post cube at a corner.
Vec3d corner_post_center(const ShapeParameters& p, const CornerPost& post);

enum class PlacementKind : std::uint8_t {
  kKey = 0,
  kThumb = 1,
};

struct Placement {
  PlacementKind kind = PlacementKind::kKey;
  int column = 0;
  int row = 0;
  int thumb_index = 0;

  static Placement Key(int column, int row) { return {PlacementKind::kKey, column, row, 0}; }
  static Placement Thumb(int index) { return {PlacementKind::kThumb, 0, 0, index}; }

  bool operator==(const Placement& other) const {
    if (kind != other.kind) {
      return false;
    }
    return kind == PlacementKind::kKey ? column == other.column && row == other.row
                                       : thumb_index == other.thumb_index;
  }
};

std::string describe(const Placement& placement);

struct PlacedPost {
  Placement placement{};
  CornerPost post{};
  Vec3d shift{};  // local translation applied to the post before placement

  bool operator==(const PlacedPost& other) const {
    return placement == other.placement && post == other.post && shift == other.shift;
  }
};

std::string describe(const PlacedPost& post);

enum class MeshComponent : std::uint8_t {
  kMatrixRows = 0,
  kMatrixColumns = 1,
  kMatrixDiagonals = 2,
  kInnerColumn = 3,
  kExtraRow = 4,
  kPinky = 5,
  kThumbCluster = 6,
  kThumbToMatrix = 7,
  kInnerFiller = 8,
  kWall = 9,
};

std::string_view to_string(MeshComponent component);

// One convex hull over placed corner posts. Floor-projected sets are hulled
// together with their projection onto the floor plane.
struct HullSet {
  MeshComponent component = MeshComponent::kMatrixRows;
  std::vector<PlacedPost> posts{};
  bool floor_projected = false;
};

// Appends one hull per sliding window of three posts. Windows that repeat a
// post are skipped.
void append_triangle_strip(MeshComponent component, const std::vector<PlacedPost>& posts,
                           std::vector<HullSet>* out_sets);

// Wall brace lip offsets, in the mount's local frame.
Vec3d wall_locate1(const ShapeParameters& p, double dx, double dy);
Vec3d wall_locate2(const ShapeParameters& p, double dx, double dy);
Vec3d wall_locate3(const ShapeParameters& p, double dx, double dy);

enum class WallSideKind : std::uint8_t {
  kBack = 0,
  kRight = 1,
  kFront = 2,
  kThumb = 3,
  kLeft = 4,
};

std::string_view to_string(WallSideKind kind);

struct WallSegment {
  Placement placement{};
  double dx = 0.0;
  double dy = 0.0;
  CornerPost post{};
};

enum class BraceKind : std::uint8_t {
  kWall = 0,       // panel hull plus floor hull of the outer lips
  kFloorJoin = 1,  // one floor-projected hull over both ends
};

struct WallSide {
  WallSideKind kind = WallSideKind::kBack;
  std::vector<WallSegment> segments{};
  BraceKind joint_to_next = BraceKind::kWall;
};

struct WallBrace {
  WallSegment from{};
  WallSegment to{};
  BraceKind kind = BraceKind::kWall;
  WallSideKind side = WallSideKind::kBack;
};

// Braces between consecutive segments of each side, then one joint brace
// from each side's last segment to the next side's first, wrapping around.
[[nodiscard]] std::vector<WallBrace> trace_perimeter(const std::vector<WallSide>& sides);

// Hull sets of one brace (panel + floor, or the single floor join).
[[nodiscard]] std::vector<HullSet> brace_hull_sets(const ShapeParameters& p, const WallBrace& brace);

// Post identity of a segment, without lip offsets.
inline PlacedPost segment_post(const WallSegment& segment) { return {segment.placement, segment.post, {}}; }

std::string describe(const WallSegment& segment);

// True when the points span a plane: at least three of them are distinct and
// not collinear.
[[nodiscard]] bool has_three_non_collinear(const std::vector<Vec3d>& points, double tolerance = 1e-6);

}  // namespace keyshell::core
