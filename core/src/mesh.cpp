#include "keyshell/core/mesh.hpp"

#include <cstddef>
#include <string>

namespace keyshell::core {

std::string_view to_string(Corner corner) {
  switch (corner) {
    case Corner::kTopLeft:
      return "top-left";
    case Corner::kTopRight:
      return "top-right";
    case Corner::kBottomLeft:
      return "bottom-left";
    case Corner::kBottomRight:
      return "bottom-right";
  }
  return "unknown";
}

std::string_view to_string(PostStyle style) {
  switch (style) {
    case PostStyle::kWeb:
      return "web";
    case PostStyle::kWide:
      return "wide";
    case PostStyle::kThumb:
      return "thumb";
  }
  return "unknown";
}

Vec3d corner_post_offset(const ShapeParameters& p, const CornerPost& post) {
  const bool right = post.corner == Corner::kTopRight || post.corner == Corner::kBottomRight;
  const bool top = post.corner == Corner::kTopLeft || post.corner == Corner::kTopRight;
  const double half_width = post.style == PostStyle::kWide ? mount_width(p) / 1.2 : mount_width(p) / 2.0;
  const double half_height = post.style == PostStyle::kThumb ? mount_height(p) / 0.9 : mount_height(p) / 2.0;
  const double adj = post_adjust(p);
  const double sx = right ? 1.0 : -1.0;
  const double sy = top ? 1.0 : -1.0;
  return {sx * (half_width - adj), sy * (half_height - adj), 0.0};
}

Vec3d corner_post_center(const ShapeParameters& p, const CornerPost& post) {
  return corner_post_offset(p, post) + Vec3d{0.0, 0.0, p.switch_hole.plate_thickness - p.web_thickness / 2.0};
}

std::string describe(const Placement& placement) {
  if (placement.kind == PlacementKind::kThumb) {
    return "thumb(" + std::to_string(placement.thumb_index) + ")";
  }
  return "key(" + std::to_string(placement.column) + "," + std::to_string(placement.row) + ")";
}

std::string describe(const PlacedPost& post) {
  std::string out = describe(post.placement) + " ";
  if (post.post.style != PostStyle::kWeb) {
    out += std::string(to_string(post.post.style)) + " ";
  }
  out += to_string(post.post.corner);
  return out;
}

std::string_view to_string(MeshComponent component) {
  switch (component) {
    case MeshComponent::kMatrixRows:
      return "matrix row connectors";
    case MeshComponent::kMatrixColumns:
      return "matrix column connectors";
    case MeshComponent::kMatrixDiagonals:
      return "matrix diagonal connectors";
    case MeshComponent::kInnerColumn:
      return "inner column connectors";
    case MeshComponent::kExtraRow:
      return "extra row connectors";
    case MeshComponent::kPinky:
      return "pinky 1.5u connectors";
    case MeshComponent::kThumbCluster:
      return "thumb cluster connectors";
    case MeshComponent::kThumbToMatrix:
      return "thumb to matrix connectors";
    case MeshComponent::kInnerFiller:
      return "inner column filler";
    case MeshComponent::kWall:
      return "wall tracer";
  }
  return "unknown";
}

void append_triangle_strip(MeshComponent component, const std::vector<PlacedPost>& posts,
                           std::vector<HullSet>* out_sets) {
  if (out_sets == nullptr) {
    return;
  }
  for (std::size_t i = 0; i + 2 < posts.size(); ++i) {
    const PlacedPost& a = posts[i];
    const PlacedPost& b = posts[i + 1];
    const PlacedPost& c = posts[i + 2];
    if (a == b || b == c || a == c) {
      continue;
    }
    out_sets->push_back({component, {a, b, c}, false});
  }
}

Vec3d wall_locate1(const ShapeParameters& p, double dx, double dy) {
  return {dx * p.wall_thickness, dy * p.wall_thickness, 0.0};
}

Vec3d wall_locate2(const ShapeParameters& p, double dx, double dy) {
  return {dx * p.wall_xy_offset, dy * p.wall_xy_offset, p.wall_z_offset};
}

Vec3d wall_locate3(const ShapeParameters& p, double dx, double dy) {
  const double reach = p.wall_xy_offset + p.wall_thickness;
  return {dx * reach, dy * reach, p.wall_z_offset};
}

std::string_view to_string(WallSideKind kind) {
  switch (kind) {
    case WallSideKind::kBack:
      return "back";
    case WallSideKind::kRight:
      return "right";
    case WallSideKind::kFront:
      return "front";
    case WallSideKind::kThumb:
      return "thumb";
    case WallSideKind::kLeft:
      return "left";
  }
  return "unknown";
}

std::vector<WallBrace> trace_perimeter(const std::vector<WallSide>& sides) {
  std::vector<WallBrace> braces;
  for (std::size_t i = 0; i < sides.size(); ++i) {
    const WallSide& side = sides[i];
    for (std::size_t s = 0; s + 1 < side.segments.size(); ++s) {
      braces.push_back({side.segments[s], side.segments[s + 1], BraceKind::kWall, side.kind});
    }

    // Joint to the first non-empty side after this one.
    if (side.segments.empty()) {
      continue;
    }
    for (std::size_t step = 1; step <= sides.size(); ++step) {
      const WallSide& next = sides[(i + step) % sides.size()];
      if (next.segments.empty()) {
        continue;
      }
      braces.push_back({side.segments.back(), next.segments.front(), side.joint_to_next, side.kind});
      break;
    }
  }
  return braces;
}

std::vector<HullSet> brace_hull_sets(const ShapeParameters& p, const WallBrace& brace) {
  const auto lip = [&](const WallSegment& segment, int level) {
    Vec3d shift{};
    if (level == 1) {
      shift = wall_locate1(p, segment.dx, segment.dy);
    } else if (level == 2) {
      shift = wall_locate2(p, segment.dx, segment.dy);
    } else if (level == 3) {
      shift = wall_locate3(p, segment.dx, segment.dy);
    }
    return PlacedPost{segment.placement, segment.post, shift};
  };

  std::vector<HullSet> sets;
  if (brace.kind == BraceKind::kFloorJoin) {
    sets.push_back({MeshComponent::kWall,
                    {lip(brace.from, 0), lip(brace.from, 1), lip(brace.from, 2), lip(brace.from, 3),
                     lip(brace.to, 1), lip(brace.to, 2), lip(brace.to, 3)},
                    true});
    return sets;
  }

  sets.push_back({MeshComponent::kWall,
                  {lip(brace.from, 0), lip(brace.from, 1), lip(brace.from, 2), lip(brace.from, 3),
                   lip(brace.to, 0), lip(brace.to, 1), lip(brace.to, 2), lip(brace.to, 3)},
                  false});
  sets.push_back({MeshComponent::kWall,
                  {lip(brace.from, 2), lip(brace.from, 3), lip(brace.to, 2), lip(brace.to, 3)},
                  true});
  return sets;
}

std::string describe(const WallSegment& segment) { return describe(segment_post(segment)); }

bool has_three_non_collinear(const std::vector<Vec3d>& points, double tolerance) {
  if (points.size() < 3) {
    return false;
  }
  const Vec3d& a = points.front();
  std::size_t far_index = 0;
  double far_distance = 0.0;
  for (std::size_t i = 1; i < points.size(); ++i) {
    const double d = length(points[i] - a);
    if (d > far_distance) {
      far_distance = d;
      far_index = i;
    }
  }
  if (far_distance <= tolerance) {
    return false;
  }
  const Vec3d axis = points[far_index] - a;
  for (const Vec3d& point : points) {
    // Distance from the a-b line.
    if (length(cross(axis, point - a)) / far_distance > tolerance) {
      return true;
    }
  }
  return false;
}

}  // namespace keyshell::core
