#include "keyshell/core/keyboard_model.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace keyshell::core {

namespace {

constexpr double kClosureTolerance = 1e-6;

WallSegment key_segment(int column, int row, double dx, double dy, Corner corner,
                        PostStyle style = PostStyle::kWeb) {
  return {Placement::Key(column, row), dx, dy, {corner, style}};
}

}  // namespace

std::vector<WallSide> KeyboardModel::wall_sides() const {
  const ShapeParameters& p = params_;
  const int io = inner_column_offset(p);
  const int lastcol = last_column(p);
  const int lastrow = last_row(p);
  const int extra_corner = extra_corner_row(p);
  const bool pinky = has_wide_pinky_rows(p);
  const int first = p.first_15u_row;
  const int last = p.last_15u_row;

  std::vector<WallSide> sides;

  WallSide back{WallSideKind::kBack, {}, BraceKind::kWall};
  for (int x = 0; x <= lastcol; ++x) {
    back.segments.push_back(key_segment(x, 0, 0.0, 1.0, Corner::kTopLeft));
    back.segments.push_back(key_segment(x, 0, 0.0, 1.0, Corner::kTopRight));
  }
  if (pinky && first == 0) {
    back.segments.push_back(key_segment(lastcol, 0, 0.0, 1.0, Corner::kTopRight, PostStyle::kWide));
  }
  sides.push_back(std::move(back));

  WallSide right{WallSideKind::kRight, {}, BraceKind::kWall};
  const auto right_post = [&](int row, Corner corner, PostStyle style = PostStyle::kWeb) {
    right.segments.push_back(key_segment(lastcol, row, 1.0, 0.0, corner, style));
  };
  if (pinky) {
    if (first > 0) {
      for (int y = 0; y < first - 1; ++y) {
        right_post(y, Corner::kTopRight);
        right_post(y, Corner::kBottomRight);
      }
      right_post(first - 1, Corner::kTopRight);
    }
    for (int y = first; y <= last; ++y) {
      right_post(y, Corner::kTopRight, PostStyle::kWide);
      right_post(y, Corner::kBottomRight, PostStyle::kWide);
    }
    if (last <= extra_corner - 1) {
      right_post(last + 1, Corner::kBottomRight);
      for (int y = last + 2; y <= extra_corner; ++y) {
        right_post(y, Corner::kTopRight);
        right_post(y, Corner::kBottomRight);
      }
    }
  } else {
    for (int y = 0; y <= extra_corner; ++y) {
      right_post(y, Corner::kTopRight);
      right_post(y, Corner::kBottomRight);
    }
  }
  sides.push_back(std::move(right));

  WallSide front{WallSideKind::kFront, {}, BraceKind::kWall};
  if (pinky && last == extra_corner) {
    front.segments.push_back(key_segment(lastcol, extra_corner, 0.0, -1.0, Corner::kBottomRight, PostStyle::kWide));
  }
  for (int x = lastcol; x >= io + 4; --x) {
    front.segments.push_back(key_segment(x, extra_corner, 0.0, -1.0, Corner::kBottomRight));
    front.segments.push_back(key_segment(x, extra_corner, 0.0, -1.0, Corner::kBottomLeft));
  }
  front.segments.push_back(key_segment(io + 3, lastrow, 0.0, -1.0, Corner::kBottomRight));
  front.segments.push_back(key_segment(io + 3, lastrow, 0.0, -1.0, Corner::kBottomLeft));
  sides.push_back(std::move(front));

  // Around the cluster, ending on the post that joins the left wall at the
  // floor. 2u keys brace from their thumb posts.
  const auto thumb_segment = [&](int index, double dx, double dy, Corner corner) {
    return WallSegment{Placement::Thumb(index), dx, dy, thumb_post(index, corner).post};
  };
  WallSide thumb{WallSideKind::kThumb, {}, BraceKind::kFloorJoin};
  thumb.segments = {
      thumb_segment(0, 0.0, -1.0, Corner::kBottomRight),
      thumb_segment(0, 0.0, -1.0, Corner::kBottomLeft),
      thumb_segment(1, 0.0, -1.0, Corner::kBottomRight),
      thumb_segment(1, 0.0, -1.0, Corner::kBottomLeft),
      thumb_segment(3, 0.0, -1.0, Corner::kBottomRight),
      thumb_segment(3, 0.0, -1.0, Corner::kBottomLeft),
      thumb_segment(3, -1.0, 0.0, Corner::kBottomLeft),
      thumb_segment(3, -1.0, 0.0, Corner::kTopLeft),
      thumb_segment(2, -1.0, 0.0, Corner::kBottomLeft),
      thumb_segment(2, -1.0, 0.0, Corner::kTopLeft),
      thumb_segment(2, 0.0, 1.0, Corner::kTopLeft),
      thumb_segment(2, 0.0, 1.0, Corner::kTopRight),
      thumb_segment(1, -1.0, 0.0, Corner::kTopLeft),
  };
  sides.push_back(std::move(thumb));

  WallSide left{WallSideKind::kLeft, {}, BraceKind::kWall};
  for (int y = lastrow - io - 1; y >= 0; --y) {
    left.segments.push_back(key_segment(0, y, -1.0, 0.0, Corner::kBottomLeft));
    left.segments.push_back(key_segment(0, y, -1.0, 0.0, Corner::kTopLeft));
  }
  sides.push_back(std::move(left));

  return sides;
}

std::vector<WallBrace> KeyboardModel::wall_braces() const { return trace_perimeter(wall_sides()); }

std::vector<HullSet> KeyboardModel::WallHullSets() const {
  std::vector<HullSet> sets;
  for (const WallBrace& brace : wall_braces()) {
    const std::vector<HullSet> brace_sets = brace_hull_sets(params_, brace);
    sets.insert(sets.end(), brace_sets.begin(), brace_sets.end());
  }
  return sets;
}

Shape KeyboardModel::BuildWalls() const {
  const std::vector<HullSet> sets = WallHullSets();
  std::vector<Shape> hulls;
  hulls.reserve(sets.size());
  for (const HullSet& set : sets) {
    hulls.push_back(hull_shape(set));
  }
  spdlog::debug("wall tracer: {} hull sets", sets.size());
  return union_of(hulls);
}

ValidationResult KeyboardModel::check_perimeter_closure(const std::vector<WallBrace>& braces) const {
  ValidationResult result;
  if (braces.empty()) {
    result.add_error("PerimeterOpen", "wall tracer: no wall braces");
    return result;
  }
  for (std::size_t i = 0; i < braces.size(); ++i) {
    const WallBrace& current = braces[i];
    const WallBrace& next = braces[(i + 1) % braces.size()];
    const Vec3d end = post_position(segment_post(current.to));
    const Vec3d start = post_position(segment_post(next.from));
    if (length(end - start) <= kClosureTolerance) {
      continue;
    }
    result.add_error("PerimeterOpen", "wall tracer: " + std::string(to_string(current.side)) + " wall ends at " +
                                          describe(current.to) + " but " + std::string(to_string(next.side)) +
                                          " wall starts at " + describe(next.from));
  }
  return result;
}

}  // namespace keyshell::core
