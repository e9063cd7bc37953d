#include "keyshell/core/keyboard_model.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace keyshell::core {

namespace {

constexpr Corner kTL = Corner::kTopLeft;
constexpr Corner kTR = Corner::kTopRight;
constexpr Corner kBL = Corner::kBottomLeft;
constexpr Corner kBR = Corner::kBottomRight;

void append_sets(const std::vector<HullSet>& sets, std::vector<HullSet>* out) {
  out->insert(out->end(), sets.begin(), sets.end());
}

}  // namespace

std::vector<HullSet> KeyboardModel::matrix_connector_sets() const {
  const ShapeParameters& p = params_;
  const int io = inner_column_offset(p);
  std::vector<HullSet> sets;

  for (int column = io; column < p.ncols - 1; ++column) {
    for (int row = 0; row < last_row(p); ++row) {
      append_triangle_strip(MeshComponent::kMatrixRows,
                            {key_post(column + 1, row, kTL), key_post(column, row, kTR),
                             key_post(column + 1, row, kBL), key_post(column, row, kBR)},
                            &sets);
    }
  }

  for (int column = io; column < p.ncols; ++column) {
    for (int row = 0; row < corner_row(p); ++row) {
      append_triangle_strip(MeshComponent::kMatrixColumns,
                            {key_post(column, row, kBL), key_post(column, row, kBR),
                             key_post(column, row + 1, kTL), key_post(column, row + 1, kTR)},
                            &sets);
    }
  }

  for (int column = io; column < p.ncols - 1; ++column) {
    for (int row = 0; row < corner_row(p); ++row) {
      append_triangle_strip(MeshComponent::kMatrixDiagonals,
                            {key_post(column, row, kBR), key_post(column, row + 1, kTR),
                             key_post(column + 1, row, kBL), key_post(column + 1, row + 1, kTL)},
                            &sets);
    }
  }
  return sets;
}

std::vector<HullSet> KeyboardModel::inner_connector_sets() const {
  const ShapeParameters& p = params_;
  std::vector<HullSet> sets;
  if (!p.inner_column) {
    return sets;
  }

  const int inner_rows = p.nrows - 2;
  for (int row = 0; row < inner_rows; ++row) {
    append_triangle_strip(MeshComponent::kInnerColumn,
                          {key_post(1, row, kTL), key_post(0, row, kTR), key_post(1, row, kBL),
                           key_post(0, row, kBR)},
                          &sets);
  }
  for (int row = 0; row < corner_row(p) - 1; ++row) {
    append_triangle_strip(MeshComponent::kInnerColumn,
                          {key_post(0, row, kBL), key_post(0, row, kBR), key_post(0, row + 1, kTL),
                           key_post(0, row + 1, kTR)},
                          &sets);
  }
  // The last diagonal reaches the corner row under the inner column, which
  // the filler hulls close off.
  for (int row = 0; row < corner_row(p); ++row) {
    append_triangle_strip(MeshComponent::kInnerColumn,
                          {key_post(0, row, kBR), key_post(0, row + 1, kTR), key_post(1, row, kBL),
                           key_post(1, row + 1, kTL)},
                          &sets);
  }
  return sets;
}

std::vector<HullSet> KeyboardModel::extra_row_connector_sets() const {
  const ShapeParameters& p = params_;
  std::vector<HullSet> sets;
  if (!p.extra_row) {
    return sets;
  }

  const int io = inner_column_offset(p);
  const int cornerrow = corner_row(p);
  const int lastrow = last_row(p);
  for (int column = io + 2; column < p.ncols; ++column) {
    append_triangle_strip(MeshComponent::kExtraRow,
                          {key_post(column, cornerrow, kBL), key_post(column, cornerrow, kBR),
                           key_post(column, lastrow, kTL), key_post(column, lastrow, kTR)},
                          &sets);
  }
  for (int column = io + 2; column < p.ncols - 1; ++column) {
    append_triangle_strip(MeshComponent::kExtraRow,
                          {key_post(column, cornerrow, kBR), key_post(column, lastrow, kTR),
                           key_post(column + 1, cornerrow, kBL), key_post(column + 1, lastrow, kTL)},
                          &sets);
  }
  for (int column = io + 3; column < p.ncols - 1; ++column) {
    append_triangle_strip(MeshComponent::kExtraRow,
                          {key_post(column + 1, lastrow, kTL), key_post(column, lastrow, kTR),
                           key_post(column + 1, lastrow, kBL), key_post(column, lastrow, kBR)},
                          &sets);
  }
  return sets;
}

std::vector<HullSet> KeyboardModel::pinky_connector_sets() const {
  const ShapeParameters& p = params_;
  std::vector<HullSet> sets;
  if (!has_wide_pinky_rows(p)) {
    return sets;
  }

  const int lastcol = last_column(p);
  const int first = p.first_15u_row;
  const int last = p.last_15u_row;
  const bool closes_front = last == extra_corner_row(p);
  const bool closes_back = first == 0;
  const auto web = [&](int row, Corner corner) { return key_post(lastcol, row, corner); };
  const auto wide = [&](int row, Corner corner) { return key_post(lastcol, row, corner, PostStyle::kWide); };

  // Row direction: narrow and wide posts of the same mount.
  for (int row = first; row <= last; ++row) {
    append_triangle_strip(MeshComponent::kPinky, {web(row, kTR), wide(row, kTR), web(row, kBR), wide(row, kBR)},
                          &sets);
  }
  if (!closes_front) {
    append_triangle_strip(MeshComponent::kPinky, {web(last + 1, kTR), wide(last, kBR), web(last + 1, kBR)}, &sets);
  }
  if (!closes_back) {
    append_triangle_strip(MeshComponent::kPinky, {web(first - 1, kTR), wide(first, kTR), web(first - 1, kBR)},
                          &sets);
  }

  // Column direction: between wide mounts and into the narrow neighbours.
  for (int row = first; row < last; ++row) {
    append_triangle_strip(MeshComponent::kPinky,
                          {web(row, kBR), wide(row, kBR), web(row + 1, kTR), wide(row + 1, kTR)}, &sets);
  }
  if (!closes_front) {
    append_triangle_strip(MeshComponent::kPinky, {web(last, kBR), wide(last, kBR), web(last + 1, kTR)}, &sets);
  }
  if (!closes_back) {
    append_triangle_strip(MeshComponent::kPinky, {web(first - 1, kBR), wide(first, kTR), web(first, kTR)}, &sets);
  }
  return sets;
}

std::vector<HullSet> KeyboardModel::thumb_connector_sets() const {
  const ShapeParameters& p = params_;
  const int io = inner_column_offset(p);
  const int cornerrow = corner_row(p);
  const int lastrow = last_row(p);
  const auto thumb = [&](int index, Corner corner) { return thumb_post(index, corner); };
  const auto key = [&](int column, int row, Corner corner) { return key_post(column, row, corner); };
  std::vector<HullSet> sets;

  // First two.
  append_triangle_strip(MeshComponent::kThumbCluster,
                        {thumb(1, kTR), thumb(1, kBR), thumb(0, kTL), thumb(0, kBL)}, &sets);
  // Second thumb to the far two.
  append_triangle_strip(MeshComponent::kThumbCluster,
                        {thumb(3, kBR), thumb(3, kTR), thumb(1, kBL), thumb(1, kBL), thumb(1, kTL), thumb(3, kTR),
                         thumb(1, kTL), thumb(2, kBR), thumb(3, kTR), thumb(2, kBR), thumb(2, kTR), thumb(1, kTL),
                         thumb(1, kTL), thumb(2, kTR), thumb(3, kTR)},
                        &sets);
  // Far two.
  append_triangle_strip(MeshComponent::kThumbCluster,
                        {thumb(3, kTR), thumb(3, kTL), thumb(2, kBR), thumb(2, kBL)}, &sets);

  // Top of the cluster to the matrix, left to right.
  append_triangle_strip(MeshComponent::kThumbToMatrix,
                        {thumb(1, kTL), key(io, cornerrow, kBL), thumb(1, kTR), key(io, cornerrow, kBR),
                         thumb(0, kTL), key(io + 1, cornerrow, kBL), thumb(0, kTR), key(io + 1, cornerrow, kBR),
                         key(io + 2, lastrow, kTL), key(io + 2, lastrow, kBL), thumb(0, kTR),
                         key(io + 2, lastrow, kBL), thumb(0, kBR), key(io + 2, lastrow, kBR),
                         key(io + 3, lastrow, kBL), key(io + 2, lastrow, kTR), key(io + 3, lastrow, kTL),
                         key(io + 3, cornerrow, kBL), key(io + 3, lastrow, kTR), key(io + 3, cornerrow, kBR)},
                        &sets);
  append_triangle_strip(MeshComponent::kThumbToMatrix,
                        {key(io + 1, cornerrow, kBR), key(io + 2, lastrow, kTL), key(io + 2, cornerrow, kBL),
                         key(io + 2, lastrow, kTR), key(io + 2, cornerrow, kBR), key(io + 3, cornerrow, kBL)},
                        &sets);

  if (p.extra_row) {
    append_triangle_strip(MeshComponent::kThumbToMatrix,
                          {key(io + 3, lastrow, kTR), key(io + 3, lastrow, kBR), key(io + 4, lastrow, kTL),
                           key(io + 4, lastrow, kBL)},
                          &sets);
    append_triangle_strip(MeshComponent::kThumbToMatrix,
                          {key(io + 3, lastrow, kTR), key(io + 3, cornerrow, kBR), key(io + 4, lastrow, kTL),
                           key(io + 4, cornerrow, kBL)},
                          &sets);
  } else {
    append_triangle_strip(MeshComponent::kThumbToMatrix,
                          {key(io + 3, lastrow, kTR), key(io + 3, lastrow, kBR), key(io + 4, cornerrow, kBL)},
                          &sets);
    append_triangle_strip(MeshComponent::kThumbToMatrix,
                          {key(io + 3, lastrow, kTR), key(io + 3, cornerrow, kBR), key(io + 4, cornerrow, kBL)},
                          &sets);
  }
  return sets;
}

std::vector<HullSet> KeyboardModel::inner_filler_sets() const {
  const ShapeParameters& p = params_;
  std::vector<HullSet> sets;
  if (!p.inner_column) {
    return sets;
  }

  const int cornerrow = corner_row(p);
  const int wall_row = last_row(p) - inner_column_offset(p) - 1;
  PlacedPost wall_lip = key_post(0, wall_row, kBL);
  wall_lip.shift = wall_locate1(p, -1.0, 0.0);

  const auto add = [&](std::vector<PlacedPost> posts) {
    sets.push_back({MeshComponent::kInnerFiller, std::move(posts), false});
  };
  add({key_post(0, cornerrow - 1, kBL), key_post(0, cornerrow - 1, kBR), key_post(0, cornerrow, kTR)});
  add({key_post(0, cornerrow, kTR), key_post(1, cornerrow, kTL), key_post(1, cornerrow, kBL)});
  add({key_post(0, cornerrow - 1, kBL), key_post(0, cornerrow, kTR), key_post(1, cornerrow, kBL)});
  add({wall_lip, key_post(0, cornerrow - 1, kBL), key_post(1, cornerrow, kBL), thumb_post(1, kTL)});
  return sets;
}

std::vector<HullSet> KeyboardModel::ConnectorHullSets() const {
  std::vector<HullSet> sets;
  append_sets(matrix_connector_sets(), &sets);
  append_sets(inner_connector_sets(), &sets);
  append_sets(extra_row_connector_sets(), &sets);
  append_sets(pinky_connector_sets(), &sets);
  append_sets(thumb_connector_sets(), &sets);
  append_sets(inner_filler_sets(), &sets);
  return sets;
}

Shape KeyboardModel::BuildConnectors() const {
  const std::vector<HullSet> sets = ConnectorHullSets();
  std::vector<Shape> hulls;
  hulls.reserve(sets.size());
  for (const HullSet& set : sets) {
    hulls.push_back(hull_shape(set));
  }
  spdlog::debug("connector meshing: {} hull sets", sets.size());
  return union_of(hulls);
}

}  // namespace keyshell::core
