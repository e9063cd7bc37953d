#include "keyshell/core/parameters.hpp"

#include <cmath>
#include <string>

namespace keyshell::core {

std::string_view to_string(ColumnStyle style) {
  switch (style) {
    case ColumnStyle::kStandard:
      return "standard";
    case ColumnStyle::kOrthographic:
      return "orthographic";
    case ColumnStyle::kFixed:
      return "fixed";
  }
  return "unknown";
}

bool parse_column_style(std::string_view text, ColumnStyle* out_style) {
  if (out_style == nullptr) {
    return false;
  }
  if (text == "standard") {
    *out_style = ColumnStyle::kStandard;
  } else if (text == "orthographic") {
    *out_style = ColumnStyle::kOrthographic;
  } else if (text == "fixed") {
    *out_style = ColumnStyle::kFixed;
  } else {
    return false;
  }
  return true;
}

std::vector<Vec3d> default_column_offsets(bool inner_column, int ncols) {
  std::vector<Vec3d> offsets;
  for (int column = 0; column < ncols; ++column) {
    Vec3d offset{};
    if (inner_column) {
      if (column <= 1) {
        offset = {0.0, -2.0, 0.0};
      } else if (column == 3) {
        offset = {0.0, 2.82, -4.5};
      } else if (column >= 5) {
        offset = {0.0, -12.0, 5.64};
      }
    } else {
      if (column == 2) {
        offset = {0.0, 2.82, -4.5};
      } else if (column >= 4) {
        offset = {0.0, -12.0, 5.64};
      }
    }
    offsets.push_back(offset);
  }
  return offsets;
}

std::vector<ScrewInsertSpec> default_screw_inserts(int ncols, int nrows) {
  const int lastcol = ncols - 1;
  const int lastrow = nrows - 1;
  return {
      {lastcol, 0, {4.5, 5.0, 0.0}},
      {lastcol, lastrow, {7.5, 14.5, 0.0}},
      {0, lastrow, {3.0, -42.0, 0.0}},
      {0, 2, {4.0, -7.0, 0.0}},
      {0, 0, {7.0, 5.0, 0.0}},
  };
}

ShapeParameters MakeDefaultShapeParameters() {
  ShapeParameters params;
  params.centerrow = params.nrows - 3;
  params.column_offsets = default_column_offsets(params.inner_column, params.ncols);
  params.screw_inserts = default_screw_inserts(params.ncols, params.nrows);
  return params;
}

ValidationResult ValidateShapeParameters(const ShapeParameters& params) {
  ValidationResult result;

  const int io = inner_column_offset(params);
  if (params.nrows < 3 || params.ncols < io + 5) {
    result.add_error("MatrixTooSmall", "matrix layout: need at least 3 rows and " + std::to_string(io + 5) +
                                           " columns, got " + std::to_string(params.nrows) + "x" +
                                           std::to_string(params.ncols));
  }

  const double half_alpha = std::sin(params.alpha / 2.0);
  const double half_beta = std::sin(params.beta / 2.0);
  if (!std::isfinite(params.alpha) || !std::isfinite(params.beta) || std::abs(half_alpha) <= 1e-12 ||
      std::abs(half_beta) <= 1e-12) {
    result.add_error("DegenerateCurvature", "curvature model: alpha and beta must be finite and non-zero");
  }
  if (!std::isfinite(params.tenting_angle) || !std::isfinite(params.centerrow) || !std::isfinite(params.centercol)) {
    result.add_error("NonFiniteParameter", "curvature model: tenting angle and center row/column must be finite");
  }

  if (params.ncols > 0 && params.column_offsets.size() < static_cast<std::size_t>(params.ncols)) {
    result.add_error("ColumnOffsetTableTooShort", "curvature model: column offset table has " +
                                                      std::to_string(params.column_offsets.size()) +
                                                      " entries for " + std::to_string(params.ncols) + " columns");
  }

  if (params.column_style == ColumnStyle::kFixed && params.ncols > 0) {
    const auto check_table = [&](const std::vector<double>& table, const char* name) {
      if (table.size() < static_cast<std::size_t>(params.ncols)) {
        result.add_error("FixedColumnTableTooShort", std::string("curvature model: fixed ") + name + " table has " +
                                                         std::to_string(table.size()) + " entries for " +
                                                         std::to_string(params.ncols) + " columns");
      }
    };
    check_table(params.fixed_angles, "angle");
    check_table(params.fixed_x, "x");
    check_table(params.fixed_z, "z");
  }

  if (params.pinky_15u) {
    if (params.first_15u_row > params.last_15u_row) {
      result.add_warning("PinkyRangeEmpty", "pinky 1.5u row range is empty (first " +
                                                std::to_string(params.first_15u_row) + " > last " +
                                                std::to_string(params.last_15u_row) + "); using uniform right wall");
    } else if (params.first_15u_row < 0 || params.last_15u_row > extra_corner_row(params)) {
      result.add_warning("PinkyRangeOutOfBounds", "pinky 1.5u row range [" + std::to_string(params.first_15u_row) +
                                                      ", " + std::to_string(params.last_15u_row) +
                                                      "] is outside [0, " + std::to_string(extra_corner_row(params)) +
                                                      "]; using uniform right wall");
    }
  }

  if (params.wall_thickness <= 0.0) {
    result.add_warning("NonPositiveWallThickness", "wall tracer: wall thickness is not positive");
  }

  return result;
}

double row_radius(const ShapeParameters& p) {
  return (mount_height(p) + p.extra_height) / 2.0 / std::sin(p.alpha / 2.0) + cap_top_height(p);
}

double column_radius(const ShapeParameters& p) {
  return (mount_width(p) + p.extra_width) / 2.0 / std::sin(p.beta / 2.0) + cap_top_height(p);
}

double column_x_delta(const ShapeParameters& p) { return -1.0 - column_radius(p) * std::sin(p.beta); }

bool has_wide_pinky_rows(const ShapeParameters& p) {
  return p.pinky_15u && p.first_15u_row >= 0 && p.first_15u_row <= p.last_15u_row &&
         p.last_15u_row <= extra_corner_row(p);
}

bool is_wide_key(const ShapeParameters& p, int column, int row) {
  return has_wide_pinky_rows(p) && column == last_column(p) && row >= p.first_15u_row && row <= p.last_15u_row;
}

double wide_key_shift(const ShapeParameters& p, int column, int row) {
  return is_wide_key(p, column, row) ? p.wide_key_shift : 0.0;
}

bool is_inner_key(const ShapeParameters& p, int column, int row) {
  return p.inner_column && column == 0 && row >= 0 && row < p.nrows - 2;
}

bool is_key_present(const ShapeParameters& p, int column, int row) {
  if (row < 0 || row >= p.nrows || column < 0 || column >= p.ncols) {
    return false;
  }
  const int io = inner_column_offset(p);
  if (column < io) {
    return is_inner_key(p, column, row);
  }
  if (column == io + 2 || column == io + 3) {
    return true;
  }
  if (p.extra_row && (column == io + 4 || column == io + 5) && p.ncols == io + 6) {
    return true;
  }
  if (p.extra_row && column == io + 4 && p.ncols == io + 5) {
    return true;
  }
  return row != last_row(p);
}

std::vector<KeyAddress> enumerate_key_addresses(const ShapeParameters& p) {
  std::vector<KeyAddress> addresses;
  for (int column = 0; column < p.ncols; ++column) {
    for (int row = 0; row < p.nrows; ++row) {
      if (is_key_present(p, column, row)) {
        addresses.push_back({column, row});
      }
    }
  }
  return addresses;
}

}  // namespace keyshell::core
