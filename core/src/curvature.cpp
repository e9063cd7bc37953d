#include "keyshell/core/curvature.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace keyshell::core {

CurvatureModel::CurvatureModel(ShapeParameters params)
    : params_(std::move(params)),
      row_radius_(core::row_radius(params_)),
      column_radius_(core::column_radius(params_)),
      column_x_delta_(core::column_x_delta(params_)) {}

bool CurvatureModel::checked_pose(int column, int row, Pose* out_pose, std::string* error_message) const {
  const auto fail = [error_message](std::string message) {
    if (error_message != nullptr) {
      *error_message = std::move(message);
    }
    return false;
  };

  if (out_pose == nullptr) {
    return fail("curvature model: output pose is null");
  }
  if (column < 0) {
    return fail("curvature model: negative column " + std::to_string(column));
  }
  const auto index = static_cast<std::size_t>(column);
  if (index >= params_.column_offsets.size()) {
    return fail("curvature model: column " + std::to_string(column) + " outside column offset table (" +
                std::to_string(params_.column_offsets.size()) + " entries)");
  }
  if (params_.column_style == ColumnStyle::kFixed) {
    const std::size_t shortest =
        std::min({params_.fixed_angles.size(), params_.fixed_x.size(), params_.fixed_z.size()});
    if (index >= shortest) {
      return fail("curvature model: column " + std::to_string(column) + " outside fixed column table (" +
                  std::to_string(shortest) + " entries)");
    }
  }

  *out_pose = pose(column, row);
  return true;
}

}  // namespace keyshell::core
