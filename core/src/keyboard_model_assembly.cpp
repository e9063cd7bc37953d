#include "keyshell/core/keyboard_model.hpp"

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace keyshell::core {

namespace {

constexpr double kSaDoubleLength = 37.5;

// Region covering the controller holder, for the integration test pieces.
Shape unit_test_space() { return translate({-78.0, 60.0, 0.0}, Shape::Cube({150.0, 120.0, 40.0})); }

Shape mirror_to_left(const Shape& shape) { return mirror({-1.0, 0.0, 0.0}, shape); }

}  // namespace

Accessories KeyboardModel::accessories() const { return BuildAccessories(curvature_); }

Shape KeyboardModel::BuildCaseShell() const { return BuildCaseShell(accessories()); }

Shape KeyboardModel::BuildBasePlate() const { return BuildBasePlate(accessories()); }

Shape KeyboardModel::BuildCaseShell(const Accessories& parts) const {
  const Shape walls = difference(
      union_of({BuildWalls(), parts.screw_inserts.outers, parts.controller.retainer}),
      {parts.control_switches, parts.screw_inserts.holes, parts.controller.usb_cutout});

  const Shape body = union_of({BuildKeyHoles(), BuildConnectors(), BuildThumb(), walls});
  // Everything below the floor plane is cut flat.
  const Shape below_floor = translate({0.0, 0.0, -20.0}, Shape::Cube({350.0, 350.0, 40.0}));
  return difference(body, {thumb_2u_layout(parts.stabilizer_cutout_2u), below_floor});
}

Shape KeyboardModel::BuildBasePlate(const Accessories& parts) const {
  const double thickness = params_.base_plate_thickness;
  const Profile footprint = project(union_of({
      BuildKeyHoles(),
      BuildConnectors(),
      BuildThumb(),
      BuildWalls(),
      BuildKeyFills(),
      parts.screw_inserts.outers,
      parts.palm_rest.body,
  }));
  const Shape plate = difference(linear_extrude(thickness, false, footprint),
                                 {BuildPlateScrewHoles(curvature_, parts.palm_rest, thickness)});
  return union_of({plate, translate({0.0, 0.0, thickness}, parts.controller.holder)});
}

GenerateResult<std::vector<KeyboardArtifact>> KeyboardModel::BuildArtifacts(const BuildOptions& options) const {
  GenerateResult<std::vector<KeyboardArtifact>> result;
  result.validation = ValidateMesh();
  for (const ValidationIssue& issue : result.validation.issues) {
    if (issue.severity == ValidationSeverity::kWarning) {
      spdlog::warn("{}: {}", issue.code, issue.message);
    }
  }
  if (result.validation.has_errors()) {
    result.error = result.validation.error_summary();
    return result;
  }

  const Accessories parts = accessories();
  const Shape shell = BuildCaseShell(parts);
  const Shape plate = BuildBasePlate(parts);

  std::vector<KeyboardArtifact>& artifacts = result.value;
  artifacts.push_back({"right", shell});
  artifacts.push_back({"right-plate", plate});
  if (options.include_left) {
    artifacts.push_back({"left", mirror_to_left(shell)});
    artifacts.push_back({"left-plate", mirror_to_left(plate)});
  }

  if (options.include_test_pieces) {
    const double web = params_.web_thickness;
    const Shape test_plate = translate({0.0, 0.0, params_.switch_hole.plate_thickness - web / 2.0},
                                       Shape::Cube({mount_width(params_), kSaDoubleLength, web}));
    artifacts.push_back(
        {"stabilizer-unit-test",
         difference(union_of({plate_2u(), translate({mount_width(params_), 0.0, 0.0}, test_plate),
                              translate({-mount_width(params_), 0.0, 0.0}, test_plate)}),
                    {parts.stabilizer_cutout_2u})});

    const std::vector<Vec2d>& palm_screws = parts.palm_rest.screw_positions;
    if (palm_screws.size() > 1) {
      const Vec3d screw{palm_screws[1].x, palm_screws[1].y, 0.0};
      artifacts.push_back({"countersink-unit-test",
                           intersection({plate, translate(screw, Shape::Cube({12.0, 12.0, 12.0}))})});
    }

    artifacts.push_back({"nicenano-integration-test-plate",
                         intersection({translate({0.0, 0.0, -params_.base_plate_thickness}, plate),
                                       unit_test_space()})});
    artifacts.push_back({"nicenano-integration-test-wall", intersection({shell, unit_test_space()})});
  }

  spdlog::info("assembly: {} artifacts", artifacts.size());
  result.ok = true;
  return result;
}

}  // namespace keyshell::core
