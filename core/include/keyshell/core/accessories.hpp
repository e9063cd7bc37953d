#pragma once

#include <vector>

#include "keyshell/core/curvature.hpp"
#include "keyshell/core/parameters.hpp"
#include "keyshell/core/shape.hpp"
#include "keyshell/core/types.hpp"

namespace keyshell::core {

constexpr double kMillimetersPerInch = 25.4;

// The 2u plate tightens the switch opening along its long side.
constexpr double kPlate2uKeyswitchHeightOffset = -0.2;

struct ScrewInsertShapes {
  Shape outers{};  // bosses unioned into the walls
  Shape holes{};   // heat-set insert holes
};

// nice!nano controller holder. The cut-out is subtracted from the walls, the
// retainer unioned into them, and the holder body sits on the base plate.
struct ControllerHolder {
  Shape holder{};
  Shape usb_cutout{};
  Shape retainer{};
};

struct PalmRest {
  Shape body{};
  std::vector<Vec2d> screw_positions{};
};

struct Accessories {
  ScrewInsertShapes screw_inserts{};
  ControllerHolder controller{};
  Shape control_switches{};
  Shape stabilizer_cutout_2u{};
  PalmRest palm_rest{};
};

// Where a screw insert lands: against the wall nearest its key address.
[[nodiscard]] Vec3d screw_insert_position(const CurvatureModel& model, const ScrewInsertSpec& spec);
[[nodiscard]] Shape screw_insert_shapes(const CurvatureModel& model, double bottom_radius, double top_radius,
                                        double height);
[[nodiscard]] ScrewInsertShapes BuildScrewInserts(const CurvatureModel& model);

// Position is the middle of the USB-C opening on the floor, orientation in
// degrees about z.
[[nodiscard]] ControllerHolder MakeControllerHolder(const Vec3d& position, double orientation_deg);
[[nodiscard]] Vec3d controller_reference(const CurvatureModel& model);
[[nodiscard]] ControllerHolder BuildControllerHolder(const CurvatureModel& model);

[[nodiscard]] Shape BuildControlSwitchHoles(const CurvatureModel& model);

// Cherry plate-mount stabilizer cut-out for a given wire spacing (2u, 2.25u
// and 2.75u share one design).
[[nodiscard]] Shape MakeStabilizerCutout(const ShapeParameters& p, double spacing);
[[nodiscard]] Shape stabilizer_cutout_2u(const ShapeParameters& p);

[[nodiscard]] PalmRest BuildPalmRest(double thickness);
[[nodiscard]] Shape BuildPlateScrewHoles(const CurvatureModel& model, const PalmRest& palm_rest,
                                         double plate_thickness);

[[nodiscard]] Accessories BuildAccessories(const CurvatureModel& model);

}  // namespace keyshell::core
