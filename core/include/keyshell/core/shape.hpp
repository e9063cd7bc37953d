#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <manifold/cross_section.h>
#include <manifold/manifold.h>

#include "keyshell/core/types.hpp"

namespace keyshell::core {

// Planar region on the XY plane. Produced by polygons and projections,
// consumed by extrusion.
class Profile {
 public:
  Profile() = default;
  explicit Profile(manifold::CrossSection section) : section_(std::move(section)) {}

  static Profile Polygon(const std::vector<Vec2d>& points);

  [[nodiscard]] bool empty() const { return !section_.has_value(); }
  [[nodiscard]] const std::optional<manifold::CrossSection>& section() const { return section_; }
  [[nodiscard]] double area() const;

 private:
  std::optional<manifold::CrossSection> section_{};
};

// Solid value of the CSG backend. Copies share the backend's lazily
// evaluated node; every operation returns a new value and never touches its
// inputs. A default-constructed shape is empty and drops out of booleans.
class Shape {
 public:
  Shape() = default;
  explicit Shape(manifold::Manifold solid) : solid_(std::move(solid)) {}

  static Shape Cube(const Vec3d& size, bool center = true);
  static Shape Cylinder(double radius_bottom, double radius_top, double height, int segments = 30,
                        bool center = true);

  [[nodiscard]] bool empty() const { return !solid_.has_value(); }
  [[nodiscard]] const std::optional<manifold::Manifold>& solid() const { return solid_; }

  // The queries below evaluate the expression. An empty shape has no
  // vertices, no components, zero volume and a zero box.
  [[nodiscard]] AABBd bounds() const;
  [[nodiscard]] std::size_t vertex_count() const;
  [[nodiscard]] std::size_t triangle_count() const;
  [[nodiscard]] std::size_t component_count() const;
  [[nodiscard]] double volume() const;
  [[nodiscard]] manifold::MeshGL mesh() const;

  // Empty when the backend evaluated the shape without error.
  [[nodiscard]] std::string backend_error() const;

 private:
  std::optional<manifold::Manifold> solid_{};
};

Shape translate(const Vec3d& offset, const Shape& shape);
Shape rotate(double angle, const Vec3d& axis, const Shape& shape);
Shape rotate_x(double angle, const Shape& shape);
Shape rotate_y(double angle, const Shape& shape);
Shape rotate_z(double angle, const Shape& shape);
Shape mirror(const Vec3d& normal, const Shape& shape);

// Empty operands are dropped; a union of nothing is the empty shape.
Shape union_of(const std::vector<Shape>& shapes);
Shape difference(const Shape& base, const std::vector<Shape>& cuts);
Shape intersection(const std::vector<Shape>& shapes);
Shape hull(const std::vector<Shape>& shapes);

Shape linear_extrude(double height, bool center, const Profile& profile);
// Outline of the shape seen from above.
Profile project(const Shape& shape);

// Cube with its corner at the origin.
inline Shape corner_cube(const Vec3d& size) { return Shape::Cube(size, false); }

}  // namespace keyshell::core
