#include "keyshell/core/shape.hpp"

#include <utility>
#include <vector>

namespace keyshell::core {

namespace {

manifold::vec3 to_backend(const Vec3d& v) { return manifold::vec3(v.x, v.y, v.z); }

// Columns of the backend's affine matrix; the last column is the translation.
manifold::mat3x4 to_affine(const Mat3d& r) {
  return manifold::mat3x4(manifold::vec3(r.m[0][0], r.m[1][0], r.m[2][0]),
                          manifold::vec3(r.m[0][1], r.m[1][1], r.m[2][1]),
                          manifold::vec3(r.m[0][2], r.m[1][2], r.m[2][2]), manifold::vec3(0.0, 0.0, 0.0));
}

bool is_axis(const Vec3d& axis, double x, double y, double z) { return axis.x == x && axis.y == y && axis.z == z; }

std::vector<manifold::Manifold> solids_of(const std::vector<Shape>& shapes) {
  std::vector<manifold::Manifold> solids;
  solids.reserve(shapes.size());
  for (const Shape& shape : shapes) {
    if (!shape.empty()) {
      solids.push_back(*shape.solid());
    }
  }
  return solids;
}

const char* describe_error(manifold::Manifold::Error error) {
  switch (error) {
    case manifold::Manifold::Error::NoError:
      return "no error";
    case manifold::Manifold::Error::NonFiniteVertex:
      return "non-finite vertex";
    case manifold::Manifold::Error::NotManifold:
      return "not manifold";
    case manifold::Manifold::Error::VertexOutOfBounds:
      return "vertex out of bounds";
    case manifold::Manifold::Error::PropertiesWrongLength:
      return "properties wrong length";
    case manifold::Manifold::Error::MissingPositionProperties:
      return "missing position properties";
    case manifold::Manifold::Error::MergeVectorsDifferentLengths:
      return "merge vectors different lengths";
    case manifold::Manifold::Error::MergeIndexOutOfBounds:
      return "merge index out of bounds";
    case manifold::Manifold::Error::TransformWrongLength:
      return "transform wrong length";
    case manifold::Manifold::Error::RunIndexWrongLength:
      return "run index wrong length";
    case manifold::Manifold::Error::FaceIDWrongLength:
      return "face id wrong length";
    case manifold::Manifold::Error::InvalidConstruction:
      return "invalid construction";
    case manifold::Manifold::Error::ResultTooLarge:
      return "result too large";
  }
  return "unknown error";
}

}  // namespace

Profile Profile::Polygon(const std::vector<Vec2d>& points) {
  manifold::SimplePolygon contour;
  contour.reserve(points.size());
  for (const Vec2d& point : points) {
    contour.push_back(manifold::vec2(point.x, point.y));
  }
  // Either winding fills the outline.
  return Profile(manifold::CrossSection(contour, manifold::CrossSection::FillRule::NonZero));
}

double Profile::area() const { return section_.has_value() ? section_->Area() : 0.0; }

Shape Shape::Cube(const Vec3d& size, bool center) {
  return Shape(manifold::Manifold::Cube(to_backend(size), center));
}

Shape Shape::Cylinder(double radius_bottom, double radius_top, double height, int segments, bool center) {
  return Shape(manifold::Manifold::Cylinder(height, radius_bottom, radius_top, segments, center));
}

AABBd Shape::bounds() const {
  if (empty()) {
    return {};
  }
  const manifold::Box box = solid_->BoundingBox();
  return {{box.min.x, box.min.y, box.min.z}, {box.max.x, box.max.y, box.max.z}};
}

std::size_t Shape::vertex_count() const { return empty() ? 0 : solid_->NumVert(); }

std::size_t Shape::triangle_count() const { return empty() ? 0 : solid_->NumTri(); }

std::size_t Shape::component_count() const { return empty() ? 0 : solid_->Decompose().size(); }

double Shape::volume() const { return empty() ? 0.0 : solid_->Volume(); }

manifold::MeshGL Shape::mesh() const { return empty() ? manifold::MeshGL() : solid_->GetMeshGL(); }

std::string Shape::backend_error() const {
  if (empty()) {
    return {};
  }
  const manifold::Manifold::Error status = solid_->Status();
  if (status == manifold::Manifold::Error::NoError) {
    return {};
  }
  return describe_error(status);
}

Shape translate(const Vec3d& offset, const Shape& shape) {
  if (shape.empty()) {
    return {};
  }
  return Shape(shape.solid()->Translate(to_backend(offset)));
}

Shape rotate(double angle, const Vec3d& axis, const Shape& shape) {
  if (shape.empty()) {
    return {};
  }
  const manifold::Manifold& solid = *shape.solid();
  const double degrees = rad_to_deg(angle);
  if (is_axis(axis, 1.0, 0.0, 0.0)) {
    return Shape(solid.Rotate(degrees, 0.0, 0.0));
  }
  if (is_axis(axis, 0.0, 1.0, 0.0)) {
    return Shape(solid.Rotate(0.0, degrees, 0.0));
  }
  if (is_axis(axis, 0.0, 0.0, 1.0)) {
    return Shape(solid.Rotate(0.0, 0.0, degrees));
  }
  return Shape(solid.Transform(to_affine(rotation_about(axis, angle))));
}

Shape rotate_x(double angle, const Shape& shape) { return rotate(angle, {1.0, 0.0, 0.0}, shape); }

Shape rotate_y(double angle, const Shape& shape) { return rotate(angle, {0.0, 1.0, 0.0}, shape); }

Shape rotate_z(double angle, const Shape& shape) { return rotate(angle, {0.0, 0.0, 1.0}, shape); }

Shape mirror(const Vec3d& normal, const Shape& shape) {
  if (shape.empty()) {
    return {};
  }
  return Shape(shape.solid()->Mirror(to_backend(normal)));
}

Shape union_of(const std::vector<Shape>& shapes) {
  std::vector<manifold::Manifold> solids = solids_of(shapes);
  if (solids.empty()) {
    return {};
  }
  if (solids.size() == 1) {
    return Shape(std::move(solids.front()));
  }
  return Shape(manifold::Manifold::BatchBoolean(solids, manifold::OpType::Add));
}

Shape difference(const Shape& base, const std::vector<Shape>& cuts) {
  if (base.empty()) {
    return {};
  }
  std::vector<manifold::Manifold> solids = solids_of(cuts);
  if (solids.empty()) {
    return base;
  }
  solids.insert(solids.begin(), *base.solid());
  return Shape(manifold::Manifold::BatchBoolean(solids, manifold::OpType::Subtract));
}

Shape intersection(const std::vector<Shape>& shapes) {
  std::vector<manifold::Manifold> solids = solids_of(shapes);
  if (solids.empty() || solids.size() != shapes.size()) {
    // Intersecting with nothing is nothing.
    return {};
  }
  if (solids.size() == 1) {
    return Shape(std::move(solids.front()));
  }
  return Shape(manifold::Manifold::BatchBoolean(solids, manifold::OpType::Intersect));
}

Shape hull(const std::vector<Shape>& shapes) {
  const std::vector<manifold::Manifold> solids = solids_of(shapes);
  if (solids.empty()) {
    return {};
  }
  return Shape(manifold::Manifold::Hull(solids));
}

Shape linear_extrude(double height, bool center, const Profile& profile) {
  if (profile.empty()) {
    return {};
  }
  manifold::Manifold solid = manifold::Manifold::Extrude(profile.section()->ToPolygons(), height);
  if (center) {
    solid = solid.Translate(manifold::vec3(0.0, 0.0, -height / 2.0));
  }
  return Shape(std::move(solid));
}

Profile project(const Shape& shape) {
  if (shape.empty()) {
    return {};
  }
  // Projected outlines overlap; the positive fill rule merges them.
  return Profile(manifold::CrossSection(shape.solid()->Project(), manifold::CrossSection::FillRule::Positive));
}

}  // namespace keyshell::core
