#include "keyshell/core/stl_writer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace keyshell::core {

namespace {

constexpr std::size_t kHeaderSize = 80;
constexpr char kHeader[] = "keyshell";

using Vec3f = std::array<float, 3>;

Vec3f fetch_vertex(const manifold::MeshGL& mesh, std::uint32_t index) {
  const std::size_t offset = static_cast<std::size_t>(index) * mesh.numProp;
  return {mesh.vertProperties[offset + 0], mesh.vertProperties[offset + 1], mesh.vertProperties[offset + 2]};
}

Vec3f facet_normal(const Vec3f& a, const Vec3f& b, const Vec3f& c) {
  const Vec3f u{b[0] - a[0], b[1] - a[1], b[2] - a[2]};
  const Vec3f v{c[0] - a[0], c[1] - a[1], c[2] - a[2]};
  const Vec3f n{u[1] * v[2] - u[2] * v[1], u[2] * v[0] - u[0] * v[2], u[0] * v[1] - u[1] * v[0]};
  const float len = std::sqrt(n[0] * n[0] + n[1] * n[1] + n[2] * n[2]);
  if (len <= 0.0f) {
    return {0.0f, 0.0f, 0.0f};
  }
  return {n[0] / len, n[1] / len, n[2] / len};
}

void write_vec(std::ostream& out, const Vec3f& v) {
  out.write(reinterpret_cast<const char*>(v.data()), sizeof(float) * v.size());
}

void set_error(std::string* error_message, const std::string& message) {
  if (error_message != nullptr) {
    *error_message = message;
  }
}

}  // namespace

bool write_stl(std::ostream& out, const Shape& shape, std::string* error_message) {
  const std::string backend_error = shape.backend_error();
  if (!backend_error.empty()) {
    set_error(error_message, "mesh export: " + backend_error);
    return false;
  }
  const manifold::MeshGL mesh = shape.mesh();
  const auto triangles = static_cast<std::uint32_t>(mesh.NumTri());
  if (triangles == 0) {
    set_error(error_message, "mesh export: mesh is empty");
    return false;
  }

  std::array<char, kHeaderSize> header{};
  std::memcpy(header.data(), kHeader, std::min(header.size(), std::strlen(kHeader)));
  out.write(header.data(), header.size());
  out.write(reinterpret_cast<const char*>(&triangles), sizeof(triangles));

  for (std::uint32_t tri = 0; tri < triangles; ++tri) {
    const Vec3f a = fetch_vertex(mesh, mesh.triVerts[tri * 3 + 0]);
    const Vec3f b = fetch_vertex(mesh, mesh.triVerts[tri * 3 + 1]);
    const Vec3f c = fetch_vertex(mesh, mesh.triVerts[tri * 3 + 2]);
    write_vec(out, facet_normal(a, b, c));
    write_vec(out, a);
    write_vec(out, b);
    write_vec(out, c);
    const std::uint16_t attribute = 0;
    out.write(reinterpret_cast<const char*>(&attribute), sizeof(attribute));
  }

  if (!out) {
    set_error(error_message, "mesh export: write error");
    return false;
  }
  return true;
}

bool write_stl_file(const std::string& path, const Shape& shape, std::string* error_message) {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file) {
    set_error(error_message, "cannot open " + path + " for writing");
    return false;
  }
  if (!write_stl(file, shape, error_message)) {
    return false;
  }
  file.flush();
  if (!file) {
    set_error(error_message, "failed writing " + path);
    return false;
  }
  return true;
}

}  // namespace keyshell::core
