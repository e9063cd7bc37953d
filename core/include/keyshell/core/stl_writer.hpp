#pragma once

#include <ostream>
#include <string>

#include "keyshell/core/shape.hpp"

namespace keyshell::core {

// Binary STL of the evaluated shape: 80-byte header, little-endian triangle
// count, then 50 bytes per triangle. Empty meshes and backend errors fail.
bool write_stl(std::ostream& out, const Shape& shape, std::string* error_message);

bool write_stl_file(const std::string& path, const Shape& shape, std::string* error_message);

}  // namespace keyshell::core
