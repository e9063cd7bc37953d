#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "keyshell/core/keyboard_model.hpp"
#include "keyshell/core/parameters.hpp"
#include "keyshell/core/result.hpp"
#include "keyshell/core/types.hpp"

namespace keyshell::core {

struct GeneratorConfig {
  ShapeParameters params = MakeDefaultShapeParameters();
  BuildOptions build{};
  std::string output_dir = "things";
  std::string log_level = "info";
  bool validate_only = false;
  bool show_help = false;
  std::string usage{};  // filled when show_help is set
};

// Defaults, then the --config parameter file, then command-line overrides.
[[nodiscard]] GenerateResult<GeneratorConfig> LoadGeneratorConfig(int argc, const char* const argv[]);

// Parameter file text applied over the defaults.
[[nodiscard]] GenerateResult<ShapeParameters> LoadShapeParameters(const std::string& ini_text);

// "a,b,c" lists. Whitespace around entries is ignored.
bool parse_number_list(std::string_view text, std::vector<double>* out_values, std::string* error_message);
bool parse_vector(std::string_view text, Vec3d* out_vector, std::string* error_message);
// "x,y,z;x,y,z;..."
bool parse_vector_list(std::string_view text, std::vector<Vec3d>* out_vectors, std::string* error_message);

}  // namespace keyshell::core
