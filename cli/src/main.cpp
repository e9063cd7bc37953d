#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "keyshell/core/config_loader.hpp"
#include "keyshell/core/keyboard_model.hpp"
#include "keyshell/core/stl_writer.hpp"

namespace {

using keyshell::core::GeneratorConfig;
using keyshell::core::KeyboardArtifact;
using keyshell::core::KeyboardModel;

bool apply_log_level(const std::string& name) {
  static const std::vector<std::string> kLevels = {"trace", "debug", "info", "warn", "error", "off"};
  for (const std::string& level : kLevels) {
    if (level == name) {
      spdlog::set_level(spdlog::level::from_str(name));
      return true;
    }
  }
  return false;
}

void log_issues(const keyshell::core::ValidationResult& validation) {
  for (const auto& issue : validation.issues) {
    if (issue.severity == keyshell::core::ValidationSeverity::kError) {
      spdlog::error("{}: {}", issue.code, issue.message);
    }
  }
}

bool write_artifacts(const std::vector<KeyboardArtifact>& artifacts, const std::filesystem::path& output_dir) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    spdlog::error("cannot create {}: {}", output_dir.string(), ec.message());
    return false;
  }
  for (const KeyboardArtifact& artifact : artifacts) {
    const std::filesystem::path path = output_dir / (artifact.name + ".stl");
    std::string error;
    if (!keyshell::core::write_stl_file(path.string(), artifact.shape, &error)) {
      spdlog::error("{}", error);
      return false;
    }
    spdlog::info("wrote {} ({} triangles)", path.string(), artifact.shape.triangle_count());
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  const auto loaded = keyshell::core::LoadGeneratorConfig(argc, argv);
  if (!loaded.ok) {
    spdlog::error("{}", loaded.error);
    return 1;
  }
  const GeneratorConfig& config = loaded.value;
  if (config.show_help) {
    std::cout << config.usage << std::endl;
    return 0;
  }
  if (!apply_log_level(config.log_level)) {
    spdlog::error("unknown log level '{}'", config.log_level);
    return 1;
  }

  const auto created = KeyboardModel::Create(config.params);
  if (!created.ok) {
    log_issues(created.validation);
    spdlog::error("invalid shape parameters");
    return 1;
  }
  const KeyboardModel& model = created.value;

  const keyshell::core::MeshStats stats = model.mesh_stats();
  spdlog::info("{} keys, {} connector hulls, {} wall braces, web: {} vertices in {} solids", stats.key_count,
               stats.connector_sets, stats.wall_braces, stats.web_vertices, stats.web_islands);

  if (config.validate_only) {
    const keyshell::core::ValidationResult validation = model.ValidateMesh();
    for (const auto& issue : validation.issues) {
      if (issue.severity == keyshell::core::ValidationSeverity::kWarning) {
        spdlog::warn("{}: {}", issue.code, issue.message);
      }
    }
    log_issues(validation);
    if (validation.has_errors()) {
      return 1;
    }
    spdlog::info("mesh is consistent");
    return 0;
  }

  const auto artifacts = model.BuildArtifacts(config.build);
  if (!artifacts.ok) {
    log_issues(artifacts.validation);
    spdlog::error("generation failed");
    return 1;
  }
  return write_artifacts(artifacts.value, config.output_dir) ? 0 : 1;
}
