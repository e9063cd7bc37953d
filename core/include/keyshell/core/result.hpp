#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace keyshell::core {

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
  [[nodiscard]] bool has_issue(std::string_view code) const;
  // Error messages joined with "; ", in report order.
  [[nodiscard]] std::string error_summary() const;

  void add_error(std::string code, std::string message);
  void add_warning(std::string code, std::string message);
  void append(const ValidationResult& other);
};

template <typename TValue>
struct GenerateResult {
  bool ok = false;
  TValue value{};
  std::string error{};
  ValidationResult validation{};
};

}  // namespace keyshell::core
