#include "keyshell/core/result.hpp"

#include <utility>

namespace keyshell::core {

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

bool ValidationResult::has_issue(std::string_view code) const {
  for (const ValidationIssue& issue : issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

std::string ValidationResult::error_summary() const {
  std::string out;
  for (const ValidationIssue& issue : issues) {
    if (issue.severity != ValidationSeverity::kError) {
      continue;
    }
    if (!out.empty()) {
      out += "; ";
    }
    out += issue.message;
  }
  return out;
}

void ValidationResult::add_error(std::string code, std::string message) {
  issues.push_back({ValidationSeverity::kError, std::move(code), std::move(message)});
}

void ValidationResult::add_warning(std::string code, std::string message) {
  issues.push_back({ValidationSeverity::kWarning, std::move(code), std::move(message)});
}

void ValidationResult::append(const ValidationResult& other) {
  issues.insert(issues.end(), other.issues.begin(), other.issues.end());
}

}  // namespace keyshell::core
