#pragma once

#include <string>
#include <utility>
#include <vector>

#include "arx/common/diagnostic.hpp"

namespace arx {

// Collects non-fatal diagnostics in reporting order. Not thread-safe.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kHostError) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Warning(std::string msg) {
    Report(Diagnostic::Warning(std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  auto TakeDiagnostics() -> std::vector<Diagnostic> {
    has_errors_ = false;
    return std::exchange(diagnostics_, {});
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace arx
