#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace grail::common {

// Which contract a lowering fault broke.
enum class FaultKind {
  kMalformedIr,         // Input IR or metadata table violates an assumption
  kInvariantViolation,  // A pass produced output that fails its own invariant
};

auto ToString(FaultKind kind) -> const char*;

// Exception type for internal Grail errors (compiler bugs, not user errors).
// Never raised for problems in the user's query; those are reported earlier
// by the front end.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : InternalError(FaultKind::kMalformedIr, context, detail) {
  }

  InternalError(FaultKind kind, const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {} ({}): {}\n"
                "This is a bug in Grail or in the IR handed to it.",
                context, ToString(kind), detail)),
        kind_(kind),
        context_(context),
        detail_(detail) {
  }

  [[nodiscard]] auto Kind() const -> FaultKind {
    return kind_;
  }
  [[nodiscard]] auto Context() const -> const std::string& {
    return context_;
  }
  [[nodiscard]] auto Detail() const -> const std::string& {
    return detail_;
  }

 private:
  FaultKind kind_;
  std::string context_;
  std::string detail_;
};

// Helper function to throw internal error (marked [[noreturn]] for
// optimization)
[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(FaultKind::kMalformedIr, context, detail);
}

[[noreturn]] inline void ThrowInvariantViolation(
    const char* context, const std::string& detail) {
  throw InternalError(FaultKind::kInvariantViolation, context, detail);
}

}  // namespace grail::common
