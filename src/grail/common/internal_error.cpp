#include "grail/common/internal_error.hpp"

namespace grail::common {

auto ToString(FaultKind kind) -> const char* {
  switch (kind) {
    case FaultKind::kMalformedIr:
      return "malformed IR";
    case FaultKind::kInvariantViolation:
      return "invariant violation";
  }
  return "unknown fault";
}

}  // namespace grail::common
