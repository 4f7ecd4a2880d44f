#include <bsa/core/errors.hpp>

namespace bsa {
namespace core {

const char* to_string(FailureReason reason) noexcept {
  switch (reason) {
    case FailureReason::InvalidOptionKind:    return "invalid-option-kind";
    case FailureReason::DegenerateVolatility: return "degenerate-volatility";
    case FailureReason::InvalidInput:         return "invalid-input";
  }
  return "unknown";
}

} // namespace core
} // namespace bsa
