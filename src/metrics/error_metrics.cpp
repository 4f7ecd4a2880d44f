#include <bsa/metrics/error_metrics.hpp>
#include <bsa/core/errors.hpp>

#include <cmath>

namespace bsa {
namespace metrics {

ErrorSample compute_error(double theoretical, double observed) {
  if (!std::isfinite(theoretical) || !std::isfinite(observed)) {
    throw core::InvalidInput("compute_error: theoretical and observed prices must be finite");
  }

  ErrorSample s;
  s.signed_error = theoretical - observed;
  if (observed != 0.0) {
    const double pct = s.signed_error / observed * 100.0;
    // un prix observé sous-normal peut faire déborder le quotient
    if (std::isfinite(pct)) {
      s.percentage_error          = pct;
      s.absolute_percentage_error = std::fabs(pct);
    }
  }
  return s;
}

} // namespace metrics
} // namespace bsa
