#include <bsa/core/stats.hpp>

#include <algorithm> // std::nth_element
#include <cmath>     // std::sqrt
#include <limits>    // std::numeric_limits

namespace bsa {
namespace core {

// --- RunningStats -----------------------------------------------------------

RunningStats::RunningStats() noexcept = default;

void RunningStats::add(double x) noexcept {
  // Algorithme de Welford (stable numériquement, une passe)
  n_ += 1;
  const double delta  = x - mean_;
  mean_ += delta / static_cast<double>(n_);
  const double delta2 = x - mean_;
  m2_   += delta * delta2;
}

void RunningStats::merge(const RunningStats& other) noexcept {
  if (other.n_ == 0) return;
  if (n_ == 0) {
    *this = other;
    return;
  }
  const double na = static_cast<double>(n_);
  const double nb = static_cast<double>(other.n_);
  const double n  = na + nb;
  const double delta = other.mean_ - mean_;
  mean_ += delta * nb / n;
  m2_   += other.m2_ + delta * delta * na * nb / n;
  n_    += other.n_;
}

std::size_t RunningStats::count() const noexcept {
  return n_;
}

double RunningStats::mean() const noexcept {
  if (n_ == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return mean_;
}

double RunningStats::variance() const noexcept {
  if (n_ < 2) {
    return std::numeric_limits<double>::quiet_NaN(); // politique: indéfini si n<2
  }
  return m2_ / static_cast<double>(n_ - 1); // variance d'échantillon
}

double RunningStats::stddev() const noexcept {
  return std::sqrt(variance());
}

double RunningStats::std_error() const noexcept {
  if (n_ == 0) {
    return std::numeric_limits<double>::quiet_NaN(); // pas d'observations
  }
  const double var = variance(); // NaN si n<2, propagé
  return std::sqrt(var / static_cast<double>(n_));
}

// --- Médiane ------------------------------------------------------------------

double median(std::vector<double> values) {
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const std::size_t n   = values.size();
  const std::size_t mid = n / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  const double upper = values[mid];
  if (n % 2 == 1) {
    return upper;
  }
  // le plus grand élément de la moitié basse
  const double lower = *std::max_element(values.begin(), values.begin() + mid);
  return 0.5 * (lower + upper);
}

// --- Confidence interval 95% ------------------------------------------------

ConfidenceInterval confidence_interval_95(double mean, double std_error) noexcept {
  // z pour 95% bilatéral sous normale
  static constexpr double Z95 = 1.959963984540054;
  const double half = Z95 * std_error;
  return { mean - half, mean + half };
}

} // namespace core
} // namespace bsa
