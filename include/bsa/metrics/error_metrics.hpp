#pragma once
/**
 * @file error_metrics.hpp
 * @brief Écart modèle / marché pour un enregistrement.
 *
 * - signed_error              = théorique - observé
 * - percentage_error          = signed_error / observé * 100, indéfini si observé == 0
 * - absolute_percentage_error = |percentage_error|, indéfini avec lui
 *
 * "Indéfini" = std::nullopt : jamais +inf, jamais 0, et l’échantillon reste
 * compté dans les totaux (voir qc/accuracy.hpp).
 */

#include <optional>

namespace bsa {
namespace metrics {

struct ErrorSample {
  double signed_error{0.0};
  std::optional<double> percentage_error;
  std::optional<double> absolute_percentage_error;

  bool defined() const noexcept { return percentage_error.has_value(); }
};

/// @throws bsa::core::InvalidInput si `theoretical` ou `observed` n’est pas fini.
ErrorSample compute_error(double theoretical, double observed);

} // namespace metrics
} // namespace bsa
