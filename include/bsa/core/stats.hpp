#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateurs statistiques en streaming (Welford) + médiane + IC 95 %.
 *
 * - Algorithme de Welford : stable numériquement, une passe.
 * - Variance : échantillon (diviseur n-1).
 * - Fusion (Chan et al.) : deux accumulateurs partiels se combinent de façon
 *   associative, ce qui permet de réduire des lots traités par plusieurs workers.
 * - Comportement aux petits n :
 *   - n == 0 : mean()=NaN, variance()=NaN, std_error()=NaN.
 *   - n == 1 : variance()=NaN (pas de dispersion estimable), std_error()=NaN.
 *   Les appelants qui exposent ces valeurs doivent les étiqueter "indéfinies".
 */

#include <cstddef> // std::size_t
#include <vector>

namespace bsa {
namespace core {

struct RunningStats {
public:
  /// @brief Initialise les accumulateurs (n=0, mean=0, M2=0).
  RunningStats() noexcept;

  /// @brief Ajoute un échantillon.
  void add(double x) noexcept;

  /// @brief Fusionne un accumulateur partiel (même résultat que des add() successifs,
  ///        aux arrondis près).
  void merge(const RunningStats& other) noexcept;

  /// @return Nombre d’échantillons vus.
  std::size_t count() const noexcept;

  /// @return Moyenne courante (NaN si n == 0).
  double mean() const noexcept;

  /// @return Variance d'échantillon (diviseur n-1).
  /// @note Si n < 2, retourne NaN.
  [[nodiscard]] double variance() const noexcept;

  /// @return Écart-type d'échantillon : sqrt(variance()).
  [[nodiscard]] double stddev() const noexcept;

  /// @return Erreur standard de la moyenne : sqrt(variance / n).
  [[nodiscard]] double std_error() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0}; // somme des carrés des écarts à la moyenne (Welford)
};

/// @brief Médiane (élément central, ou moyenne des deux centraux si n pair).
/// @return NaN si `values` est vide.
[[nodiscard]] double median(std::vector<double> values);

/// @brief Intervalle de confiance 95 % pour la moyenne (approx. normale).
struct ConfidenceInterval {
  double low;
  double high;
};

/// @brief Calcule mean ± z * std_error (z ≈ 1.9599639845).
[[nodiscard]] ConfidenceInterval confidence_interval_95(double mean,
                                                        double std_error) noexcept;

} // namespace core
} // namespace bsa
