#pragma once
/**
 * @file accuracy.hpp
 * @brief Précision du modèle Black–Scholes contre les prix de marché.
 *
 * # Pipeline
 * cotations → evaluate() (prix BS + écart, un EvaluatedRow par cotation)
 *           → summarize() (statistiques globales, par Call, par Put).
 *
 * # Comptage
 * - Chaque cotation compte dans count_total et dans le compteur de son type,
 *   y compris quand le pricing échoue ou que l’erreur en % est indéfinie.
 * - Les statistiques (moyenne / médiane / écart-type) n’utilisent que les
 *   échantillons définis ; un ensemble vide ⇒ statistique indéfinie (nullopt).
 * - Un échec de pricing est étiqueté par motif (core::FailureReason), il
 *   n’interrompt jamais le lot.
 *
 * # Déterminisme
 * Sommation dans l’ordre d’entrée : deux appels sur la même séquence donnent
 * des résultats identiques au bit près. Les variantes *_parallel découpent
 * en blocs contigus fusionnés dans l’ordre des blocs.
 */

#include <bsa/core/errors.hpp>
#include <bsa/core/stats.hpp>
#include <bsa/market/quote.hpp>
#include <bsa/metrics/error_metrics.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bsa::qc {

/// Échantillon d’erreur accompagné du type de l’option.
struct KindedSample {
  metrics::ErrorSample sample;
  market::OptionKind kind{market::OptionKind::Call};
};

/// Résultat par cotation : prix théorique + écart, ou motif d’échec.
struct EvaluatedRow {
  market::OptionQuote quote{};
  std::optional<double> theoretical_price;
  std::optional<metrics::ErrorSample> sample;
  std::optional<core::FailureReason> failure;
  std::string failure_message;

  bool ok() const noexcept { return sample.has_value(); }
};

struct SubsetSummary {
  std::size_t count{0};         // enregistrements du sous-ensemble (tous statuts)
  std::size_t count_defined{0}; // erreurs en % définies
  std::size_t count_failed{0};  // échecs de pricing
  std::optional<double> mean_absolute_pct_error;
  std::optional<double> median_absolute_pct_error;
  std::optional<double> stddev_signed_pct_error; // n-1, nécessite 2 échantillons
  std::optional<double> mean_signed_pct_error;

  std::size_t count_undefined() const noexcept {
    return count - count_defined - count_failed;
  }
};

struct AccuracySummary {
  std::size_t count_total{0};
  std::size_t count_succeeded{0};
  std::array<std::size_t, core::kFailureReasonCount> failures{};
  SubsetSummary overall;
  SubsetSummary call;
  SubsetSummary put;

  std::size_t count_defined() const noexcept { return overall.count_defined; }
  std::size_t count_undefined() const noexcept { return count_succeeded - overall.count_defined; }
  std::size_t count_failed() const noexcept { return count_total - count_succeeded; }
  std::size_t failures_for(core::FailureReason reason) const noexcept;

  std::size_t count_by_kind(market::OptionKind kind) const;
  const SubsetSummary& by_kind(market::OptionKind kind) const;
};

/**
 * @brief Réduction incrémentale, fusionnable.
 *
 * Garde par sous-ensemble deux RunningStats (erreur signée en %, erreur
 * absolue en %) et la liste des erreurs absolues pour la médiane exacte.
 */
class AccuracyAccumulator {
public:
  /// @throws core::InvalidOptionKind si `kind` est hors énumération (rien n’est compté).
  void add(const metrics::ErrorSample& sample, market::OptionKind kind);

  /// @brief Compte un échec. `kind` absent (type illisible) ⇒ total seulement.
  void add_failure(core::FailureReason reason,
                   std::optional<market::OptionKind> kind = std::nullopt);

  void add(const EvaluatedRow& row);

  /// @brief Ajoute les comptes et statistiques de `other` après les siens.
  void merge(const AccuracyAccumulator& other);

  AccuracySummary summary() const;

private:
  struct Subset {
    std::size_t count{0};
    std::size_t failed{0};
    core::RunningStats signed_pct;
    core::RunningStats abs_pct;
    std::vector<double> abs_values;

    void add(const metrics::ErrorSample& sample);
    void merge(const Subset& other);
    SubsetSummary summary() const;
  };

  Subset& subset(market::OptionKind kind);

  std::size_t total_{0};
  std::size_t succeeded_{0};
  std::array<std::size_t, core::kFailureReasonCount> failures_{};
  Subset overall_;
  Subset call_;
  Subset put_;
};

/// @brief Prix + écart pour une cotation ; les PricingError deviennent un motif d’échec.
EvaluatedRow evaluate_one(const market::OptionQuote& quote);

/// @brief Un EvaluatedRow par cotation, dans l’ordre d’entrée.
std::vector<EvaluatedRow> evaluate(const std::vector<market::OptionQuote>& quotes);

/// @brief Comme evaluate(), réparti sur `n_threads` blocs contigus (<= 1 ⇒ séquentiel).
std::vector<EvaluatedRow> evaluate_parallel(const std::vector<market::OptionQuote>& quotes,
                                            std::size_t n_threads);

/// @brief Statistiques sur des échantillons déjà calculés.
AccuracySummary summarize(const std::vector<KindedSample>& samples);

/// @brief Statistiques sur un lot évalué (échecs inclus dans les comptes).
AccuracySummary summarize(const std::vector<EvaluatedRow>& rows);

/// @brief Comme summarize(rows), accumulateurs par bloc fusionnés dans l’ordre.
AccuracySummary summarize_parallel(const std::vector<EvaluatedRow>& rows,
                                   std::size_t n_threads);

} // namespace bsa::qc
