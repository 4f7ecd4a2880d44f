#pragma once
/**
 * @file errors.hpp
 * @brief Taxonomie des échecs par enregistrement.
 *
 * Toutes les erreurs du cœur sont locales à un enregistrement : le pipeline
 * les attrape, les étiquette par motif et continue le lot.
 *
 * - InvalidOptionKind    : type d’option inconnu (jamais traité comme Call/Put par défaut).
 * - DegenerateVolatility : sigma == 0 avec T > 0 (d1/d2 non définis).
 * - InvalidInput         : entrée non finie (ou spot/strike <= 0) reçue par une fonction pure.
 *
 * Le prix de marché nul n’est PAS une erreur : il produit une erreur en
 * pourcentage "indéfinie" (voir metrics/error_metrics.hpp).
 */

#include <cstddef>
#include <stdexcept>
#include <string>

namespace bsa {
namespace core {

/// @brief Motif d’échec d’un enregistrement.
enum class FailureReason {
  InvalidOptionKind,
  DegenerateVolatility,
  InvalidInput
};

/// @brief Nombre de motifs (taille des tableaux de compteurs).
inline constexpr std::size_t kFailureReasonCount = 3;

const char* to_string(FailureReason reason) noexcept;

/// @brief Base commune : porte le motif pour le comptage par le pipeline.
class PricingError : public std::invalid_argument {
public:
  PricingError(FailureReason reason, const std::string& what)
      : std::invalid_argument(what), reason_(reason) {}

  FailureReason reason() const noexcept { return reason_; }

private:
  FailureReason reason_;
};

class InvalidOptionKind : public PricingError {
public:
  explicit InvalidOptionKind(const std::string& what)
      : PricingError(FailureReason::InvalidOptionKind, what) {}
};

class DegenerateVolatility : public PricingError {
public:
  explicit DegenerateVolatility(const std::string& what)
      : PricingError(FailureReason::DegenerateVolatility, what) {}
};

class InvalidInput : public PricingError {
public:
  explicit InvalidInput(const std::string& what)
      : PricingError(FailureReason::InvalidInput, what) {}
};

} // namespace core
} // namespace bsa
