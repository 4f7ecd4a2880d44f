#pragma once
/**
 * @file quote.hpp
 * @brief Enregistrement d’une option européenne cotée (entrée du pipeline).
 *
 * # Contenu
 * - Type d’option : Call ou Put.
 * - Spot S, strike K (> 0), maturité résiduelle T en années (peut être <= 0).
 * - Taux r et volatilité sigma (décimal), appliqués à cet enregistrement.
 * - Prix observé sur le marché (peut valoir 0 dans des données brutes).
 *
 * # Convention
 * - T en années fractionnelles (jours / 365 par défaut).
 * - Les enregistrements sont produits par l’adaptateur CSV et ne sont
 *   jamais modifiés par le cœur de calcul.
 */

#include <optional>
#include <string>

namespace bsa {
namespace market {

/// @brief Type d’option vanille (Call ou Put).
enum class OptionKind {
  Call, ///< Droit d’acheter l’actif sous-jacent.
  Put   ///< Droit de vendre l’actif sous-jacent.
};

/// @brief "call" / "put".
const char* to_string(OptionKind kind) noexcept;

/// @brief Interprète un libellé (call|c|ce, put|p|pe), insensible à la casse.
/// @throws bsa::core::InvalidOptionKind si le libellé n’est pas reconnu.
OptionKind parse_option_kind(const std::string& label);

/// @brief Variante sans exception : std::nullopt si le libellé est inconnu.
std::optional<OptionKind> try_parse_option_kind(const std::string& label);

/// @brief Cotation d’une option européenne, immuable après construction.
struct OptionQuote {
  double spot;                 ///< Spot du sous-jacent (> 0).
  double strike;               ///< Strike (> 0).
  double time_to_expiry_years; ///< Maturité résiduelle (peut être <= 0).
  double rate;                 ///< Taux sans risque (décimal).
  double volatility;           ///< Volatilité annualisée (décimal).
  OptionKind kind;             ///< Call ou Put.
  double observed_price;       ///< Prix de marché observé.
};

} // namespace market
} // namespace bsa
