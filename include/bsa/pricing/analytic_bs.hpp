#pragma once
/**
 * @file analytic_bs.hpp
 * @brief Formules fermées Black–Scholes (européennes, sans dividende).
 *
 * # Notations
 * d1 = [ ln(S/K) + (r + 0.5*sigma^2) T ] / (sigma * sqrt(T))
 * d2 = d1 - sigma * sqrt(T)
 *
 * Prix (valeurs au temps 0) :
 *   Call = S * N(d1) - K * e^{-rT} * N(d2)
 *   Put  = K * e^{-rT} * N(-d2) - S * N(-d1)
 *
 * # Cas limites
 * - T <= 0 : valeur intrinsèque max(S-K,0) / max(K-S,0), sans passer par d1/d2.
 * - sigma == 0 avec T > 0 : d1/d2 non définis ⇒ DegenerateVolatility.
 * - sigma * sqrt(T) nul par sous-dépassement ⇒ DegenerateVolatility.
 * - d1/d2 non finis (sigma^2 en dépassement, ...) ⇒ InvalidInput, jamais NaN/inf.
 * - sigma < 0 : non rejetée (la formule reste finie), à valider en amont si besoin.
 *
 * # Erreurs (bsa/core/errors.hpp)
 * - InvalidInput : argument non fini, S <= 0 ou K <= 0.
 * - InvalidOptionKind : valeur d’énumération hors {Call, Put}.
 *
 * Fonctions pures, sans état : appelables en parallèle sans synchronisation.
 */

#include <bsa/market/quote.hpp>

namespace bsa {
namespace pricing {

/// @brief CDF de la loi normale standard, 0.5 * erfc(-x / sqrt(2)).
double norm_cdf(double x) noexcept;

/// @brief Valeur intrinsèque (payoff immédiat).
/// @throws bsa::core::InvalidOptionKind si `kind` est hors énumération.
double intrinsic_value(double spot, double strike, market::OptionKind kind);

/**
 * @brief Prix Black–Scholes d’une option européenne.
 * @param spot       Spot (> 0)
 * @param strike     Strike (> 0)
 * @param T          Maturité résiduelle en années (<= 0 ⇒ valeur intrinsèque)
 * @param rate       Taux sans risque (décimal)
 * @param volatility Volatilité (décimal)
 * @param kind       Call ou Put
 * @return Prix théorique, fini.
 */
double price(double spot, double strike, double T, double rate, double volatility,
             market::OptionKind kind);

/// @brief Prix théorique d’une cotation (utilise son taux et sa volatilité).
double price(const market::OptionQuote& quote);

/**
 * @brief Écart de parité put–call.
 * @return gap = call - put - ( S - K * e^{-rT} ) (doit être ≈ 0)
 */
double put_call_parity_gap(double call, double put,
                           double spot, double strike, double rate, double T) noexcept;

} // namespace pricing
} // namespace bsa
