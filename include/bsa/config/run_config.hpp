#pragma once
/**
 * @file run_config.hpp
 * @brief Configuration d’un run de validation (modèle à paramètres constants).
 *
 * # Contenu
 * - rate       : taux sans risque appliqué à toutes les lignes (défaut 6.85 %).
 * - volatility : volatilité historique appliquée à toutes les lignes (défaut 14.5 %).
 * - day_count  : base de conversion jours → années (T = jours / day_count).
 * - n_threads  : nombre de blocs pour evaluate/summarize (1 = séquentiel).
 * - show_rows  : affiche le détail ligne par ligne.
 * - residuals_path : export CSV des résidus si non vide.
 *
 * Une colonne rate / volatility présente dans le CSV remplace la constante
 * pour la ligne concernée.
 */

#include <cstddef> // std::size_t
#include <string>
#include <utility> // std::move

namespace bsa {
namespace config {

/// @brief Configuration d’un run de validation.
struct RunConfig {
  double      rate;           ///< Taux sans risque (décimal).
  double      volatility;     ///< Volatilité annualisée (décimal).
  double      day_count;      ///< Jours par an pour T.
  std::size_t n_threads;      ///< Blocs parallèles (1 = séquentiel).
  bool        show_rows;      ///< Détail par ligne.
  std::string residuals_path; ///< Export des résidus (vide = pas d’export).

  /// @brief Construit une configuration avec valeurs par défaut.
  RunConfig(double rate = 0.0685,
            double volatility = 0.1450,
            double day_count = 365.0,
            std::size_t n_threads = 1,
            bool show_rows = false,
            std::string residuals_path = std::string())
      : rate(rate),
        volatility(volatility),
        day_count(day_count),
        n_threads(n_threads),
        show_rows(show_rows),
        residuals_path(std::move(residuals_path)) {}
};

} // namespace config
} // namespace bsa
