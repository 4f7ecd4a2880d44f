#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "bsa/config/run_config.hpp"
#include "bsa/market/quote.hpp"
#include "bsa/qc/accuracy.hpp"

namespace bsa::io {

// Ligne validée d'une chaîne d'options historique.
struct OptionRow {
  std::string date;    // date de cotation, telle que lue
  std::string expiry;  // date d'échéance, telle que lue
  market::OptionQuote quote{};
};

// Nombre de jours depuis 1970-01-01 pour YYYY-MM-DD, DD-MM-YYYY, DD/MM/YYYY
// ou DD-Mon-YYYY (25-Jan-2024). std::nullopt si la date est illisible.
std::optional<long> parse_date_days(const std::string& s);

// Lit un CSV d'options (colonnes type Date, Expiry_Date, Nifty_Close,
// Strike_Price, Option_Close, Option_Type ; synonymes acceptés).
// T = (échéance - date) / cfg.day_count ; rate/volatility issus de cfg sauf
// colonnes rate / volatility présentes dans le fichier.
// Ignore (et compte) les lignes incomplètes, dates illisibles, spot/strike <= 0,
// types d'option inconnus. Un prix de marché nul est conservé.
// Lève std::runtime_error si le fichier ne peut pas être ouvert.
std::vector<OptionRow>
read_options_csv(const std::string& path,
                 const config::RunConfig& cfg,
                 std::size_t* num_ignored = nullptr,
                 std::vector<std::string>* warnings = nullptr);

// Extrait les cotations seules (ordre conservé).
std::vector<market::OptionQuote> quotes_of(const std::vector<OptionRow>& rows);

// Export des résidus ligne à ligne (rows et evaluated alignés 1:1).
// Lève std::invalid_argument si les tailles diffèrent, std::runtime_error si
// le fichier ne peut pas être écrit.
void write_residuals_csv(const std::string& path,
                         const std::vector<OptionRow>& rows,
                         const std::vector<qc::EvaluatedRow>& evaluated);

} // namespace bsa::io
