#include "bsa/config/run_config.hpp"
#include "bsa/core/stats.hpp"
#include "bsa/io/options_csv.hpp"
#include "bsa/qc/accuracy.hpp"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

static void usage(const char* a){
  std::cerr << "Usage: " << a << " -f options.csv [--rate 0.0685] [--sigma 0.145]\n"
               "                 [--day-count 365] [--threads N] [--rows] [--out residuals.csv] [-w]\n"
               "  --rate / --sigma : paramètres constants (remplacés par les colonnes rate/volatility si présentes)\n"
               "  --day-count      : T = jours / day-count\n"
               "  --threads        : évaluation et agrégation par blocs parallèles\n"
               "  --rows           : détail ligne par ligne\n"
               "  --out            : export CSV des résidus\n"
               "  -w               : affiche les lignes ignorées par le lecteur CSV\n";
}

// strtod strict : la chaîne entière doit être un nombre fini
static bool parse_number(const char* s, double& out){
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0' || !std::isfinite(v)) return false;
  out = v;
  return true;
}

static std::string pct(const std::optional<double>& v){
  if (!v) return "undefined";
  std::ostringstream os; os.setf(std::ios::fixed); os.precision(2);
  os << *v << "%";
  return os.str();
}

static void print_subset(const char* label, const bsa::qc::SubsetSummary& s){
  std::cout << "  [" << label << "] n=" << s.count
            << "  defined=" << s.count_defined
            << "  undefined=" << s.count_undefined()
            << "  failed=" << s.count_failed << "\n"
            << "    Mean Absolute Error:    " << pct(s.mean_absolute_pct_error) << "\n"
            << "    Median Absolute Error:  " << pct(s.median_absolute_pct_error) << "\n"
            << "    Std Dev of Error:       " << pct(s.stddev_signed_pct_error) << "\n"
            << "    Mean Error:             " << pct(s.mean_signed_pct_error) << "\n";
}

int main(int argc, char** argv){
  std::string path;
  bool show_warnings = false;
  bsa::config::RunConfig cfg;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    double v = 0.0;
    if ((a=="-f"||a=="--file") && i+1<argc) path = argv[++i];
    else if (a=="--rate" && i+1<argc) {
      if (!parse_number(argv[++i], v)) { usage(argv[0]); return 1; }
      cfg.rate = v;
    }
    else if (a=="--sigma" && i+1<argc) {
      if (!parse_number(argv[++i], v)) { usage(argv[0]); return 1; }
      cfg.volatility = v;
    }
    else if (a=="--day-count" && i+1<argc) {
      if (!parse_number(argv[++i], v) || v <= 0.0) { usage(argv[0]); return 1; }
      cfg.day_count = v;
    }
    else if (a=="--threads" && i+1<argc) {
      if (!parse_number(argv[++i], v) || v < 1.0) { usage(argv[0]); return 1; }
      cfg.n_threads = static_cast<std::size_t>(v);
    }
    else if (a=="--rows") cfg.show_rows = true;
    else if (a=="--out" && i+1<argc) cfg.residuals_path = argv[++i];
    else if (a=="-w"||a=="--show-warnings") show_warnings = true;
    else if (a=="-h"||a=="--help"){ usage(argv[0]); return 0; }
    else if (path.empty()) path = a;
    else { usage(argv[0]); return 1; }
  }
  if (path.empty()) { usage(argv[0]); return 1; }

  if (cfg.volatility < 0.0)
    std::cerr << "[warn] volatilité négative (" << cfg.volatility << ") : non rejetée par le modèle\n";

  std::vector<bsa::io::OptionRow> rows;
  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  try { rows = bsa::io::read_options_csv(path, cfg, &ignored, &warnings); }
  catch (const std::exception& e){ std::cerr<<"error: "<<e.what()<<"\n"; return 2; }

  if (show_warnings) for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";

  std::vector<bsa::qc::EvaluatedRow> evaluated;
  bsa::qc::AccuracySummary summary;
  try {
    const auto quotes = bsa::io::quotes_of(rows);
    evaluated = bsa::qc::evaluate_parallel(quotes, cfg.n_threads);
    summary   = bsa::qc::summarize_parallel(evaluated, cfg.n_threads);
  } catch (const std::exception& e){ std::cerr<<"error: "<<e.what()<<"\n"; return 3; }

  std::cout.setf(std::ios::fixed); std::cout.precision(2);
  std::cout << "--- Black-Scholes accuracy test on '" << path << "' (r=" << cfg.rate
            << ", sigma=" << cfg.volatility << ") ---\n";

  if (cfg.show_rows){
    for (std::size_t i=0;i<rows.size();++i){
      const auto& q = rows[i].quote;
      const auto& e = evaluated[i];
      std::cout << "\n--- Option: " << rows[i].date << " | " << q.strike << " "
                << bsa::market::to_string(q.kind) << " ---\n"
                << "  Actual Market Price:   " << q.observed_price << "\n";
      if (!e.ok()){
        std::cout << "  Pricing failed:        " << bsa::core::to_string(*e.failure)
                  << " (" << e.failure_message << ")\n";
        continue;
      }
      std::cout << "  Black-Scholes Price:   " << *e.theoretical_price << "\n"
                << "  Pricing Difference:    " << e.sample->signed_error
                << " (" << pct(e.sample->percentage_error) << ")\n";
    }
  }

  std::cout << "\n" << std::string(55,'=') << "\n"
            << "                 QUANTITATIVE SUMMARY\n"
            << std::string(55,'=') << "\n"
            << "  Rows ignored by reader:     " << ignored << "\n"
            << "  Total Options Processed:    " << summary.count_total << "\n"
            << "  Number of Call Options:     " << summary.call.count << "\n"
            << "  Number of Put Options:      " << summary.put.count << "\n"
            << "  Priced:                     " << summary.count_succeeded
            << " (" << summary.count_undefined() << " with zero market price)\n";
  for (std::size_t k=0;k<bsa::core::kFailureReasonCount;++k){
    const auto reason = static_cast<bsa::core::FailureReason>(k);
    if (summary.failures_for(reason) > 0)
      std::cout << "  Failed (" << bsa::core::to_string(reason) << "): "
                << summary.failures_for(reason) << "\n";
  }
  print_subset("all",  summary.overall);
  print_subset("call", summary.call);
  print_subset("put",  summary.put);

  const auto& all = summary.overall;
  if (all.mean_signed_pct_error && all.stddev_signed_pct_error){
    const double se = *all.stddev_signed_pct_error / std::sqrt(static_cast<double>(all.count_defined));
    const auto ci = bsa::core::confidence_interval_95(*all.mean_signed_pct_error, se);
    std::cout << "  95% CI of Mean Error:       [" << ci.low << "%, " << ci.high << "%]\n";
  }
  std::cout << std::string(55,'=') << "\n";

  if (!cfg.residuals_path.empty()){
    try { bsa::io::write_residuals_csv(cfg.residuals_path, rows, evaluated); }
    catch (const std::exception& e){ std::cerr<<"error: "<<e.what()<<"\n"; return 2; }
    std::cout << "CSV: \"" << cfg.residuals_path << "\"\n";
  }
  return 0;
}
