#include "bsa/io/options_csv.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double tolérant ("" ou texte -> NaN) ; accepte les séparateurs de milliers "17,250.5"
static double parse_double(std::string s) {
  s.erase(std::remove(s.begin(), s.end(), ','), s.end());
  s = trim(s);
  if (s.empty() || s=="-") return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str() || *end!='\0') return std::numeric_limits<double>::quiet_NaN();
  return v;
}

// En-tête normalisé : minuscules, espaces retirés, coquilles connues corrigées
static std::string normalize_header(const std::string& h) {
  std::string s = lower(trim(h));
  if (s == "option_typut") s = "option_type";
  return s;
}

// récupère index de colonne via map (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(n);
    if (it != idx.end()) return it->second;
  }
  return -1;
}

static bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); });
}

// Jours depuis l'epoch civile (Howard Hinnant, days_from_civil)
static long days_from_civil(long y, unsigned m, unsigned d) {
  y -= m <= 2;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long>(doe) - 719468;
}

static bool is_leap(long y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static unsigned days_in_month(long y, unsigned m) {
  static constexpr unsigned dim[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
  return (m == 2 && is_leap(y)) ? 29u : dim[m - 1];
}

static int month_from_name(const std::string& s) {
  static const char* names[12] = {"jan","feb","mar","apr","may","jun",
                                  "jul","aug","sep","oct","nov","dec"};
  const std::string l = lower(s).substr(0, 3);
  for (int i=0;i<12;++i) if (l == names[i]) return i+1;
  return -1;
}

} // namespace

namespace bsa::io {

std::optional<long> parse_date_days(const std::string& raw) {
  std::string s = trim(raw);
  // "2024-01-25 00:00:00" -> partie date seulement
  if (auto sp = s.find(' '); sp != std::string::npos) s = s.substr(0, sp);

  const char sep = (s.find('/') != std::string::npos) ? '/' : '-';
  std::vector<std::string> parts;
  std::string cur;
  for (char c : s) {
    if (c == sep) { parts.push_back(cur); cur.clear(); }
    else cur.push_back(c);
  }
  parts.push_back(cur);
  if (parts.size() != 3) return std::nullopt;

  long y = 0; int m = 0; int d = 0;
  // jour / mois sur 1-2 chiffres, année sur 4 : pas de débordement d'atoi
  auto short_num = [](const std::string& p){ return p.size() <= 2 && all_digits(p); };
  if (parts[0].size() == 4 && all_digits(parts[0])) {          // YYYY-MM-DD
    if (!short_num(parts[1]) || !short_num(parts[2])) return std::nullopt;
    y = std::atol(parts[0].c_str()); m = std::atoi(parts[1].c_str()); d = std::atoi(parts[2].c_str());
  } else if (short_num(parts[0]) && parts[2].size() == 4 && all_digits(parts[2])) {
    d = std::atoi(parts[0].c_str());
    y = std::atol(parts[2].c_str());
    if (all_digits(parts[1])) {
      if (!short_num(parts[1])) return std::nullopt;
      m = std::atoi(parts[1].c_str());                          // DD-MM-YYYY
    } else {
      m = month_from_name(parts[1]);                            // DD-Mon-YYYY
    }
  } else {
    return std::nullopt;
  }

  if (m < 1 || m > 12 || d < 1) return std::nullopt;
  if (static_cast<unsigned>(d) > days_in_month(y, static_cast<unsigned>(m))) return std::nullopt;
  return days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

std::vector<OptionRow>
read_options_csv(const std::string& path,
                 const config::RunConfig& cfg,
                 std::size_t* num_ignored,
                 std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  if (!(std::isfinite(cfg.day_count) && cfg.day_count > 0.0)) {
    throw std::invalid_argument("read_options_csv: day_count must be > 0");
  }

  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Impossible d'ouvrir le fichier: " + path);
  }

  std::vector<OptionRow> out;
  std::string line;
  std::unordered_map<std::string,int> idx;
  bool header_seen = false;
  std::size_t line_no = 0;

  int iDate = -1, iExp = -1, iSpot = -1, iK = -1, iPx = -1, iType = -1, iR = -1, iVol = -1;

  auto ignore = [&](const std::string& why) {
    if (num_ignored) (*num_ignored)++;
    if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: " + why);
  };

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    // BOM UTF-8 éventuel sur la première ligne
    if (line_no == 1 && line.rfind("\xEF\xBB\xBF", 0) == 0) line.erase(0, 3);
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      for (int i=0;i<(int)cells.size();++i) idx[normalize_header(cells[i])] = i;

      iDate = col(idx, {"date","trade_date"});
      iExp  = col(idx, {"expiry_date","expiry","expiration","expiration_date"});
      iSpot = col(idx, {"nifty_close","spot","underlying_close","s0"});
      iK    = col(idx, {"strike_price","strike","k"});
      iPx   = col(idx, {"option_close","close","price","mid"});
      iType = col(idx, {"option_type","type","cp"});
      iR    = col(idx, {"rate","r"});
      iVol  = col(idx, {"volatility","sigma","iv"});

      if (iDate<0 || iExp<0 || iSpot<0 || iK<0 || iPx<0 || iType<0) {
        throw std::runtime_error("read_options_csv: colonnes requises absentes "
                                 "(date, expiry_date, spot, strike, option_close, option_type) dans " + path);
      }
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    const auto d0   = parse_date_days(get(iDate));
    const auto d1   = parse_date_days(get(iExp));
    const double S  = parse_double(get(iSpot));
    const double K  = parse_double(get(iK));
    const double px = parse_double(get(iPx));
    const auto kind = market::try_parse_option_kind(get(iType));

    // ---- Filtres ----
    if (!d0 || !d1)                         { ignore("date ou échéance illisible"); continue; }
    if (!std::isfinite(S) || S <= 0.0)      { ignore("spot<=0 ou invalide"); continue; }
    if (!std::isfinite(K) || K <= 0.0)      { ignore("strike<=0 ou invalide"); continue; }
    if (!std::isfinite(px))                 { ignore("prix option manquant"); continue; }
    if (!kind)                              { ignore("type d'option inconnu '" + get(iType) + "'"); continue; }

    double r = cfg.rate;
    double sigma = cfg.volatility;
    if (iR >= 0) {
      const double v = parse_double(get(iR));
      if (std::isfinite(v)) r = v;
    }
    if (iVol >= 0) {
      const double v = parse_double(get(iVol));
      if (std::isfinite(v)) sigma = v;
    }

    OptionRow row;
    row.date   = get(iDate);
    row.expiry = get(iExp);
    row.quote  = market::OptionQuote{
      S, K, static_cast<double>(*d1 - *d0) / cfg.day_count, r, sigma, *kind, px};
    out.push_back(row);
  }

  return out;
}

std::vector<market::OptionQuote> quotes_of(const std::vector<OptionRow>& rows) {
  std::vector<market::OptionQuote> out;
  out.reserve(rows.size());
  for (const auto& r : rows) out.push_back(r.quote);
  return out;
}

void write_residuals_csv(const std::string& path,
                         const std::vector<OptionRow>& rows,
                         const std::vector<qc::EvaluatedRow>& evaluated)
{
  if (rows.size() != evaluated.size()) {
    throw std::invalid_argument("write_residuals_csv: rows/evaluated size mismatch");
  }
  std::ofstream f(path);
  if (!f) {
    throw std::runtime_error("Impossible d'écrire le fichier: " + path);
  }

  f.precision(10);
  f << "date,expiry,spot,strike,T,type,price_mkt,price_bs,err_price,pct_error,abs_pct_error,status\n";
  for (std::size_t i=0;i<rows.size();++i) {
    const auto& row = rows[i];
    const auto& e   = evaluated[i];
    const auto& q   = row.quote;
    f << row.date << "," << row.expiry << ","
      << q.spot << "," << q.strike << "," << q.time_to_expiry_years << ","
      << market::to_string(q.kind) << "," << q.observed_price << ",";
    if (e.theoretical_price) f << *e.theoretical_price;
    f << ",";
    if (e.sample) {
      f << e.sample->signed_error << ",";
      if (e.sample->defined()) {
        f << *e.sample->percentage_error << "," << *e.sample->absolute_percentage_error << ",ok\n";
      } else {
        f << "undefined,undefined,ok\n";
      }
    } else {
      f << ",,," << (e.failure ? core::to_string(*e.failure) : "failed") << "\n";
    }
  }
  if (!f) {
    throw std::runtime_error("Erreur d'écriture: " + path);
  }
}

} // namespace bsa::io
