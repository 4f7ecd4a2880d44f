#include <bsa/pricing/analytic_bs.hpp>
#include <bsa/core/errors.hpp>

#include <cmath>   // log, exp, sqrt, erfc, isfinite
#include <string>

namespace bsa {
namespace pricing {

namespace {
constexpr double INV_SQRT2 = 0.70710678118654752440084436210484903928; // 1/sqrt(2)

inline double pospart(double x) noexcept {
  return (x > 0.0) ? x : 0.0;
}

void check_kind(market::OptionKind kind) {
  if (kind != market::OptionKind::Call && kind != market::OptionKind::Put) {
    throw core::InvalidOptionKind("price: option kind value "
                                  + std::to_string(static_cast<int>(kind))
                                  + " is neither call nor put");
  }
}

void check_finite(double x, const char* name) {
  if (!std::isfinite(x)) {
    throw core::InvalidInput(std::string("price: ") + name + " is not finite");
  }
}

} // unnamed namespace

double norm_cdf(double x) noexcept {
  // erfc plutôt que 1+erf : pas d'annulation dans la queue gauche
  return 0.5 * std::erfc(-x * INV_SQRT2);
}

double intrinsic_value(double spot, double strike, market::OptionKind kind) {
  check_kind(kind);
  return kind == market::OptionKind::Call ? pospart(spot - strike)
                                          : pospart(strike - spot);
}

double price(double spot, double strike, double T, double rate, double volatility,
             market::OptionKind kind) {
  check_kind(kind);
  check_finite(spot, "spot");
  check_finite(strike, "strike");
  check_finite(T, "time to expiry");
  check_finite(rate, "rate");
  check_finite(volatility, "volatility");
  if (spot <= 0.0 || strike <= 0.0) {
    throw core::InvalidInput("price: spot and strike must be > 0");
  }

  // Échéance atteinte ou dépassée : pas de valeur temps
  if (T <= 0.0) {
    return intrinsic_value(spot, strike, kind);
  }
  if (volatility == 0.0) {
    throw core::DegenerateVolatility("price: volatility is 0 with T > 0");
  }

  const double sigSqrtT = volatility * std::sqrt(T);
  if (sigSqrtT == 0.0) {
    throw core::DegenerateVolatility("price: volatility * sqrt(T) underflows to 0");
  }
  const double df       = std::exp(-rate * T);
  const double logm     = std::log(spot / strike);
  const double muT      = (rate + 0.5 * volatility * volatility) * T;

  const double d1 = (logm + muT) / sigSqrtT;
  const double d2 = d1 - sigSqrtT;
  if (!std::isfinite(d1) || !std::isfinite(d2)) {
    throw core::InvalidInput("price: d1/d2 not finite (volatility or T out of range)");
  }

  if (kind == market::OptionKind::Call) {
    return spot * norm_cdf(d1) - strike * df * norm_cdf(d2);
  }
  return strike * df * norm_cdf(-d2) - spot * norm_cdf(-d1);
}

double price(const market::OptionQuote& quote) {
  return price(quote.spot, quote.strike, quote.time_to_expiry_years,
               quote.rate, quote.volatility, quote.kind);
}

double put_call_parity_gap(double call, double put,
                           double spot, double strike, double rate, double T) noexcept {
  const double df = std::exp(-rate * T);
  return call - put - (spot - strike * df);
}

} // namespace pricing
} // namespace bsa
