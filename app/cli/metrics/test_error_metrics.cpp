#include "bsa/metrics/error_metrics.hpp"
#include "bsa/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using bsa::metrics::compute_error;

int main() {
  constexpr double EPS = 1e-12;

  // Cas nominal
  auto s = compute_error(110.0, 100.0);
  assert(std::abs(s.signed_error - 10.0) < EPS);
  assert(s.defined());
  assert(std::abs(*s.percentage_error - 10.0) < EPS);
  assert(std::abs(*s.absolute_percentage_error - 10.0) < EPS);

  // Sous-évaluation : erreur signée négative, absolue positive
  s = compute_error(40.0, 50.0);
  assert(std::abs(s.signed_error + 10.0) < EPS);
  assert(std::abs(*s.percentage_error + 20.0) < EPS);
  assert(std::abs(*s.absolute_percentage_error - 20.0) < EPS);

  // Prix observé nul : % indéfini (ni inf, ni 0), erreur signée conservée
  for (double theo : {0.0, 12.5, 331.41}) {
    s = compute_error(theo, 0.0);
    assert(!s.defined());
    assert(!s.percentage_error.has_value());
    assert(!s.absolute_percentage_error.has_value());
    assert(s.signed_error == theo);
  }

  // Prix observé négatif (donnée malformée) : défini, signe du dénominateur respecté
  s = compute_error(10.0, -5.0);
  assert(std::abs(*s.percentage_error + 300.0) < EPS);

  // Entrées non finies : InvalidInput
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  bool caught = false;
  try { compute_error(nan, 1.0); } catch (const bsa::core::InvalidInput&) { caught = true; }
  assert(caught);
  caught = false;
  try { compute_error(1.0, -inf); } catch (const bsa::core::InvalidInput&) { caught = true; }
  assert(caught);

  std::cout << "Error metrics OK.\n";
  return 0;
}
