#include "bsa/core/stats.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

int main() {
  constexpr double EPS = 1e-12;

  // Petits n : politique NaN
  bsa::core::RunningStats empty;
  assert(empty.count() == 0);
  assert(std::isnan(empty.mean()));
  assert(std::isnan(empty.variance()));
  bsa::core::RunningStats one;
  one.add(3.0);
  assert(one.mean() == 3.0);
  assert(std::isnan(one.variance()));

  // Moyenne / variance d'échantillon (n-1)
  const std::vector<double> xs {2, 4, 4, 4, 5, 5, 7, 9};
  bsa::core::RunningStats rs;
  for (double x : xs) rs.add(x);
  assert(rs.count() == 8);
  assert(std::abs(rs.mean() - 5.0) < EPS);
  assert(std::abs(rs.variance() - 32.0 / 7.0) < EPS);
  assert(std::abs(rs.stddev() - std::sqrt(32.0 / 7.0)) < EPS);

  // Fusion de deux moitiés == accumulation directe
  bsa::core::RunningStats a, b;
  for (std::size_t i = 0; i < xs.size(); ++i) (i < 3 ? a : b).add(xs[i]);
  a.merge(b);
  assert(a.count() == rs.count());
  assert(std::abs(a.mean() - rs.mean()) < EPS);
  assert(std::abs(a.variance() - rs.variance()) < EPS);
  bsa::core::RunningStats c;
  c.merge(rs);               // fusion dans un accumulateur vide
  c.merge(empty);            // fusion d'un vide : neutre
  assert(c.count() == 8 && c.mean() == rs.mean());

  // Médiane
  assert(std::isnan(bsa::core::median({})));
  assert(bsa::core::median({7.0}) == 7.0);
  assert(bsa::core::median({3.0, 1.0, 2.0}) == 2.0);
  assert(bsa::core::median({4.0, 1.0, 3.0, 2.0}) == 2.5);
  assert(bsa::core::median({10.0, 20.0}) == 15.0);

  const auto ci = bsa::core::confidence_interval_95(1.0, 0.5);
  assert(std::abs(ci.low  - (1.0 - 1.959963984540054 * 0.5)) < EPS);
  assert(std::abs(ci.high - (1.0 + 1.959963984540054 * 0.5)) < EPS);

  std::cout << "Stats OK.\n";
  return 0;
}
