#include <bsa/pricing/analytic_bs.hpp>
#include <bsa/core/errors.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <cstdlib>

struct Case {
  double S, K, T, r, sigma;
};

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [S K T r sigma]\n"
            << "If no arguments are provided, runs 4 reference cases.\n";
}

int main(int argc, char** argv) {
  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  std::vector<Case> cases;
  if (argc == 1) {
    cases.push_back({100.0,   100.0,   1.00,        0.05,   0.20});
    cases.push_back({100.0,   110.0,   0.50,        0.02,   0.25});
    cases.push_back({80.0,    100.0,   2.00,       -0.01,   0.35}); // r négatif
    cases.push_back({17000.0, 17000.0, 30.0/365.0,  0.0685, 0.145}); // NIFTY ATM 30j
  } else if (argc == 6) {
    Case c;
    try {
      c.S     = std::stod(argv[1]);
      c.K     = std::stod(argv[2]);
      c.T     = std::stod(argv[3]);
      c.r     = std::stod(argv[4]);
      c.sigma = std::stod(argv[5]);
    } catch (const std::exception&) {
      print_usage(argv[0]);
      return 1;
    }
    cases.push_back(c);
  } else {
    print_usage(argv[0]);
    return 1;
  }

  using bsa::market::OptionKind;
  std::cout << "       S         K          T        r     sigma          Call           Put    ParityGap\n";
  std::cout << "------------------------------------------------------------------------------------------\n";
  for (const auto& c : cases) {
    try {
      const double call = bsa::pricing::price(c.S, c.K, c.T, c.r, c.sigma, OptionKind::Call);
      const double put  = bsa::pricing::price(c.S, c.K, c.T, c.r, c.sigma, OptionKind::Put);
      const double gap  = bsa::pricing::put_call_parity_gap(call, put, c.S, c.K, c.r, c.T);

      std::cout << std::setw(8)  << c.S    << ' '
                << std::setw(9)  << c.K    << ' '
                << std::setw(10) << c.T    << ' '
                << std::setw(8)  << c.r    << ' '
                << std::setw(8)  << c.sigma<< ' '
                << std::setw(13) << call   << ' '
                << std::setw(13) << put    << ' '
                << std::setw(12) << gap    << '\n';
    } catch (const bsa::core::PricingError& e) {
      std::cerr << "error: " << bsa::core::to_string(e.reason()) << ": " << e.what() << "\n";
      return 2;
    }
  }
  return 0;
}
