#include <functional>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <orthopoly.hpp>
#include <orthopoly/revision.hpp>
#include <orthopoly/run_info.hpp>

using namespace OrthoPoly;

typedef std::function<double(const long, const double)> Evaluator;

/*
 * Parse the maximum degree from the command line. Throws
 * std::invalid_argument or std::out_of_range on bad input.
 */
static long parse_degree(const std::string &arg) {
  std::size_t pos = 0;
  const long degree = std::stol(arg, &pos);
  if (pos != arg.size()) {
    throw std::invalid_argument("trailing characters");
  }
  if (degree < 0) {
    throw std::out_of_range("negative degree");
  }
  return degree;
}

static void print_table(const std::string &name, const Evaluator &evaluator,
                        const long max_degree,
                        const std::vector<double> &points) {
  std::cout << name << "\n";
  std::cout << std::setw(4) << "n";
  for (const double x : points) {
    std::cout << std::setw(16) << x;
  }
  std::cout << "\n";
  for (long n = 0; n <= max_degree; n++) {
    std::cout << std::setw(4) << n;
    for (const double x : points) {
      std::cout << std::setw(16) << std::setprecision(8) << evaluator(n, x);
    }
    std::cout << "\n";
  }
  std::cout << std::endl;
}

int main(int argc, char **argv) {

  long max_degree = Constants::table_default_degree;
  if (argc > 1) {
    try {
      max_degree = parse_degree(argv[1]);
    } catch (const std::invalid_argument &e) {
      std::cerr << "orthopoly_table: Invalid maximum degree '" << argv[1]
                << "'" << std::endl;
      return 1;
    } catch (const std::out_of_range &e) {
      std::cerr << "orthopoly_table: Maximum degree '" << argv[1]
                << "' out of range" << std::endl;
      return 1;
    }
  }

  RunInfo run_info(version::revision, version::git_state);
  run_info.report_run_info(std::cout);

  const std::vector<double> symmetric = {-1.0, -0.3, 0.0, 0.7, 1.0};
  const std::vector<double> unit = {0.0, 0.25, 0.5, 0.75, 1.0};
  const std::vector<double> wide = {-2.0, -1.0, 0.0, 1.0, 2.0};
  const std::vector<double> positive = {0.0, 0.5, 1.0, 2.0, 5.0};

  const std::vector<std::pair<std::string, Evaluator>> symmetric_families = {
      {"Jacobi (alpha=0.5, beta=-0.3)",
       [](const long n, const double x) { return jacobi(n, 0.5, -0.3, x); }},
      {"Gegenbauer (alpha=0.75)",
       [](const long n, const double x) { return gegenbauer(n, 0.75, x); }},
      {"Chebyshev T",
       [](const long n, const double x) { return chebyt(n, x); }},
      {"Chebyshev U",
       [](const long n, const double x) { return chebyu(n, x); }},
      {"Legendre",
       [](const long n, const double x) { return legendre(n, x); }},
      {"Hermite", [](const long n, const double x) { return hermite(n, x); }},
      {"Hermite (statistician's)",
       [](const long n, const double x) { return hermitenorm(n, x); }}};

  const std::vector<std::pair<std::string, Evaluator>> unit_families = {
      {"Shifted Jacobi (p=2.5, q=1.5)",
       [](const long n, const double x) { return sh_jacobi(n, 2.5, 1.5, x); }},
      {"Shifted Chebyshev T",
       [](const long n, const double x) { return sh_chebyt(n, x); }},
      {"Shifted Chebyshev U",
       [](const long n, const double x) { return sh_chebyu(n, x); }},
      {"Shifted Legendre",
       [](const long n, const double x) { return sh_legendre(n, x); }}};

  const std::vector<std::pair<std::string, Evaluator>> wide_families = {
      {"Chebyshev S",
       [](const long n, const double x) { return chebys(n, x); }},
      {"Chebyshev C",
       [](const long n, const double x) { return chebyc(n, x); }}};

  const std::vector<std::pair<std::string, Evaluator>> positive_families = {
      {"Generalized Laguerre (alpha=1.5)",
       [](const long n, const double x) { return genlaguerre(n, 1.5, x); }},
      {"Laguerre",
       [](const long n, const double x) { return laguerre(n, x); }}};

  for (const auto &family : symmetric_families) {
    print_table(family.first, family.second, max_degree, symmetric);
  }
  for (const auto &family : unit_families) {
    print_table(family.first, family.second, max_degree, unit);
  }
  for (const auto &family : wide_families) {
    print_table(family.first, family.second, max_degree, wide);
  }
  for (const auto &family : positive_families) {
    print_table(family.first, family.second, max_degree, positive);
  }

  return 0;
}
