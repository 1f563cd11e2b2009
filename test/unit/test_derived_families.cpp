#include <orthopoly/general_degree.hpp>
#include <orthopoly/integer_degree.hpp>
#include <orthopoly/special_functions.hpp>

#include <cmath>
#include <complex>
#include <gtest/gtest.h>
#include <vector>

using namespace OrthoPoly;

/*
 * Families defined by a change of variable of a base family evaluate to
 * exactly the base family at the transformed argument.
 */

TEST(DerivedFamilies, IntegerDegree) {
  const std::vector<long> degrees = {0, 1, 2, 5, 9};
  const std::vector<double> points = {-1.5, -0.25, 0.0, 0.4, 1.0, 2.75};
  for (const long n : degrees) {
    for (const double x : points) {
      ASSERT_EQ(chebys(n, x), chebyu(n, 0.5 * x));
      ASSERT_EQ(chebyc(n, x), 2.0 * chebyt(n, 0.5 * x));
      ASSERT_EQ(sh_chebyt(n, x), chebyt(n, 2.0 * x - 1.0));
      ASSERT_EQ(sh_chebyu(n, x), chebyu(n, 2.0 * x - 1.0));
      ASSERT_EQ(sh_legendre(n, x), legendre(n, 2.0 * x - 1.0));
      ASSERT_EQ(laguerre(n, x), genlaguerre(n, 0.0, x));
      ASSERT_EQ(hermitenorm(n, x),
                hermite(n, x / std::sqrt(2.0)) * std::pow(2.0, -n / 2.0));
    }
  }

  const double p = 3.5;
  const double q = 2.0;
  for (const long n : degrees) {
    const double factor =
        std::exp(log_abs_gamma(1.0 + n) + log_abs_gamma(n + p) -
                 log_abs_gamma(2.0 * n + p));
    for (const double x : points) {
      ASSERT_EQ(sh_jacobi(n, p, q, x),
                factor * jacobi(n, p - q, q - 1.0, 2.0 * x - 1.0));
    }
  }
}

TEST(DerivedFamilies, GeneralDegree) {
  const std::vector<double> degrees = {0.0, 0.5, 1.3, 2.0, 4.7};
  const std::vector<double> points = {0.15, 0.45, 0.8, 1.0};
  for (const double n : degrees) {
    for (const double x : points) {
      ASSERT_EQ(chebys<double>(n, x), chebyu<double>(n, 0.5 * x));
      ASSERT_EQ(chebyc<double>(n, x), 2.0 * chebyt<double>(n, 0.5 * x));
      ASSERT_EQ(sh_chebyt<double>(n, x), chebyt<double>(n, 2.0 * x - 1.0));
      ASSERT_EQ(sh_chebyu<double>(n, x), chebyu<double>(n, 2.0 * x - 1.0));
      ASSERT_EQ(sh_legendre<double>(n, x), legendre<double>(n, 2.0 * x - 1.0));
      ASSERT_EQ(laguerre<double>(n, x), genlaguerre<double>(n, 0.0, x));
    }
  }

  const Complex z(0.3, -0.2);
  for (const double n : degrees) {
    ASSERT_EQ(chebys<Complex>(n, z), chebyu<Complex>(n, 0.5 * z));
    ASSERT_EQ(sh_legendre<Complex>(n, z), legendre<Complex>(n, 2.0 * z - 1.0));
    ASSERT_EQ(laguerre<Complex>(n, z), genlaguerre<Complex>(n, 0.0, z));
  }
}

TEST(DerivedFamilies, ShiftedJacobi) {
  const double p = 3.5;
  const double q = 2.0;
  for (const long n : {0L, 1L, 3L, 6L}) {
    for (const double x : {0.0, 0.3, 0.75, 1.0}) {
      const double correct =
          jacobi(n, p - q, q - 1.0, 2.0 * x - 1.0) / binom(2.0 * n + p - 1.0, n);
      ASSERT_LT(relative_error(correct, sh_jacobi(n, p, q, x)), 1.0e-13);
    }
  }
  for (const double n : {0.5, 2.25}) {
    for (const double x : {0.1, 0.6}) {
      ASSERT_EQ(sh_jacobi<double>(n, p, q, x),
                jacobi<double>(n, p - q, q - 1.0, 2.0 * x - 1.0) /
                    binom(2.0 * n + p - 1.0, n));
    }
  }
}

TEST(DerivedFamilies, ChebyshevCAtDegreeZero) {
  for (const double x : {-3.0, 0.0, 0.5, 10.0}) {
    ASSERT_EQ(chebyc(0, x), 2.0);
    ASSERT_EQ(chebyc<double>(0.0, x), 2.0);
  }
}
