#include <orthopoly/integer_degree.hpp>

#include <cmath>
#include <limits>

#include <orthopoly/constants.hpp>
#include <orthopoly/recurrence.hpp>
#include <orthopoly/special_functions.hpp>

namespace OrthoPoly {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

inline double parity_sign(const long m) { return (m % 2 == 0) ? 1.0 : -1.0; }

/*
 * Power series of C_n^(alpha)(x) in x^2, summed from the lowest power of x.
 * Used for |x| small, where the recurrence in (x - 1) loses precision.
 */
double gegenbauer_power_series(const long n, const double alpha,
                               const double x) {
  const long a = n / 2;
  double d = parity_sign(a) * inverse_beta(alpha, 1.0 + a);
  if (n == 2 * a) {
    d /= (a + alpha);
  } else {
    d *= 2.0 * x;
  }

  double p = 0.0;
  for (long kk = 0; kk <= a; kk++) {
    p += d;
    d *= -4.0 * x * x * (a - kk) * (-a + alpha + kk + n) /
         ((n + 1.0 - 2.0 * a + 2.0 * kk) * (n + 2.0 - 2.0 * a + 2.0 * kk));
    if (std::abs(d) <= Constants::series_cutoff * std::abs(p)) {
      break;
    }
  }
  return p;
}

/*
 * Power series of P_n(x) in x^2, summed from the lowest power of x.
 */
double legendre_power_series(const long n, const double x) {
  const long a = n / 2;
  double d = parity_sign(a);
  if (n == 2 * a) {
    d *= -2.0 * inverse_beta(a + 1.0, -0.5);
  } else {
    d *= 2.0 * x * inverse_beta(a + 1.0, 0.5);
  }

  double p = 0.0;
  for (long kk = 0; kk <= a; kk++) {
    p += d;
    d *= -2.0 * x * x * (a - kk) * (2.0 * n + 1.0 - 2.0 * a + 2.0 * kk) /
         ((n + 1.0 - 2.0 * a + 2.0 * kk) * (n + 2.0 - 2.0 * a + 2.0 * kk));
    if (std::abs(d) <= Constants::series_cutoff * std::abs(p)) {
      break;
    }
  }
  return p;
}

} // namespace

double jacobi(const long n, const double alpha, const double beta,
              const double x) {
  if (n < 0) {
    return 0.0;
  }
  if (n == 0) {
    return 1.0;
  }
  if (n == 1) {
    return 0.5 * (2.0 * (alpha + 1.0) + (alpha + beta + 2.0) * (x - 1.0));
  }
  const Recurrence::Jacobi family{alpha, beta};
  return binom(n + alpha, n) * Recurrence::evaluate(n, family, x);
}

double sh_jacobi(const long n, const double p, const double q, const double x) {
  if (n < 0) {
    return 0.0;
  }
  const double factor = std::exp(log_abs_gamma(1.0 + n) +
                                 log_abs_gamma(n + p) -
                                 log_abs_gamma(2.0 * n + p));
  return factor * jacobi(n, p - q, q - 1.0, 2.0 * x - 1.0);
}

double gegenbauer(const long n, const double alpha, const double x) {
  if (n < 0) {
    return 0.0;
  }
  if (std::isnan(alpha) || std::isnan(x)) {
    return NaN;
  }
  if (n == 0) {
    return 1.0;
  }
  if (n == 1) {
    return 2.0 * alpha * x;
  }
  if (alpha == 0.0) {
    return 0.0;
  }
  if (std::abs(x) < Constants::small_argument) {
    return gegenbauer_power_series(n, alpha, x);
  }

  const Recurrence::Gegenbauer family{alpha};
  const double p = Recurrence::evaluate(n, family, x);
  if (std::abs(alpha / n) < Constants::small_gegenbauer_ratio) {
    // binom(n + 2 alpha - 1, n) -> 2 alpha / n as alpha -> 0
    return 2.0 * alpha / n * p;
  }
  return binom(n + 2.0 * alpha - 1.0, n) * p;
}

double chebyt(const long n, const double x) {
  if (n < 0) {
    return 0.0;
  }
  // T_n = (U_n - U_{n-2}) / 2 from the U recurrence in 2x
  const double x2 = 2.0 * x;
  double b2 = 0.0;
  double b1 = -1.0;
  double b0 = 0.0;
  for (long m = 0; m <= n; m++) {
    b2 = b1;
    b1 = b0;
    b0 = x2 * b1 - b2;
  }
  return (b0 - b2) / 2.0;
}

double chebyu(const long n, const double x) {
  if (n < 0) {
    return 0.0;
  }
  const double x2 = 2.0 * x;
  double b2 = 0.0;
  double b1 = -1.0;
  double b0 = 0.0;
  for (long m = 0; m <= n; m++) {
    b2 = b1;
    b1 = b0;
    b0 = x2 * b1 - b2;
  }
  return b0;
}

double chebys(const long n, const double x) { return chebyu(n, 0.5 * x); }

double chebyc(const long n, const double x) {
  return 2.0 * chebyt(n, 0.5 * x);
}

double sh_chebyt(const long n, const double x) {
  return chebyt(n, 2.0 * x - 1.0);
}

double sh_chebyu(const long n, const double x) {
  return chebyu(n, 2.0 * x - 1.0);
}

double legendre(const long n, const double x) {
  if (n < 0) {
    return 0.0;
  }
  if (n == 0) {
    return 1.0;
  }
  if (n == 1) {
    return x;
  }
  if (std::abs(x) < Constants::small_argument) {
    return legendre_power_series(n, x);
  }
  const Recurrence::Legendre family{};
  return Recurrence::evaluate(n, family, x);
}

double sh_legendre(const long n, const double x) {
  return legendre(n, 2.0 * x - 1.0);
}

double genlaguerre(const long n, const double alpha, const double x) {
  if (n < 0) {
    return 0.0;
  }
  if (alpha <= -1.0 || std::isnan(alpha) || std::isnan(x)) {
    return NaN;
  }
  if (n == 0) {
    return 1.0;
  }
  if (n == 1) {
    return -x + alpha + 1.0;
  }
  const Recurrence::GeneralizedLaguerre family{alpha};
  return binom(n + alpha, n) * Recurrence::evaluate(n, family, x);
}

double laguerre(const long n, const double x) {
  return genlaguerre(n, 0.0, x);
}

double hermite(const long n, const double x) {
  if (n < 0) {
    return 0.0;
  }
  if (n == 0) {
    return 1.0;
  }
  if (n == 1) {
    return 2.0 * x;
  }
  if (n % 2 == 0) {
    const long m = n / 2;
    return parity_sign(m) * std::pow(2.0, 2 * m) * gamma(1.0 + m) *
           genlaguerre(m, -0.5, x * x);
  }
  const long m = (n - 1) / 2;
  return parity_sign(m) * std::pow(2.0, 2 * m + 1) * gamma(1.0 + m) * x *
         genlaguerre(m, 0.5, x * x);
}

double hermitenorm(const long n, const double x) {
  return hermite(n, x / std::sqrt(2.0)) * std::pow(2.0, -n / 2.0);
}

} // namespace OrthoPoly
