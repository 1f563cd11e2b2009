#ifndef __ORTHOPOLY_HYPERGEOMETRIC_H_
#define __ORTHOPOLY_HYPERGEOMETRIC_H_

#include <cmath>
#include <complex>
#include <limits>

#include <boost/math/special_functions/hypergeometric_1F1.hpp>
#include <boost/math/special_functions/hypergeometric_pFq.hpp>

#include "constants.hpp"
#include "special_functions.hpp"

namespace OrthoPoly {

using Complex = std::complex<double>;

namespace Hypergeometric {

inline Complex complex_nan() {
  return Complex(std::numeric_limits<double>::quiet_NaN(),
                 std::numeric_limits<double>::quiet_NaN());
}

inline bool is_integer(const double x) {
  return std::isfinite(x) && x == std::floor(x);
}

/**
 *  Sum the Gauss series of 2F1(a, b; c; z) term by term. A non-positive
 *  integer upper parameter terminates the series, which is then exact for any
 *  z. Otherwise the series is only convergent for |z| < 1.
 *
 *  @returns The sum, or NaN if c is a pole before termination or the series
 *  does not converge within Constants::series_max_terms terms.
 */
template <typename T>
inline T hyp2f1_series(const double a, const double b, const double c,
                       const T z) {
  T term = 1.0;
  T sum = 1.0;
  for (int k = 0; k < Constants::series_max_terms; k++) {
    const double numerator = (a + k) * (b + k);
    if (numerator == 0.0) {
      return sum;
    }
    const double denominator = (c + k) * (k + 1.0);
    if (denominator == 0.0) {
      return T(std::numeric_limits<double>::quiet_NaN());
    }
    term *= (numerator / denominator) * z;
    sum += term;
    if (std::abs(term) <= Constants::series_tolerance * std::abs(sum)) {
      return sum;
    }
  }
  return T(std::numeric_limits<double>::quiet_NaN());
}

/**
 *  Terminating 2F1(a, b; c; z) with a = -m, m a non-negative integer. Closer
 *  to z = 1 than to z = 0 the polynomial is re-expanded about z = 1
 *  (A&S 15.3.6 for integer m),
 *
 *    2F1(-m, b; c; z) = (c - b)_m / (c)_m 2F1(-m, b; b - c - m + 1; 1 - z),
 *
 *  which avoids the cancellation of the series in z at high degree. The
 *  series in z is kept when the new lower parameter is a pole before
 *  termination.
 *
 *  @returns The polynomial value, or NaN if c is a pole before termination.
 */
template <typename T>
inline T hyp2f1_terminating(const double a, const double b, const double c,
                            const T z) {
  const double m = -a;
  const double lower = b - c - m + 1.0;
  const bool lower_pole = is_nonpositive_integer(lower) && -lower < m;
  if (lower_pole || std::abs(1.0 - z) >= std::abs(z)) {
    return hyp2f1_series(a, b, c, z);
  }
  double ratio = 1.0;
  for (double j = 0.0; j < m; j += 1.0) {
    const double denominator = c + j;
    if (denominator == 0.0) {
      return T(std::numeric_limits<double>::quiet_NaN());
    }
    ratio *= (c - b + j) / denominator;
  }
  return ratio * hyp2f1_series(a, b, lower, 1.0 - z);
}

/**
 *  Evaluate 2F1(a, b; c; z) when a or b is a non-positive integer, expanding
 *  in the parameter that terminates first.
 */
template <typename T>
inline T hyp2f1_polynomial(const double a, const double b, const double c,
                           const T z) {
  if (is_nonpositive_integer(a) && (!is_nonpositive_integer(b) || a >= b)) {
    return hyp2f1_terminating(a, b, c, z);
  }
  return hyp2f1_terminating(b, a, c, z);
}

/**
 *  Sum the Kummer series of 1F1(a; b; z) term by term.
 *
 *  @returns The sum, or NaN if b is a pole before termination or the series
 *  does not converge within Constants::series_max_terms terms.
 */
template <typename T>
inline T hyp1f1_series(const double a, const double b, const T z) {
  T term = 1.0;
  T sum = 1.0;
  for (int k = 0; k < Constants::series_max_terms; k++) {
    const double numerator = a + k;
    if (numerator == 0.0) {
      return sum;
    }
    const double denominator = (b + k) * (k + 1.0);
    if (denominator == 0.0) {
      return T(std::numeric_limits<double>::quiet_NaN());
    }
    term *= (numerator / denominator) * z;
    sum += term;
    if (std::abs(term) <= Constants::series_tolerance * std::abs(sum)) {
      return sum;
    }
  }
  return T(std::numeric_limits<double>::quiet_NaN());
}

/**
 *  2F1 near z = 1 through the connection formula in 1 - z (A&S 15.3.6).
 *  Requires c - a - b not to be an integer.
 */
inline Complex hyp2f1_one_minus_z(const double a, const double b,
                                  const double c, const Complex z) {
  const Complex y = 1.0 - z;
  const double s = c - a - b;
  const double c1 = gamma(c) * gamma(s) * reciprocal_gamma(c - a) *
                    reciprocal_gamma(c - b);
  const double c2 = gamma(c) * gamma(-s) * reciprocal_gamma(a) *
                    reciprocal_gamma(b);
  return c1 * hyp2f1_series(a, b, 1.0 - s, y) +
         c2 * std::pow(y, s) * hyp2f1_series(c - a, c - b, 1.0 + s, y);
}

/**
 *  2F1 for |z| > 1 through the connection formula in 1 / z (A&S 15.3.7).
 *  Requires a - b not to be an integer.
 */
inline Complex hyp2f1_inverse_z(const double a, const double b, const double c,
                                const Complex z) {
  const Complex w = 1.0 / z;
  const Complex minus_z = -z;
  const double c1 = gamma(c) * gamma(b - a) * reciprocal_gamma(b) *
                    reciprocal_gamma(c - a);
  const double c2 = gamma(c) * gamma(a - b) * reciprocal_gamma(a) *
                    reciprocal_gamma(c - b);
  return c1 * std::pow(minus_z, -a) *
             hyp2f1_series(a, a - c + 1.0, a - b + 1.0, w) +
         c2 * std::pow(minus_z, -b) *
             hyp2f1_series(b, b - c + 1.0, b - a + 1.0, w);
}

} // namespace Hypergeometric

/**
 *  Gauss hypergeometric function 2F1(a, b; c; z) for complex z and real
 *  parameters, on the principal branch (cut along [1, inf)).
 *
 *  The Gauss series is used directly inside a disc of radius
 *  Constants::hyp2f1_radius; elsewhere the argument is mapped into that disc
 *  by the Pfaff transformation or by the connection formulas in 1 - z and
 *  1 / z. Degenerate connection formulas outside the unit disc give NaN.
 *
 *  @param a First upper parameter.
 *  @param b Second upper parameter.
 *  @param c Lower parameter.
 *  @param z Argument.
 *  @returns 2F1(a, b; c; z).
 */
inline Complex hyp2f1(const double a, const double b, const double c,
                      const Complex z) {
  using namespace Hypergeometric;

  if (is_nonpositive_integer(a) || is_nonpositive_integer(b)) {
    return hyp2f1_polynomial(a, b, c, z);
  }
  if (z == Complex(1.0, 0.0)) {
    // Gauss's summation, convergent for c - a - b > 0
    if (c - a - b <= 0.0) {
      return complex_nan();
    }
    return gamma(c) * gamma(c - a - b) * reciprocal_gamma(c - a) *
           reciprocal_gamma(c - b);
  }

  const double radius = Constants::hyp2f1_radius;
  if (std::abs(z) < radius) {
    return hyp2f1_series(a, b, c, z);
  }
  const Complex w = z / (z - 1.0);
  if (std::abs(w) < radius) {
    return std::pow(1.0 - z, -a) * hyp2f1_series(a, c - b, c, w);
  }
  if (std::abs(1.0 - z) < radius && !is_integer(c - a - b)) {
    return hyp2f1_one_minus_z(a, b, c, z);
  }
  if (std::abs(z) < 1.0) {
    return hyp2f1_series(a, b, c, z);
  }
  if (!is_integer(a - b)) {
    return hyp2f1_inverse_z(a, b, c, z);
  }
  return complex_nan();
}

/**
 *  Kummer confluent hypergeometric function 1F1(a; b; z) for complex z and
 *  real parameters. For Re(z) < 0 the Kummer transformation
 *  1F1(a; b; z) = exp(z) 1F1(b - a; b; -z) keeps the series terms positive.
 *
 *  @param a Upper parameter.
 *  @param b Lower parameter.
 *  @param z Argument.
 *  @returns 1F1(a; b; z).
 */
inline Complex hyp1f1(const double a, const double b, const Complex z) {
  using namespace Hypergeometric;

  if (is_nonpositive_integer(a) || z.real() >= 0.0) {
    return hyp1f1_series(a, b, z);
  }
  return std::exp(z) * hyp1f1_series(b - a, b, -z);
}

/**
 *  Gauss hypergeometric function 2F1(a, b; c; z) for real z.
 *
 *  Inside the unit disc Boost.Math evaluates the series. Terminating series
 *  are summed directly for any z, about z = 1 when that is the nearer
 *  point, and the remaining arguments outside the
 *  disc go through the transformations of the complex evaluator. For z > 1
 *  the non-terminating function is complex valued and NaN is returned.
 *
 *  @param a First upper parameter.
 *  @param b Second upper parameter.
 *  @param c Lower parameter.
 *  @param z Argument.
 *  @returns 2F1(a, b; c; z), NaN where it is not real or cannot be evaluated.
 */
inline double hyp2f1(const double a, const double b, const double c,
                     const double z) {
  if (is_nonpositive_integer(a) || is_nonpositive_integer(b)) {
    return Hypergeometric::hyp2f1_polynomial(a, b, c, z);
  }
  if (std::fabs(z) < 1.0) {
    return boost::math::hypergeometric_pFq({a, b}, {c}, z,
                                           static_cast<double *>(nullptr),
                                           special_policy());
  }
  if (z > 1.0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return hyp2f1(a, b, c, Complex(z, 0.0)).real();
}

/**
 *  Kummer confluent hypergeometric function 1F1(a; b; z) for real z.
 *
 *  @param a Upper parameter.
 *  @param b Lower parameter.
 *  @param z Argument.
 *  @returns 1F1(a; b; z).
 */
inline double hyp1f1(const double a, const double b, const double z) {
  return boost::math::hypergeometric_1F1(a, b, z, special_policy());
}

} // namespace OrthoPoly

#endif
