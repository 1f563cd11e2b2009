#ifndef __ORTHOPOLY_SPECIAL_FUNCTIONS_H_
#define __ORTHOPOLY_SPECIAL_FUNCTIONS_H_

#include <algorithm>
#include <cmath>
#include <complex>

#include <boost/math/policies/policy.hpp>

namespace OrthoPoly {

/**
 *  Error policy used for every Boost.Math call made by the library. Domain,
 *  pole, overflow and evaluation errors are ignored so that undefined input
 *  propagates NaN or Inf to the caller instead of raising an exception.
 */
typedef boost::math::policies::policy<
    boost::math::policies::domain_error<boost::math::policies::ignore_error>,
    boost::math::policies::pole_error<boost::math::policies::ignore_error>,
    boost::math::policies::overflow_error<boost::math::policies::ignore_error>,
    boost::math::policies::evaluation_error<
        boost::math::policies::ignore_error>,
    boost::math::policies::promote_double<false>>
    special_policy;

/**
 *  Test if a value is zero or a negative integer, i.e. a pole of the Gamma
 *  function.
 *
 *  @param x Value to test.
 *  @returns True if x is in {0, -1, -2, ...}.
 */
inline bool is_nonpositive_integer(const double x) {
  return x <= 0.0 && x == std::floor(x);
}

/**
 *  Compute the Gamma function. Poles give NaN.
 *
 *  @param x Argument.
 *  @returns Gamma(x).
 */
double gamma(const double x);

/**
 *  Compute the natural logarithm of the absolute value of the Gamma function.
 *  At the poles of Gamma the result is +infinity, so that a pole in a
 *  denominator produces an exact zero after exponentiation.
 *
 *  @param x Argument.
 *  @returns log|Gamma(x)|.
 */
double log_abs_gamma(const double x);

/**
 *  Compute the sign of the Gamma function.
 *
 *  @param x Argument.
 *  @returns 1 for positive Gamma(x), -1 for negative Gamma(x) and 0 at the
 *  poles of Gamma.
 */
double gamma_sign(const double x);

/**
 *  Compute the reciprocal of the Gamma function, which is entire. Poles of
 *  Gamma give 0.
 *
 *  @param x Argument.
 *  @returns 1 / Gamma(x).
 */
double reciprocal_gamma(const double x);

/**
 *  Generalised binomial coefficient for real arguments,
 *
 *    Gamma(n + 1) / (Gamma(k + 1) Gamma(n - k + 1)),
 *
 *  evaluated through log|Gamma| with the sign of each Gamma factor carried
 *  separately.
 *
 *  @param n Upper argument.
 *  @param k Lower argument.
 *  @returns Binomial coefficient (n k).
 */
double binom(const double n, const double k);

/**
 *  Reciprocal of the Beta function, Gamma(a + b) / (Gamma(a) Gamma(b)), with
 *  the same sign handling as binom. Valid for negative non-integer a or b.
 *
 *  @param a First argument.
 *  @param b Second argument.
 *  @returns 1 / B(a, b).
 */
double inverse_beta(const double a, const double b);

/**
 *  Compute relative error between a correct value and a test value.
 *
 *  @param correct Correct value to test against.
 *  @param to_test Value to compare with the correct value.
 *  @returns relative error.
 */
template <typename T>
inline double relative_error(const T correct, const T to_test) {
  const double abs_correct = std::abs(correct);
  const double abs_error = std::abs(correct - to_test);
  return abs_correct == 0 ? abs_error : abs_error / abs_correct;
}

/**
 *  Compute absolute error between a correct value and a test value.
 *
 *  @param correct Correct value to test against.
 *  @param to_test Value to compare with the correct value.
 *  @returns absolute error.
 */
template <typename T>
inline double absolute_error(const T correct, const T to_test) {
  const double abs_error = std::abs(correct - to_test);
  return abs_error;
}

/**
 *  Compute absolute and relative error between a correct value and a test value
 * and return the minimum.
 *
 *  @param correct Correct value to test against.
 *  @param to_test Value to compare with the correct value.
 *  @returns Minimum of relative and absolute error.
 */
template <typename T>
inline double minimum_absrel_error(const T correct, const T to_test) {
  return std::min(absolute_error(correct, to_test),
                  relative_error(correct, to_test));
}

} // namespace OrthoPoly

#endif
