#ifndef __ORTHOPOLY_GENERAL_DEGREE_H_
#define __ORTHOPOLY_GENERAL_DEGREE_H_

#include <cmath>
#include <complex>
#include <limits>
#include <type_traits>

#include "hypergeometric.hpp"
#include "special_functions.hpp"

namespace OrthoPoly {

/**
 *  Scalar types the general degree evaluators accept for the evaluation
 *  point: double and std::complex<double>.
 */
template <typename T> struct is_evaluation_scalar : std::false_type {};
template <> struct is_evaluation_scalar<double> : std::true_type {};
template <> struct is_evaluation_scalar<Complex> : std::true_type {};

template <typename T>
using enable_if_scalar_t =
    std::enable_if_t<is_evaluation_scalar<T>::value, bool>;

/*
 * Orthogonal polynomials of arbitrary real degree, expressed through the
 * hypergeometric functions. The degree is a double, the evaluation point a
 * real or complex scalar. When n is a non-negative integer these agree with
 * the recurrence evaluators of the same name taking a long degree.
 */

/**
 *  Jacobi function P_n^(alpha, beta)(x) =
 *  binom(n + alpha, n) 2F1(-n, n + alpha + beta + 1; alpha + 1; (1 - x)/2).
 *
 *  @param n Degree.
 *  @param alpha Alpha value.
 *  @param beta Beta value.
 *  @param x Evaluation point.
 *  @returns P_n^(alpha, beta)(x).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T jacobi(const double n, const double alpha, const double beta,
                const T x) {
  const double d = binom(n + alpha, n);
  return d * hyp2f1(-n, n + alpha + beta + 1.0, alpha + 1.0, (1.0 - x) / 2.0);
}

/**
 *  Shifted Jacobi function G_n^(p, q)(x) =
 *  P_n^(p - q, q - 1)(2x - 1) / binom(2n + p - 1, n).
 *
 *  @param n Degree.
 *  @param p First parameter.
 *  @param q Second parameter.
 *  @param x Evaluation point.
 *  @returns G_n^(p, q)(x).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T sh_jacobi(const double n, const double p, const double q,
                   const T x) {
  return jacobi<T>(n, p - q, q - 1.0, 2.0 * x - 1.0) /
         binom(2.0 * n + p - 1.0, n);
}

/**
 *  Gegenbauer function C_n^(alpha)(x) =
 *  Gamma(n + 2 alpha) / (Gamma(n + 1) Gamma(2 alpha))
 *  2F1(-n, n + 2 alpha; alpha + 1/2; (1 - x)/2).
 *
 *  The Gamma ratio is taken through reciprocal_gamma, so a pole of
 *  Gamma(2 alpha) gives 0 (C_n^(0) = 0 for n >= 1). When n + 2 alpha and
 *  2 alpha are both poles the ratio is the finite Pochhammer symbol
 *  (2 alpha)_n.
 *
 *  @param n Degree.
 *  @param alpha Alpha value. Values with alpha + 1/2 a non-positive integer
 *  are a pole of the hypergeometric series and give NaN for n != 0.
 *  @param x Evaluation point.
 *  @returns C_n^(alpha)(x).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T gegenbauer(const double n, const double alpha, const T x) {
  if (n != 0.0 && is_nonpositive_integer(alpha + 0.5)) {
    return T(std::numeric_limits<double>::quiet_NaN());
  }
  const double two_alpha = 2.0 * alpha;
  double ratio;
  if (is_nonpositive_integer(n + two_alpha) &&
      is_nonpositive_integer(two_alpha)) {
    // Gamma(n + 2a) / Gamma(2a) = (-1)^n Gamma(1 - 2a) / Gamma(1 - 2a - n)
    const double sign = (std::fmod(n, 2.0) == 0.0) ? 1.0 : -1.0;
    ratio = sign * gamma(1.0 - two_alpha) *
            reciprocal_gamma(1.0 - two_alpha - n);
  } else {
    ratio = gamma(n + two_alpha) * reciprocal_gamma(two_alpha);
  }
  const double d = ratio * reciprocal_gamma(1.0 + n);
  return d * hyp2f1(-n, n + two_alpha, alpha + 0.5, (1.0 - x) / 2.0);
}

/**
 *  Chebyshev function of the first kind T_n(x) = 2F1(-n, n; 1/2; (1 - x)/2).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T chebyt(const double n, const T x) {
  return hyp2f1(-n, n, 0.5, (1.0 - x) / 2.0);
}

/**
 *  Chebyshev function of the second kind
 *  U_n(x) = (n + 1) 2F1(-n, n + 2; 3/2; (1 - x)/2).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T chebyu(const double n, const T x) {
  return (n + 1.0) * hyp2f1(-n, n + 2.0, 1.5, (1.0 - x) / 2.0);
}

/**
 *  Chebyshev function S_n(x) = U_n(x/2).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T chebys(const double n, const T x) {
  return chebyu<T>(n, 0.5 * x);
}

/**
 *  Chebyshev function C_n(x) = 2 T_n(x/2).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T chebyc(const double n, const T x) {
  return 2.0 * chebyt<T>(n, 0.5 * x);
}

/**
 *  Shifted Chebyshev function of the first kind T_n(2x - 1).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T sh_chebyt(const double n, const T x) {
  return chebyt<T>(n, 2.0 * x - 1.0);
}

/**
 *  Shifted Chebyshev function of the second kind U_n(2x - 1).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T sh_chebyu(const double n, const T x) {
  return chebyu<T>(n, 2.0 * x - 1.0);
}

/**
 *  Legendre function P_n(x) = 2F1(-n, n + 1; 1; (1 - x)/2).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T legendre(const double n, const T x) {
  return hyp2f1(-n, n + 1.0, 1.0, (1.0 - x) / 2.0);
}

/**
 *  Shifted Legendre function P_n(2x - 1).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T sh_legendre(const double n, const T x) {
  return legendre<T>(n, 2.0 * x - 1.0);
}

/**
 *  Generalised Laguerre function
 *  L_n^(alpha)(x) = binom(n + alpha, n) 1F1(-n; alpha + 1; x).
 *
 *  @param n Degree.
 *  @param alpha Alpha value. Values alpha <= -1 give NaN.
 *  @param x Evaluation point.
 *  @returns L_n^(alpha)(x).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T genlaguerre(const double n, const double alpha, const T x) {
  if (alpha <= -1.0) {
    return T(std::numeric_limits<double>::quiet_NaN());
  }
  const double d = binom(n + alpha, n);
  return d * hyp1f1(-n, alpha + 1.0, x);
}

/**
 *  Laguerre function L_n(x) = L_n^(0)(x).
 */
template <typename T, enable_if_scalar_t<T> = true>
inline T laguerre(const double n, const T x) {
  return genlaguerre<T>(n, 0.0, x);
}

} // namespace OrthoPoly

#endif
