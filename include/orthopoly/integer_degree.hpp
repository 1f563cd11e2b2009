#ifndef __ORTHOPOLY_INTEGER_DEGREE_H_
#define __ORTHOPOLY_INTEGER_DEGREE_H_

namespace OrthoPoly {

/*
 * Orthogonal polynomials of integer degree, evaluated by direct recurrence.
 * Every evaluator returns 0 for a negative degree.
 */

/**
 *  Jacobi polynomial P_n^(alpha, beta)(x).
 *
 *  @param n Degree.
 *  @param alpha Alpha value, alpha > -1.
 *  @param beta Beta value, beta > -1.
 *  @param x Evaluation point.
 *  @returns P_n^(alpha, beta)(x).
 */
double jacobi(const long n, const double alpha, const double beta,
              const double x);

/**
 *  Shifted Jacobi polynomial G_n^(p, q)(x) on [0, 1],
 *
 *    G_n^(p, q)(x) = n! Gamma(n + p) / Gamma(2n + p) P_n^(p - q, q - 1)(2x - 1).
 *
 *  @param n Degree.
 *  @param p First parameter, p - q > -1.
 *  @param q Second parameter, q > 0.
 *  @param x Evaluation point.
 *  @returns G_n^(p, q)(x).
 */
double sh_jacobi(const long n, const double p, const double q, const double x);

/**
 *  Gegenbauer (ultraspherical) polynomial C_n^(alpha)(x). For alpha == 0 the
 *  polynomials of degree n >= 1 vanish.
 *
 *  @param n Degree.
 *  @param alpha Alpha value, alpha > -1/2.
 *  @param x Evaluation point.
 *  @returns C_n^(alpha)(x).
 */
double gegenbauer(const long n, const double alpha, const double x);

/**
 *  Chebyshev polynomial of the first kind T_n(x).
 *
 *  @param n Degree.
 *  @param x Evaluation point.
 *  @returns T_n(x).
 */
double chebyt(const long n, const double x);

/**
 *  Chebyshev polynomial of the second kind U_n(x).
 *
 *  @param n Degree.
 *  @param x Evaluation point.
 *  @returns U_n(x).
 */
double chebyu(const long n, const double x);

/**
 *  Chebyshev polynomial S_n(x) = U_n(x/2) on [-2, 2].
 */
double chebys(const long n, const double x);

/**
 *  Chebyshev polynomial C_n(x) = 2 T_n(x/2) on [-2, 2].
 */
double chebyc(const long n, const double x);

/**
 *  Shifted Chebyshev polynomial of the first kind T_n(2x - 1) on [0, 1].
 */
double sh_chebyt(const long n, const double x);

/**
 *  Shifted Chebyshev polynomial of the second kind U_n(2x - 1) on [0, 1].
 */
double sh_chebyu(const long n, const double x);

/**
 *  Legendre polynomial P_n(x).
 *
 *  @param n Degree.
 *  @param x Evaluation point.
 *  @returns P_n(x).
 */
double legendre(const long n, const double x);

/**
 *  Shifted Legendre polynomial P_n(2x - 1) on [0, 1].
 */
double sh_legendre(const long n, const double x);

/**
 *  Generalised Laguerre polynomial L_n^(alpha)(x).
 *
 *  @param n Degree.
 *  @param alpha Alpha value. Values alpha <= -1 are outside the domain and
 *  give NaN.
 *  @param x Evaluation point.
 *  @returns L_n^(alpha)(x).
 */
double genlaguerre(const long n, const double alpha, const double x);

/**
 *  Laguerre polynomial L_n(x) = L_n^(0)(x).
 */
double laguerre(const long n, const double x);

/**
 *  Physicist's Hermite polynomial H_n(x), computed from the generalised
 *  Laguerre polynomials of parameter -1/2 (even n) or 1/2 (odd n) at x^2.
 *
 *  @param n Degree.
 *  @param x Evaluation point.
 *  @returns H_n(x).
 */
double hermite(const long n, const double x);

/**
 *  Statistician's Hermite polynomial He_n(x) = 2^(-n/2) H_n(x / sqrt(2)).
 */
double hermitenorm(const long n, const double x);

} // namespace OrthoPoly

#endif
