#ifndef __ORTHOPOLY_RECURRENCE_H_
#define __ORTHOPOLY_RECURRENCE_H_

namespace OrthoPoly {

namespace Recurrence {

/**
 *  Evaluate a polynomial of degree n >= 1 from the difference form of its
 *  three-term recurrence. With d_1 = seed(x) and p_1 = 1 + d_1, iterate for
 *  k = 1, ..., n - 1
 *
 *    d_{k+1} = A_k(x) p_k + B_k d_k,
 *    p_{k+1} = p_k + d_{k+1},
 *
 *  and return p_n. Working with the increments d_k rather than the polynomial
 *  values themselves avoids the cancellation the plain recurrence suffers
 *  near x = 1. The result is the polynomial up to the family's normalisation,
 *  which the caller applies.
 *
 *  The COEFFICIENTS type provides
 *
 *    double seed(const double x) const;
 *    void coefficients(const double k, const double x, double &A,
 *                      double &B) const;
 *
 *  @param n Degree, n >= 1.
 *  @param family Recurrence coefficients of the family.
 *  @param x Evaluation point.
 *  @returns p_n.
 */
template <typename COEFFICIENTS>
inline double evaluate(const long n, const COEFFICIENTS &family,
                       const double x) {
  double d = family.seed(x);
  double p = d + 1.0;
  double A, B;
  for (long kk = 0; kk < n - 1; kk++) {
    const double k = kk + 1.0;
    family.coefficients(k, x, A, B);
    d = A * p + B * d;
    p = d + p;
  }
  return p;
}

/**
 *  Jacobi P_n^(alpha, beta), normalised by binom(n + alpha, n).
 */
struct Jacobi {
  const double alpha;
  const double beta;

  inline double seed(const double x) const {
    return (alpha + beta + 2.0) * (x - 1.0) / (2.0 * (alpha + 1.0));
  }

  inline void coefficients(const double k, const double x, double &A,
                           double &B) const {
    const double t = 2.0 * k + alpha + beta;
    const double denominator =
        2.0 * (k + alpha + 1.0) * (k + alpha + beta + 1.0) * t;
    A = t * (t + 1.0) * (t + 2.0) * (x - 1.0) / denominator;
    B = 2.0 * k * (k + beta) * (t + 2.0) / denominator;
  }
};

/**
 *  Gegenbauer C_n^(alpha), normalised by binom(n + 2 alpha - 1, n).
 */
struct Gegenbauer {
  const double alpha;

  inline double seed(const double x) const { return x - 1.0; }

  inline void coefficients(const double k, const double x, double &A,
                           double &B) const {
    A = (2.0 * (k + alpha) / (k + 2.0 * alpha)) * (x - 1.0);
    B = k / (k + 2.0 * alpha);
  }
};

/**
 *  Legendre P_n, no normalisation.
 */
struct Legendre {
  inline double seed(const double x) const { return x - 1.0; }

  inline void coefficients(const double k, const double x, double &A,
                           double &B) const {
    A = ((2.0 * k + 1.0) / (k + 1.0)) * (x - 1.0);
    B = k / (k + 1.0);
  }
};

/**
 *  Generalised Laguerre L_n^(alpha), normalised by binom(n + alpha, n).
 */
struct GeneralizedLaguerre {
  const double alpha;

  inline double seed(const double x) const { return -x / (alpha + 1.0); }

  inline void coefficients(const double k, const double x, double &A,
                           double &B) const {
    A = -x / (k + alpha + 1.0);
    B = k / (k + alpha + 1.0);
  }
};

} // namespace Recurrence

} // namespace OrthoPoly

#endif
