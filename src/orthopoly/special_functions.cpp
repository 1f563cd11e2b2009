#include <orthopoly/special_functions.hpp>

#include <limits>

#include <boost/math/special_functions/gamma.hpp>

namespace OrthoPoly {

double gamma(const double x) {
  return boost::math::tgamma(x, special_policy());
}

double log_abs_gamma(const double x) {
  if (is_nonpositive_integer(x)) {
    return std::numeric_limits<double>::infinity();
  }
  return boost::math::lgamma(x, special_policy());
}

double gamma_sign(const double x) {
  if (std::isnan(x)) {
    return x;
  }
  if (x > 0.0) {
    return 1.0;
  }
  const double fx = std::floor(x);
  if (x - fx == 0.0) {
    return 0.0;
  }
  // Gamma alternates sign between consecutive negative integers
  return (std::fmod(fx, 2.0) != 0.0) ? -1.0 : 1.0;
}

double reciprocal_gamma(const double x) {
  if (is_nonpositive_integer(x)) {
    return 0.0;
  }
  return 1.0 / gamma(x);
}

double binom(const double n, const double k) {
  const double sign =
      gamma_sign(n + 1.0) * gamma_sign(k + 1.0) * gamma_sign(n - k + 1.0);
  return sign * std::exp(log_abs_gamma(n + 1.0) - log_abs_gamma(k + 1.0) -
                         log_abs_gamma(n - k + 1.0));
}

double inverse_beta(const double a, const double b) {
  const double sign = gamma_sign(a + b) * gamma_sign(a) * gamma_sign(b);
  return sign * std::exp(log_abs_gamma(a + b) - log_abs_gamma(a) -
                         log_abs_gamma(b));
}

} // namespace OrthoPoly
