#include <orthopoly/hypergeometric.hpp>

#include <cmath>
#include <complex>
#include <gtest/gtest.h>

using namespace OrthoPoly;

namespace {

// 2F1(1, 1; 2; z) = -log(1 - z) / z
Complex log_form(const Complex z) { return -std::log(1.0 - z) / z; }

} // namespace

TEST(Hypergeometric, RealTerminating) {
  // 2F1(-2, b; c; z) = 1 - 2bz/c + b(b+1)z^2/(c(c+1))
  const double b = 3.7;
  const double c = 1.4;
  for (const double z : {-2.0, -0.5, 0.0, 0.5, 1.0, 3.0}) {
    const double correct =
        1.0 - 2.0 * b * z / c + b * (b + 1.0) * z * z / (c * (c + 1.0));
    ASSERT_NEAR(hyp2f1(-2.0, b, c, z), correct, 1.0e-12);
  }

  // 1F1(-2; c; z) = 1 - 2z/c + z^2/(c(c+1))
  for (const double z : {-3.0, 0.0, 0.25, 4.0}) {
    const double correct = 1.0 - 2.0 * z / c + z * z / (c * (c + 1.0));
    ASSERT_NEAR(hyp1f1(-2.0, c, z), correct, 1.0e-12);
  }
}

TEST(Hypergeometric, TerminatingNearOne) {
  // Chu-Vandermonde: 2F1(-m, b; c; 1) = (c - b)_m / (c)_m, so that
  // 2F1(-20, 21; 1; 1) = P_20(-1) = 1 and 2F1(-20, 20; 1/2; 1) = T_20(-1) = 1
  ASSERT_NEAR(hyp2f1(-20.0, 21.0, 1.0, 1.0), 1.0, 1.0e-12);
  ASSERT_NEAR(hyp2f1(-20.0, 20.0, 0.5, 1.0), 1.0, 1.0e-12);
  ASSERT_LT(minimum_absrel_error(Complex(1.0, 0.0),
                                 hyp2f1(-20.0, 21.0, 1.0, Complex(1.0, 0.0))),
            1.0e-12);

  // T_20(cos t) = cos(20 t) with z = (1 - cos t) / 2 = sin(t / 2)^2
  for (const double t : {2.5, 2.9, 3.1}) {
    const double z = std::sin(0.5 * t) * std::sin(0.5 * t);
    ASSERT_NEAR(hyp2f1(-20.0, 20.0, 0.5, z), std::cos(20.0 * t), 1.0e-10);
  }
}

TEST(Hypergeometric, RealClosedForms) {
  for (const double z : {-0.8, -0.2, 0.3, 0.6}) {
    ASSERT_NEAR(hyp2f1(1.0, 1.0, 2.0, z), -std::log(1.0 - z) / z, 1.0e-13);
  }
  for (const double z : {-2.0, 0.5, 3.0}) {
    ASSERT_NEAR(hyp1f1(1.3, 1.3, z), std::exp(z), 1.0e-12 * std::exp(z));
  }
}

TEST(Hypergeometric, ComplexSeriesRegions) {
  // inside the disc of the direct series
  const Complex z0(0.3, 0.2);
  ASSERT_LT(relative_error(log_form(z0), hyp2f1(1.0, 1.0, 2.0, z0)), 1.0e-13);

  // Pfaff transformation, |z| > 1 with Re(z) < 1/2
  const Complex z1(-3.0, 1.0);
  ASSERT_LT(relative_error(log_form(z1), hyp2f1(1.0, 1.0, 2.0, z1)), 1.0e-13);

  // annulus 0.9 < |z| < 1 with integer c - a - b: slow direct series
  const Complex z2(0.85, 0.3);
  ASSERT_LT(relative_error(log_form(z2), hyp2f1(1.0, 1.0, 2.0, z2)), 1.0e-11);

  // 2F1(a, b; b; z) = (1 - z)^(-a)
  const double a = 0.3;
  const double b = 1.7;

  // connection formula in 1 - z
  const Complex z3(0.95, 0.05);
  ASSERT_LT(relative_error(std::pow(1.0 - z3, -a), hyp2f1(a, b, b, z3)),
            1.0e-12);

  // connection formula in 1 / z
  const Complex z4(2.0, 1.0);
  ASSERT_LT(relative_error(std::pow(1.0 - z4, -a), hyp2f1(a, b, b, z4)),
            1.0e-12);
}

TEST(Hypergeometric, ComplexTerminating) {
  const double b = 3.7;
  const double c = 1.4;
  for (const Complex z : {Complex(5.0, -2.0), Complex(0.1, 0.1),
                          Complex(1.0, 0.0), Complex(-7.0, 3.0)}) {
    const Complex correct =
        1.0 - 2.0 * b * z / c + b * (b + 1.0) * z * z / (c * (c + 1.0));
    ASSERT_LT(minimum_absrel_error(correct, hyp2f1(-2.0, b, c, z)), 1.0e-13);
  }
}

TEST(Hypergeometric, ComplexMatchesReal) {
  for (const double x : {-0.7, -0.1, 0.2, 0.8}) {
    const double real = hyp2f1(0.3, 0.7, 1.9, x);
    const Complex cplx = hyp2f1(0.3, 0.7, 1.9, Complex(x, 0.0));
    ASSERT_LT(relative_error(real, cplx.real()), 1.0e-12);
    ASSERT_NEAR(cplx.imag(), 0.0, 1.0e-14);
  }
  for (const double x : {-4.0, -0.5, 0.5, 3.0}) {
    const double real = hyp1f1(0.4, 1.6, x);
    const Complex cplx = hyp1f1(0.4, 1.6, Complex(x, 0.0));
    ASSERT_LT(relative_error(real, cplx.real()), 1.0e-12);
    ASSERT_NEAR(cplx.imag(), 0.0, 1.0e-14);
  }
}

TEST(Hypergeometric, ComplexConfluent) {
  // 1F1(a; a; z) = exp(z), either side of the Kummer transformation
  for (const Complex z : {Complex(2.0, 1.0), Complex(-3.0, 0.5)}) {
    ASSERT_LT(relative_error(std::exp(z), hyp1f1(0.6, 0.6, z)), 1.0e-13);
  }
  // 1F1(1; 2; z) = (exp(z) - 1) / z
  for (const Complex z : {Complex(1.5, -2.0), Complex(-4.0, 1.0)}) {
    ASSERT_LT(relative_error((std::exp(z) - 1.0) / z, hyp1f1(1.0, 2.0, z)),
              1.0e-13);
  }
}

TEST(Hypergeometric, ComplexDegenerate) {
  // c a pole of the series before termination
  ASSERT_TRUE(std::isnan(hyp2f1(1.0, 1.0, -2.0, Complex(0.2, 0.1)).real()));
  ASSERT_TRUE(std::isnan(hyp1f1(1.0, -1.0, Complex(0.2, 0.1)).real()));
  // Gauss's sum at z = 1 diverges for c - a - b <= 0
  ASSERT_TRUE(std::isnan(hyp2f1(1.0, 1.0, 2.0, Complex(1.0, 0.0)).real()));
  // Gauss's sum at z = 1
  const Complex gauss = hyp2f1(0.5, 0.25, 2.0, Complex(1.0, 0.0));
  ASSERT_NEAR(gauss.real(),
              OrthoPoly::gamma(2.0) * OrthoPoly::gamma(1.25) /
                  (OrthoPoly::gamma(1.5) * OrthoPoly::gamma(1.75)),
              1.0e-14);
}
