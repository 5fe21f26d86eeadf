/**
 * loss_functions.hpp
 *
 * Pointwise losses for generalized linear models.  Each loss is a stateless
 * class with static functions of the label y and the margin z (the linear
 * predictor plus offset):
 *
 *   Loss(y, z)            value
 *   Derivative(y, z)      d/dz
 *   SecondDerivative(y, z) d^2/dz^2
 *   Mean(z)               inverse link, used for prediction
 */
#ifndef LOSS_FUNCTIONS_HPP
#define LOSS_FUNCTIONS_HPP

#include <cmath>

namespace normglm {

// log(1 + exp(s)) without overflow for large s.
inline double log1p_exp(const double s)
{
  if (s < 0)
    return std::log1p(std::exp(s));
  else
    return s + std::log1p(std::exp(-s)); // avoid overflow
}

// 1 / (1 + exp(-s)), stable for large |s|.
inline double sigmoid(const double s)
{
  if (s >= 0)
    return 1.0 / (1.0 + std::exp(-s));

  const double e = std::exp(s);
  return e / (1.0 + e);
}

/**
 * Logistic loss with labels in {0, 1}: log(1 + e^z) - y z.
 */
class LogisticLoss
{
 public:
  static const char* Name() { return "logistic"; }

  static double Loss(const double y, const double z)
  {
    return log1p_exp(z) - y * z;
  }

  static double Derivative(const double y, const double z)
  {
    return sigmoid(z) - y;
  }

  static double SecondDerivative(const double /* y */, const double z)
  {
    const double p = sigmoid(z);
    return p * (1.0 - p);
  }

  static double Mean(const double z) { return sigmoid(z); }
};

/**
 * Squared loss for linear regression: (z - y)^2 / 2.
 */
class SquaredLoss
{
 public:
  static const char* Name() { return "linear"; }

  static double Loss(const double y, const double z)
  {
    const double r = z - y;
    return 0.5 * r * r;
  }

  static double Derivative(const double y, const double z) { return z - y; }

  static double SecondDerivative(const double /* y */, const double /* z */)
  {
    return 1.0;
  }

  static double Mean(const double z) { return z; }
};

/**
 * Poisson negative log-likelihood (up to a constant) with log link:
 * e^z - y z.
 */
class PoissonLoss
{
 public:
  static const char* Name() { return "poisson"; }

  static double Loss(const double y, const double z)
  {
    return std::exp(z) - y * z;
  }

  static double Derivative(const double y, const double z)
  {
    return std::exp(z) - y;
  }

  static double SecondDerivative(const double /* y */, const double z)
  {
    return std::exp(z);
  }

  static double Mean(const double z) { return std::exp(z); }
};

} // namespace normglm

#endif
