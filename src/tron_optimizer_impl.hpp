/**
 * tron_optimizer_impl.hpp
 *
 * Implementation of TRON.
 */
#ifndef TRON_OPTIMIZER_IMPL_HPP
#define TRON_OPTIMIZER_IMPL_HPP

#include "tron_optimizer.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace normglm {

inline TRON::TRON(const size_t maxNumIterations, const double tolerance) :
    maxNumIterations(maxNumIterations),
    maxNumCGIterations(100),
    maxNumRejections(10),
    tolerance(tolerance),
    cgTolerance(0.1),
    verbose(false),
    trackState(false)
{
  // Nothing else to do.
}

// Step length along d from s to the boundary ||s + alpha d|| = delta.
inline double BoundaryStep(const arma::vec& s,
                           const arma::vec& d,
                           const double delta)
{
  const double sd = arma::dot(s, d);
  const double sts = arma::dot(s, s);
  const double dtd = arma::dot(d, d);
  const double dsq = delta * delta;
  const double rad = std::sqrt(sd * sd + dtd * (dsq - sts));
  if (sd >= 0)
    return (dsq - sts) / (sd + rad);
  else
    return (rad - sd) / dtd;
}

template<typename ObjectiveType>
size_t TRON::SolveSubproblem(const ObjectiveType& objective,
                             const arma::vec& w,
                             const arma::vec& g,
                             const double delta,
                             arma::vec& s,
                             arma::vec& r,
                             bool& nonFinite) const
{
  s.zeros(g.n_elem);
  r = -g;
  arma::vec d = r;
  arma::vec hd;

  const double cgtol = cgTolerance * arma::norm(g, 2);
  double rTr = arma::dot(r, r);
  size_t cgIter = 0;
  while (arma::norm(r, 2) > cgtol && cgIter < maxNumCGIterations)
  {
    ++cgIter;
    objective.HessianVector(w, d, hd);
    if (!hd.is_finite())
    {
      nonFinite = true;
      return cgIter;
    }

    const double dHd = arma::dot(d, hd);
    if (dHd <= 0)
    {
      // No positive curvature along d; go to the boundary.
      const double alpha = BoundaryStep(s, d, delta);
      s += alpha * d;
      r -= alpha * hd;
      break;
    }

    double alpha = rTr / dHd;
    s += alpha * d;
    if (arma::norm(s, 2) > delta)
    {
      if (verbose)
        std::cout << "TRON: CG reaches trust region boundary." << std::endl;

      s -= alpha * d;
      alpha = BoundaryStep(s, d, delta);
      s += alpha * d;
      r -= alpha * hd;
      break;
    }

    r -= alpha * hd;
    const double rnewTrnew = arma::dot(r, r);
    const double beta = rnewTrnew / rTr;
    d = r + beta * d;
    rTr = rnewTrnew;
  }

  return cgIter;
}

template<typename ObjectiveType>
OptimizerState TRON::Optimize(const ObjectiveType& objective,
                              const arma::vec& initial) const
{
  CheckDimension("TRON::Optimize()", objective.DomainDimension(),
      initial.n_elem);

  if (maxNumIterations == 0 || maxNumCGIterations == 0)
  {
    throw std::invalid_argument("TRON::Optimize(): maxNumIterations and "
                                "maxNumCGIterations must be positive");
  }

  const double eta0 = 1e-4, eta1 = 0.25, eta2 = 0.75;
  const double sigma1 = 0.25, sigma2 = 0.5, sigma3 = 4;

  arma::wall_clock c;
  c.tic();

  OptimizerState state;
  state.coefficients = initial;
  state.objectiveValue = objective.EvaluateWithGradient(state.coefficients,
      state.gradient);
  if (!std::isfinite(state.objectiveValue) || !state.gradient.is_finite())
  {
    state.status = OptimizerStatus::FAILED;
    state.convergenceReason = ConvergenceReason::NON_FINITE_VALUE;
    return state;
  }

  state.status = OptimizerStatus::ITERATING;
  if (trackState)
    state.Record();

  double delta = arma::norm(state.gradient, 2);
  const double gnorm0 = delta;
  double gnorm = gnorm0;
  if (gnorm0 == 0.0)
  {
    state.status = OptimizerStatus::CONVERGED;
    state.convergenceReason = ConvergenceReason::GRADIENT_CONVERGED;
    return state;
  }

  arma::vec s, r, wNew, gNew;
  bool firstStep = true;
  size_t rejections = 0;
  while (state.status == OptimizerStatus::ITERATING)
  {
    if (state.iterationCount >= maxNumIterations)
    {
      state.status = OptimizerStatus::MAX_ITERATIONS;
      state.convergenceReason = ConvergenceReason::MAX_ITERATIONS_REACHED;
      break;
    }

    bool nonFinite = false;
    const size_t cgIter = SolveSubproblem(objective, state.coefficients,
        state.gradient, delta, s, r, nonFinite);
    if (nonFinite)
    {
      state.status = OptimizerStatus::FAILED;
      state.convergenceReason = ConvergenceReason::NON_FINITE_VALUE;
      break;
    }

    wNew = state.coefficients + s;
    const double gs = arma::dot(state.gradient, s);
    const double prered = -0.5 * (gs - arma::dot(s, r));
    const double fNew = objective.Evaluate(wNew);
    if (!std::isfinite(fNew))
    {
      state.status = OptimizerStatus::FAILED;
      state.convergenceReason = ConvergenceReason::NON_FINITE_VALUE;
      break;
    }

    const double f = state.objectiveValue;
    const double actred = f - fNew;

    // On the first iteration, adjust the initial step bound.
    const double snorm = arma::norm(s, 2);
    if (firstStep)
    {
      delta = std::min(delta, snorm);
      firstStep = false;
    }

    // Prediction alpha * snorm of the step.
    double alpha;
    if (fNew - f - gs <= 0)
      alpha = sigma3;
    else
      alpha = std::max(sigma1, -0.5 * (gs / (fNew - f - gs)));

    // Update the radius by the ratio of actual to predicted reduction.
    if (actred < eta0 * prered)
      delta = std::min(std::max(alpha, sigma1) * snorm, sigma2 * delta);
    else if (actred < eta1 * prered)
      delta = std::max(sigma1 * delta, std::min(alpha * snorm, sigma2 * delta));
    else if (actred < eta2 * prered)
      delta = std::max(sigma1 * delta, std::min(alpha * snorm, sigma3 * delta));
    else
      delta = std::max(delta, std::min(alpha * snorm, sigma3 * delta));

    if (verbose)
    {
      std::cout << "TRON iteration " << state.iterationCount + 1 << ": act "
          << actred << " pre " << prered << " delta " << delta << " f " << f
          << " |g| " << gnorm << " CG " << cgIter << std::endl;
    }

    if (actred > eta0 * prered)
    {
      const double value = objective.EvaluateWithGradient(wNew, gNew);
      if (!std::isfinite(value) || !gNew.is_finite())
      {
        state.status = OptimizerStatus::FAILED;
        state.convergenceReason = ConvergenceReason::NON_FINITE_VALUE;
        break;
      }

      rejections = 0;
      ++state.iterationCount;
      state.coefficients = wNew;
      state.gradient = gNew;
      state.objectiveValue = value;
      if (trackState)
        state.Record();

      gnorm = arma::norm(state.gradient, 2);
      if (gnorm <= tolerance * gnorm0)
      {
        state.status = OptimizerStatus::CONVERGED;
        state.convergenceReason = ConvergenceReason::GRADIENT_CONVERGED;
        break;
      }

      if (std::abs(actred) < tolerance * std::max(std::abs(f), 1e-300))
      {
        state.status = OptimizerStatus::CONVERGED;
        state.convergenceReason = ConvergenceReason::FUNCTION_VALUES_CONVERGED;
        break;
      }
    }
    else if (++rejections > maxNumRejections)
    {
      state.status = OptimizerStatus::FAILED;
      state.convergenceReason = ConvergenceReason::SUBPROBLEM_FAILURE;
      break;
    }

    if (prered <= 0)
    {
      state.status = OptimizerStatus::FAILED;
      state.convergenceReason = ConvergenceReason::SUBPROBLEM_FAILURE;
      break;
    }

    const double fAbs = std::abs(state.objectiveValue);
    if (std::abs(actred) <= 1.0e-12 * fAbs && std::abs(prered) <= 1.0e-12 * fAbs)
    {
      state.status = OptimizerStatus::CONVERGED;
      state.convergenceReason = ConvergenceReason::REDUCTION_NEGLIGIBLE;
      break;
    }
  }

  if (verbose)
  {
    std::cout << "TRON finished after " << state.iterationCount
        << " iterations (" << ToString(state.status) << ", "
        << ToString(state.convergenceReason) << ") with objective "
        << state.objectiveValue << " in " << c.toc() << "s." << std::endl;
  }

  return state;
}

} // namespace normglm

#endif
