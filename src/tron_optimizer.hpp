/**
 * tron_optimizer.hpp
 *
 * Trust-region Newton method (TRON) for smooth convex objectives, following
 * Lin, Weng and Keerthi, "Trust region Newton method for large-scale logistic
 * regression" (JMLR 2008), the solver that LIBLINEAR ships.
 */
#ifndef TRON_OPTIMIZER_HPP
#define TRON_OPTIMIZER_HPP

#include <armadillo>
#include "optimizer_state.hpp"

namespace normglm {

/**
 * ObjectiveType must provide
 *
 *   size_t DomainDimension() const;
 *   double Evaluate(const arma::vec& x) const;
 *   double EvaluateWithGradient(const arma::vec& x, arma::vec& g) const;
 *   void HessianVector(const arma::vec& x, const arma::vec& v,
 *                      arma::vec& hv) const;
 *
 * Each outer iteration approximately solves the trust-region subproblem with
 * conjugate gradient, then accepts or rejects the step by the ratio of actual
 * to predicted reduction.  Only accepted steps count as iterations.
 */
class TRON
{
 public:
  TRON(const size_t maxNumIterations = 100, const double tolerance = 1e-6);

  template<typename ObjectiveType>
  OptimizerState Optimize(const ObjectiveType& objective,
                          const arma::vec& initial) const;

  // Parameters.
  size_t maxNumIterations;
  size_t maxNumCGIterations;
  size_t maxNumRejections;
  double tolerance;
  double cgTolerance;
  bool verbose;
  bool trackState;

 private:
  /**
   * Truncated CG on H s = -g within ||s|| <= delta.  On return `r` holds the
   * residual -g - H s.  Returns the number of CG iterations.
   */
  template<typename ObjectiveType>
  size_t SolveSubproblem(const ObjectiveType& objective,
                         const arma::vec& w,
                         const arma::vec& g,
                         const double delta,
                         arma::vec& s,
                         arma::vec& r,
                         bool& nonFinite) const;
};

} // namespace normglm

#include "tron_optimizer_impl.hpp"

#endif
