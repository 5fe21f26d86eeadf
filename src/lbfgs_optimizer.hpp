/**
 * lbfgs_optimizer.hpp
 *
 * Limited-memory BFGS on top of libLBFGS.  A nonzero `l1Weight` switches
 * libLBFGS into OWL-QN so that an L1 penalty can be added to any smooth
 * objective.
 */
#ifndef LBFGS_OPTIMIZER_HPP
#define LBFGS_OPTIMIZER_HPP

#include <armadillo>
#include <lbfgs.h>
#include "optimizer_state.hpp"

namespace normglm {

/**
 * ObjectiveType must provide
 *
 *   size_t DomainDimension() const;
 *   double EvaluateWithGradient(const arma::vec& x, arma::vec& g) const;
 *
 * Convergence is declared when ||g|| / max(||x||, 1) < tolerance or when the
 * objective changes by a relative amount smaller than `tolerance` over one
 * iteration.  A non-finite objective value or gradient at any trial point ends
 * the run in the FAILED state, keeping the last finite iterate.
 */
class LBFGS
{
 public:
  LBFGS(const size_t numCorrections = 10,
        const size_t maxNumIterations = 100,
        const double tolerance = 1e-6);

  template<typename ObjectiveType>
  OptimizerState Optimize(const ObjectiveType& objective,
                          const arma::vec& initial) const;

  // Parameters.
  size_t numCorrections;
  size_t maxNumIterations;
  size_t maxLineSearch;
  double tolerance;
  double l1Weight;
  bool verbose;
  bool trackState;
};

} // namespace normglm

#include "lbfgs_optimizer_impl.hpp"

#endif
