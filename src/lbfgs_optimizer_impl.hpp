/**
 * lbfgs_optimizer_impl.hpp
 *
 * Implementation of the libLBFGS driver.
 */
#ifndef LBFGS_OPTIMIZER_IMPL_HPP
#define LBFGS_OPTIMIZER_IMPL_HPP

#include "lbfgs_optimizer.hpp"
#include "exceptions.hpp"
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <new>

namespace normglm {

// Everything the libLBFGS callbacks need to see.
template<typename ObjectiveType>
struct LBFGSInfo
{
  const ObjectiveType* objective;
  OptimizerState* state;
  double l1Weight;
  bool verbose;
  bool trackState;
  size_t evaluations;
  bool nonFinite;
  std::exception_ptr error;
};

template<typename ObjectiveType>
static lbfgsfloatval_t LBFGSEvaluate(void* instance,
                                     const lbfgsfloatval_t* x,
                                     lbfgsfloatval_t* g,
                                     const int n,
                                     const lbfgsfloatval_t /* step */)
{
  LBFGSInfo<ObjectiveType>* info = (LBFGSInfo<ObjectiveType>*) instance;
  arma::vec gradient(g, n, false, true); // alias

  // Once the run is known to fail, only wait for libLBFGS to return.
  if (info->error || info->nonFinite)
  {
    gradient.zeros();
    return std::numeric_limits<double>::quiet_NaN();
  }

  try
  {
    const arma::vec coordinates((double*) x, n, false, true); // alias
    const double value = info->objective->EvaluateWithGradient(coordinates,
        gradient);

    if (!std::isfinite(value) || !gradient.is_finite())
      info->nonFinite = true;

    if (info->evaluations == 0)
    {
      // The starting point is the first valid iterate.
      OptimizerState& state = *info->state;
      state.coefficients = coordinates;
      state.gradient = gradient;
      state.objectiveValue = value + info->l1Weight *
          arma::norm(coordinates, 1);
      if (info->trackState && !info->nonFinite)
        state.Record();
    }

    ++info->evaluations;
    return value;
  }
  catch (...)
  {
    // Exceptions must not cross the C library; rethrown after lbfgs().
    info->error = std::current_exception();
    gradient.zeros();
    return std::numeric_limits<double>::quiet_NaN();
  }
}

template<typename ObjectiveType>
static int LBFGSProgress(void* instance,
                         const lbfgsfloatval_t* x,
                         const lbfgsfloatval_t* g,
                         const lbfgsfloatval_t fx,
                         const lbfgsfloatval_t /* xnorm */,
                         const lbfgsfloatval_t gnorm,
                         const lbfgsfloatval_t step,
                         int n,
                         int k,
                         int ls)
{
  LBFGSInfo<ObjectiveType>* info = (LBFGSInfo<ObjectiveType>*) instance;

  // A nonzero return value cancels the optimization.
  if (info->error || info->nonFinite)
    return 1;

  OptimizerState& state = *info->state;
  state.coefficients = arma::vec(x, n);
  state.gradient = arma::vec(g, n);
  state.objectiveValue = fx;
  state.iterationCount = (size_t) k;
  if (info->trackState)
    state.Record();

  if (info->verbose)
  {
    std::cout << "LBFGS iteration " << k << ": objective " << fx
        << ", ||g|| " << gnorm << ", step " << step << ", " << ls
        << " evaluations." << std::endl;
  }

  return 0;
}

inline LBFGS::LBFGS(const size_t numCorrections,
                    const size_t maxNumIterations,
                    const double tolerance) :
    numCorrections(numCorrections),
    maxNumIterations(maxNumIterations),
    maxLineSearch(40),
    tolerance(tolerance),
    l1Weight(0.0),
    verbose(false),
    trackState(false)
{
  // Nothing else to do.
}

template<typename ObjectiveType>
OptimizerState LBFGS::Optimize(const ObjectiveType& objective,
                               const arma::vec& initial) const
{
  CheckDimension("LBFGS::Optimize()", objective.DomainDimension(),
      initial.n_elem);

  // libLBFGS reads max_iterations == 0 as no limit.
  if (numCorrections == 0 || maxLineSearch == 0 || maxNumIterations == 0)
  {
    throw std::invalid_argument("LBFGS::Optimize(): numCorrections, "
                                "maxNumIterations and maxLineSearch must be "
                                "positive");
  }
  if (l1Weight < 0.0)
  {
    std::ostringstream oss;
    oss << "LBFGS::Optimize(): L1 weight must be nonnegative (got "
        << l1Weight << ")";
    throw std::invalid_argument(oss.str());
  }

  arma::wall_clock c;
  c.tic();

  OptimizerState state;
  state.coefficients = initial;
  state.status = OptimizerStatus::ITERATING;

  const int n = (int) initial.n_elem;
  lbfgsfloatval_t* x = lbfgs_malloc(n);
  if (x == NULL)
    throw std::bad_alloc();
  for (int j = 0; j < n; ++j)
    x[j] = initial[j];

  lbfgs_parameter_t param;
  lbfgs_parameter_init(&param);
  param.m = (int) numCorrections;
  param.epsilon = tolerance;
  param.past = 1;
  param.delta = tolerance;
  param.max_iterations = (int) maxNumIterations;
  param.max_linesearch = (int) maxLineSearch;
  if (l1Weight > 0.0)
  {
    param.orthantwise_c = l1Weight;
    param.linesearch = LBFGS_LINESEARCH_BACKTRACKING; // required by OWL-QN
    param.orthantwise_start = 0;
    param.orthantwise_end = n;
  }

  LBFGSInfo<ObjectiveType> info;
  info.objective = &objective;
  info.state = &state;
  info.l1Weight = l1Weight;
  info.verbose = verbose;
  info.trackState = trackState;
  info.evaluations = 0;
  info.nonFinite = false;

  lbfgsfloatval_t fx = 0;
  const int ret = lbfgs(n, x, &fx, LBFGSEvaluate<ObjectiveType>,
      LBFGSProgress<ObjectiveType>, &info, &param);
  lbfgs_free(x);

  if (info.error)
    std::rethrow_exception(info.error);

  if (info.nonFinite)
  {
    state.status = OptimizerStatus::FAILED;
    state.convergenceReason = ConvergenceReason::NON_FINITE_VALUE;
  }
  else
  {
    switch (ret)
    {
      case LBFGS_SUCCESS:
      case LBFGS_ALREADY_MINIMIZED:
        state.status = OptimizerStatus::CONVERGED;
        state.convergenceReason = ConvergenceReason::GRADIENT_CONVERGED;
        break;

      case LBFGS_STOP:
        state.status = OptimizerStatus::CONVERGED;
        state.convergenceReason = ConvergenceReason::FUNCTION_VALUES_CONVERGED;
        break;

      case LBFGSERR_MAXIMUMITERATION:
        state.status = OptimizerStatus::MAX_ITERATIONS;
        state.convergenceReason = ConvergenceReason::MAX_ITERATIONS_REACHED;
        break;

      // libLBFGS restores the previous iterate after a failed line search.
      case LBFGSERR_MAXIMUMLINESEARCH:
      case LBFGSERR_ROUNDING_ERROR:
      case LBFGSERR_MINIMUMSTEP:
      case LBFGSERR_MAXIMUMSTEP:
      case LBFGSERR_WIDTHTOOSMALL:
      case LBFGSERR_INCREASEGRADIENT:
      case LBFGSERR_OUTOFINTERVAL:
      case LBFGSERR_INCORRECT_TMINMAX:
        state.status = OptimizerStatus::FAILED;
        state.convergenceReason = ConvergenceReason::LINE_SEARCH_FAILURE;
        break;

      default:
      {
        std::ostringstream oss;
        oss << "LBFGS::Optimize(): libLBFGS returned error code " << ret;
        throw std::runtime_error(oss.str());
      }
    }
  }

  if (verbose)
  {
    std::cout << "LBFGS finished after " << state.iterationCount
        << " iterations (" << ToString(state.status) << ", "
        << ToString(state.convergenceReason) << ") with objective "
        << state.objectiveValue << " in " << c.toc() << "s." << std::endl;
  }

  return state;
}

} // namespace normglm

#endif
