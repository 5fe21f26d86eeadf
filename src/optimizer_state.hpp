/**
 * optimizer_state.hpp
 *
 * State shared by the LBFGS and TRON optimizers.
 */
#ifndef OPTIMIZER_STATE_HPP
#define OPTIMIZER_STATE_HPP

#include <armadillo>
#include <string>
#include <vector>

namespace normglm {

// INIT -> ITERATING -> {CONVERGED | MAX_ITERATIONS | FAILED}.
enum class OptimizerStatus
{
  INIT,
  ITERATING,
  CONVERGED,
  MAX_ITERATIONS,
  FAILED
};

enum class ConvergenceReason
{
  NONE,
  GRADIENT_CONVERGED,
  FUNCTION_VALUES_CONVERGED,
  REDUCTION_NEGLIGIBLE,
  MAX_ITERATIONS_REACHED,
  NON_FINITE_VALUE,
  LINE_SEARCH_FAILURE,
  SUBPROBLEM_FAILURE
};

inline std::string ToString(const OptimizerStatus status)
{
  switch (status)
  {
    case OptimizerStatus::INIT: return "init";
    case OptimizerStatus::ITERATING: return "iterating";
    case OptimizerStatus::CONVERGED: return "converged";
    case OptimizerStatus::MAX_ITERATIONS: return "max_iterations";
    case OptimizerStatus::FAILED: return "failed";
  }

  return "unknown";
}

inline std::string ToString(const ConvergenceReason reason)
{
  switch (reason)
  {
    case ConvergenceReason::NONE: return "none";
    case ConvergenceReason::GRADIENT_CONVERGED: return "gradient_converged";
    case ConvergenceReason::FUNCTION_VALUES_CONVERGED:
      return "function_values_converged";
    case ConvergenceReason::REDUCTION_NEGLIGIBLE: return "reduction_negligible";
    case ConvergenceReason::MAX_ITERATIONS_REACHED:
      return "max_iterations_reached";
    case ConvergenceReason::NON_FINITE_VALUE: return "non_finite_value";
    case ConvergenceReason::LINE_SEARCH_FAILURE: return "line_search_failure";
    case ConvergenceReason::SUBPROBLEM_FAILURE: return "subproblem_failure";
  }

  return "unknown";
}

// One row of the optional per-iteration history.
struct IterationRecord
{
  size_t iteration;
  double objectiveValue;
  double gradientNorm;
};

/**
 * The result of an optimizer run.  On failure, `coefficients` holds the last
 * point with a finite objective value.
 */
struct OptimizerState
{
  OptimizerStatus status;
  ConvergenceReason convergenceReason;
  arma::vec coefficients;
  arma::vec gradient;
  double objectiveValue;
  size_t iterationCount;

  // Filled only when the optimizer's `trackState` is set.
  std::vector<IterationRecord> history;

  OptimizerState() :
      status(OptimizerStatus::INIT),
      convergenceReason(ConvergenceReason::NONE),
      objectiveValue(0.0),
      iterationCount(0) { }

  bool Failed() const { return status == OptimizerStatus::FAILED; }

  void Record()
  {
    IterationRecord r;
    r.iteration = iterationCount;
    r.objectiveValue = objectiveValue;
    r.gradientNorm = arma::norm(gradient, 2);
    history.push_back(r);
  }
};

} // namespace normglm

#endif
