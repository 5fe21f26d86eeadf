/**
 * glm_training_impl.hpp
 *
 * Implementation of GLMTrainer.
 */
#ifndef GLM_TRAINING_IMPL_HPP
#define GLM_TRAINING_IMPL_HPP

#include "glm_training.hpp"
#include "glm_objective.hpp"
#include "coefficient_transform.hpp"
#include "lbfgs_optimizer.hpp"
#include "tron_optimizer.hpp"
#include "exceptions.hpp"
#include "mpi/mpi_utils.hpp"
#include <iostream>

namespace normglm {

inline std::string ToString(const OptimizerType optimizer)
{
  switch (optimizer)
  {
    case OptimizerType::LBFGS:
      return "lbfgs";
    case OptimizerType::TRON:
      return "tron";
  }

  return "unknown";
}

inline OptimizerType OptimizerTypeFromString(const std::string& name)
{
  if (name == "lbfgs")
    return OptimizerType::LBFGS;
  else if (name == "tron")
    return OptimizerType::TRON;

  std::ostringstream oss;
  oss << "unknown optimizer '" << name << "'; expected 'lbfgs' or 'tron'";
  throw std::invalid_argument(oss.str());
}

inline GLMTrainer::GLMTrainer(const TaskType task,
                              const OptimizerType optimizer) :
    task(task),
    optimizer(optimizer),
    l1Weight(0.0),
    warmStart(true),
    treeAggregateDepth(2),
    maxNumIterations(100),
    tolerance(1e-6),
    numCorrections(10),
    keepFailedModels(false),
    trackState(false),
    verbose(false)
{
  // Nothing else to do.
}

template<typename MatType>
std::vector<TrainedModel> GLMTrainer::Train(
    const PartitionedDataset<MatType>& dataset,
    const NormalizationContext& context,
    const std::vector<double>& l2Weights) const
{
  if (l2Weights.empty())
  {
    throw std::invalid_argument("GLMTrainer::Train(): at least one "
                                "regularization weight is required");
  }

  if (optimizer == OptimizerType::TRON && l1Weight != 0.0)
  {
    throw std::invalid_argument("GLMTrainer::Train(): TRON cannot optimize "
                                "an L1 penalty; use LBFGS");
  }

  switch (task)
  {
    case TaskType::LOGISTIC_REGRESSION:
      return TrainWithLoss<LogisticLoss>(dataset, context, l2Weights);
    case TaskType::LINEAR_REGRESSION:
      return TrainWithLoss<SquaredLoss>(dataset, context, l2Weights);
    case TaskType::POISSON_REGRESSION:
      return TrainWithLoss<PoissonLoss>(dataset, context, l2Weights);
  }

  throw std::invalid_argument("GLMTrainer::Train(): unknown task type");
}

template<typename LossType, typename MatType>
std::vector<TrainedModel> GLMTrainer::TrainWithLoss(
    const PartitionedDataset<MatType>& dataset,
    const NormalizationContext& context,
    const std::vector<double>& l2Weights) const
{
  const CoefficientSpaceTransform transform(context);
  std::vector<TrainedModel> models;
  models.reserve(l2Weights.size());

  arma::vec start = initialCoefficients;
  for (size_t i = 0; i < l2Weights.size(); ++i)
  {
    arma::wall_clock c;
    c.tic();

    NormalizationTransparentObjective<LossType, MatType> objective(dataset,
        context, l2Weights[i], treeAggregateDepth);
    if (start.is_empty())
      start.zeros(objective.DomainDimension());

    OptimizerState state;
    if (optimizer == OptimizerType::LBFGS)
    {
      LBFGS lbfgs(numCorrections, maxNumIterations, tolerance);
      lbfgs.l1Weight = l1Weight;
      lbfgs.trackState = trackState;
      lbfgs.verbose = verbose && (MPIWorldRank() == 0);
      state = lbfgs.Optimize(objective, start);
    }
    else
    {
      TRON tron(maxNumIterations, tolerance);
      tron.trackState = trackState;
      tron.verbose = verbose && (MPIWorldRank() == 0);
      state = tron.Optimize(objective, start);
    }

    if (state.Failed() && !keepFailedModels)
    {
      std::ostringstream oss;
      oss << "GLMTrainer::Train(): " << ToString(optimizer) << " failed for "
          << ToString(task) << " regression with L2 weight " << l2Weights[i]
          << " after " << state.iterationCount << " iterations ("
          << ToString(state.convergenceReason) << ")";
      throw OptimizationFailure(oss.str());
    }

    const OriginalCoefficients original =
        transform.ToOriginalSpace(state.coefficients);

    TrainedModel m;
    m.l2Weight = l2Weights[i];
    m.model = GeneralizedLinearModel(task, original.coefficients,
        original.interceptCorrection);
    m.normalizedCoefficients = state.coefficients;
    m.state = std::move(state);
    m.trainingTime = c.toc();

    if (verbose && MPIWorldRank() == 0)
    {
      std::cout << "Trained " << ToString(task) << " model with L2 weight "
          << m.l2Weight << ": objective " << m.state.objectiveValue << ", "
          << m.state.iterationCount << " iterations, "
          << ToString(m.state.status) << " in " << m.trainingTime << "s."
          << std::endl;
    }

    if (warmStart)
      start = m.normalizedCoefficients;
    else
      start = initialCoefficients;

    models.push_back(std::move(m));
  }

  return models;
}

} // namespace normglm

#endif
