/**
 * glm_training.hpp
 *
 * Train generalized linear models over a grid of regularization weights,
 * optimizing in normalized coefficient space and reporting models in the
 * original feature space.
 */
#ifndef GLM_TRAINING_HPP
#define GLM_TRAINING_HPP

#include <armadillo>
#include <string>
#include <vector>
#include "partitioned_dataset.hpp"
#include "normalization_context.hpp"
#include "optimizer_state.hpp"
#include "glm_model.hpp"

namespace normglm {

enum class OptimizerType
{
  LBFGS,
  TRON
};

std::string ToString(const OptimizerType optimizer);
OptimizerType OptimizerTypeFromString(const std::string& name);

// One entry per regularization weight.
struct TrainedModel
{
  double l2Weight;
  // In the original feature space.
  GeneralizedLinearModel model;
  // The optimizer's solution in normalized space.
  arma::vec normalizedCoefficients;
  OptimizerState state;
  double trainingTime;
};

class GLMTrainer
{
 public:
  GLMTrainer(const TaskType task = TaskType::LOGISTIC_REGRESSION,
             const OptimizerType optimizer = OptimizerType::LBFGS);

  /**
   * Train one model per entry of `l2Weights`, in the order given.  With
   * `warmStart`, each optimization starts from the previous solution.
   *
   * A model whose optimizer ends in the FAILED state raises
   * OptimizationFailure unless `keepFailedModels` is set.  In an MPI run this
   * must be called on every process with the same arguments.
   */
  template<typename MatType>
  std::vector<TrainedModel> Train(const PartitionedDataset<MatType>& dataset,
                                  const NormalizationContext& context,
                                  const std::vector<double>& l2Weights) const;

  // Parameters.
  TaskType task;
  OptimizerType optimizer;
  double l1Weight;
  bool warmStart;
  size_t treeAggregateDepth;
  size_t maxNumIterations;
  double tolerance;
  size_t numCorrections;
  bool keepFailedModels;
  bool trackState;
  bool verbose;

  // Starting point in normalized space; zeros if empty.
  arma::vec initialCoefficients;

 private:
  template<typename LossType, typename MatType>
  std::vector<TrainedModel> TrainWithLoss(
      const PartitionedDataset<MatType>& dataset,
      const NormalizationContext& context,
      const std::vector<double>& l2Weights) const;
};

} // namespace normglm

#include "glm_training_impl.hpp"

#endif
