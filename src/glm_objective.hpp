/**
 * glm_objective.hpp
 *
 * The regularized GLM objective over a partitioned dataset, evaluated in
 * normalized coefficient space while reading only the raw features.
 */
#ifndef GLM_OBJECTIVE_HPP
#define GLM_OBJECTIVE_HPP

#include <armadillo>
#include "partitioned_dataset.hpp"
#include "normalization_context.hpp"
#include "coefficient_transform.hpp"
#include "loss_functions.hpp"

namespace normglm {

/**
 * Partial sums of one objective pass.  `rawSum` is sum_i c_i x_i over raw
 * features and `scalarSum` is sum_i c_i; it is empty when only the value is
 * needed.
 */
struct ObjectiveAggregate
{
  double value;
  double scalarSum;
  arma::vec rawSum;

  ObjectiveAggregate() : value(0.0), scalarSum(0.0) { }

  void Merge(const ObjectiveAggregate& other);

  arma::vec Pack() const;
  static ObjectiveAggregate Unpack(const arma::vec& packed);
};

/**
 * f(theta') = sum_i w_i * loss(y_i, theta' . x'_i + o_i)
 *             + 0.5 * l2Weight * ||theta'||^2,
 *
 * where x'_i = (x_i - s) % f is never formed.  Value, gradient, and
 * Hessian-vector products agree with the plain objective evaluated on
 * explicitly transformed features.
 *
 * The objective keeps references to `dataset` and `context`; both must outlive
 * it and must not change while it is in use.
 */
template<typename LossType, typename MatType>
class NormalizationTransparentObjective
{
 public:
  NormalizationTransparentObjective(const PartitionedDataset<MatType>& dataset,
                                    const NormalizationContext& context,
                                    const double l2Weight = 0.0,
                                    const size_t treeAggregateDepth = 2);

  /**
   * As above, but for a process whose dataset may hold no partitions at all;
   * the dimension must then be given explicitly.
   */
  NormalizationTransparentObjective(const PartitionedDataset<MatType>& dataset,
                                    const NormalizationContext& context,
                                    const size_t dimension,
                                    const double l2Weight,
                                    const size_t treeAggregateDepth);

  size_t DomainDimension() const { return dimension; }

  double Evaluate(const arma::vec& coefficients) const;

  double EvaluateWithGradient(const arma::vec& coefficients,
                              arma::vec& gradient) const;

  void Gradient(const arma::vec& coefficients, arma::vec& gradient) const;

  // Hessian at `coefficients` times `v`.
  void HessianVector(const arma::vec& coefficients,
                     const arma::vec& v,
                     arma::vec& hv) const;

  const NormalizationContext& Context() const { return context; }

  // Parameters.
  double l2Weight;
  size_t treeAggregateDepth;

 private:
  const PartitionedDataset<MatType>& dataset;
  const NormalizationContext& context;
  CoefficientSpaceTransform transform;
  size_t dimension;

  void Validate() const;

  ObjectiveAggregate Aggregate(const PreparedCoefficients& prepared,
                               const bool withGradient) const;
};

} // namespace normglm

#include "glm_objective_impl.hpp"

#endif
