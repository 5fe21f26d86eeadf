/**
 * glm_objective_impl.hpp
 *
 * Implementation of NormalizationTransparentObjective.
 */
#ifndef GLM_OBJECTIVE_IMPL_HPP
#define GLM_OBJECTIVE_IMPL_HPP

#include "glm_objective.hpp"
#include "exceptions.hpp"

namespace normglm {

inline void ObjectiveAggregate::Merge(const ObjectiveAggregate& other)
{
  value += other.value;
  scalarSum += other.scalarSum;

  if (other.rawSum.is_empty())
    return;

  if (rawSum.is_empty())
  {
    rawSum = other.rawSum;
  }
  else
  {
    CheckDimension("ObjectiveAggregate::Merge()", rawSum.n_elem,
        other.rawSum.n_elem);
    rawSum += other.rawSum;
  }
}

inline arma::vec ObjectiveAggregate::Pack() const
{
  // [value, scalarSum, rawSum...]
  arma::vec packed(2 + rawSum.n_elem);
  packed[0] = value;
  packed[1] = scalarSum;
  if (!rawSum.is_empty())
    packed.subvec(2, packed.n_elem - 1) = rawSum;
  return packed;
}

inline ObjectiveAggregate ObjectiveAggregate::Unpack(const arma::vec& packed)
{
  if (packed.n_elem < 2)
  {
    throw std::invalid_argument("ObjectiveAggregate::Unpack(): truncated "
                                "aggregate");
  }

  ObjectiveAggregate aggregate;
  aggregate.value = packed[0];
  aggregate.scalarSum = packed[1];
  if (packed.n_elem > 2)
    aggregate.rawSum = packed.subvec(2, packed.n_elem - 1);
  return aggregate;
}

template<typename LossType, typename MatType>
NormalizationTransparentObjective<LossType, MatType>::
NormalizationTransparentObjective(const PartitionedDataset<MatType>& dataset,
                                  const NormalizationContext& context,
                                  const double l2Weight,
                                  const size_t treeAggregateDepth) :
    l2Weight(l2Weight),
    treeAggregateDepth(treeAggregateDepth),
    dataset(dataset),
    context(context),
    transform(context),
    dimension(context.Dimension())
{
  if (dimension == 0)
  {
    if (dataset.NumPartitions() == 0)
    {
      throw std::invalid_argument("NormalizationTransparentObjective: cannot "
          "infer the dimension of an empty dataset with an identity context");
    }

    dimension = dataset.Partition(0).Dimension();
  }

  Validate();
}

template<typename LossType, typename MatType>
NormalizationTransparentObjective<LossType, MatType>::
NormalizationTransparentObjective(const PartitionedDataset<MatType>& dataset,
                                  const NormalizationContext& context,
                                  const size_t dimension,
                                  const double l2Weight,
                                  const size_t treeAggregateDepth) :
    l2Weight(l2Weight),
    treeAggregateDepth(treeAggregateDepth),
    dataset(dataset),
    context(context),
    transform(context),
    dimension(dimension)
{
  Validate();
}

template<typename LossType, typename MatType>
void NormalizationTransparentObjective<LossType, MatType>::Validate() const
{
  dataset.CheckDimension(dimension);
  context.CheckDimension(dimension);

  if (l2Weight < 0.0)
  {
    std::ostringstream oss;
    oss << "NormalizationTransparentObjective: L2 weight must be nonnegative "
        << "(got " << l2Weight << ")";
    throw std::invalid_argument(oss.str());
  }

  if (treeAggregateDepth < 1)
  {
    throw std::invalid_argument("NormalizationTransparentObjective: tree "
                                "aggregate depth must be at least 1");
  }
}

template<typename LossType, typename MatType>
ObjectiveAggregate
NormalizationTransparentObjective<LossType, MatType>::Aggregate(
    const PreparedCoefficients& prepared,
    const bool withGradient) const
{
  const CoefficientSpaceTransform& t = transform;
  const size_t d = dimension;

  ObjectiveAggregate zero;
  if (withGradient)
    zero.rawSum.zeros(d);

  return dataset.TreeAggregate(zero,
      [&t, &prepared, withGradient, d](const LabeledPartition<MatType>& p)
          -> ObjectiveAggregate
      {
        ObjectiveAggregate partial;
        if (withGradient)
          partial.rawSum.zeros(d);

        const MatType& X = p.Features();
        const arma::rowvec& y = p.Labels();
        const arma::rowvec& w = p.Weights();
        const arma::rowvec& o = p.Offsets();
        for (size_t i = 0; i < p.NumExamples(); ++i)
        {
          const double z = t.Margin(prepared, X, i) + o[i];
          partial.value += w[i] * LossType::Loss(y[i], z);

          if (withGradient)
          {
            const double c = w[i] * LossType::Derivative(y[i], z);
            ColumnAxpy(c, X, i, partial.rawSum);
            partial.scalarSum += c;
          }
        }

        return partial;
      },
      [](ObjectiveAggregate& into, const ObjectiveAggregate& other)
      {
        into.Merge(other);
      },
      treeAggregateDepth);
}

template<typename LossType, typename MatType>
double NormalizationTransparentObjective<LossType, MatType>::Evaluate(
    const arma::vec& coefficients) const
{
  CheckDimension("NormalizationTransparentObjective::Evaluate()", dimension,
      coefficients.n_elem);

  const PreparedCoefficients prepared = transform.Prepare(coefficients);
  const ObjectiveAggregate total = Aggregate(prepared, false);

  return total.value + 0.5 * l2Weight * arma::dot(coefficients, coefficients);
}

template<typename LossType, typename MatType>
double NormalizationTransparentObjective<LossType, MatType>::
EvaluateWithGradient(const arma::vec& coefficients, arma::vec& gradient) const
{
  CheckDimension("NormalizationTransparentObjective::EvaluateWithGradient()",
      dimension, coefficients.n_elem);

  const PreparedCoefficients prepared = transform.Prepare(coefficients);
  const ObjectiveAggregate total = Aggregate(prepared, true);

  transform.FinishGradient(total.rawSum, total.scalarSum, gradient);
  if (l2Weight != 0.0)
    gradient += l2Weight * coefficients;

  return total.value + 0.5 * l2Weight * arma::dot(coefficients, coefficients);
}

template<typename LossType, typename MatType>
void NormalizationTransparentObjective<LossType, MatType>::Gradient(
    const arma::vec& coefficients,
    arma::vec& gradient) const
{
  EvaluateWithGradient(coefficients, gradient);
}

template<typename LossType, typename MatType>
void NormalizationTransparentObjective<LossType, MatType>::HessianVector(
    const arma::vec& coefficients,
    const arma::vec& v,
    arma::vec& hv) const
{
  CheckDimension("NormalizationTransparentObjective::HessianVector()",
      dimension, coefficients.n_elem);
  CheckDimension("NormalizationTransparentObjective::HessianVector()",
      dimension, v.n_elem);

  const CoefficientSpaceTransform& t = transform;
  const PreparedCoefficients prepared = transform.Prepare(coefficients);
  const PreparedCoefficients direction = transform.Prepare(v);
  const size_t d = dimension;

  ObjectiveAggregate zero;
  zero.rawSum.zeros(d);

  // sum_i w_i loss''(z_i) (x'_i . v) x'_i, accumulated over raw features.
  const ObjectiveAggregate total = dataset.TreeAggregate(zero,
      [&t, &prepared, &direction, d](const LabeledPartition<MatType>& p)
          -> ObjectiveAggregate
      {
        ObjectiveAggregate partial;
        partial.rawSum.zeros(d);

        const MatType& X = p.Features();
        const arma::rowvec& y = p.Labels();
        const arma::rowvec& w = p.Weights();
        const arma::rowvec& o = p.Offsets();
        for (size_t i = 0; i < p.NumExamples(); ++i)
        {
          const double z = t.Margin(prepared, X, i) + o[i];
          const double c = w[i] * LossType::SecondDerivative(y[i], z) *
              t.Margin(direction, X, i);
          ColumnAxpy(c, X, i, partial.rawSum);
          partial.scalarSum += c;
        }

        return partial;
      },
      [](ObjectiveAggregate& into, const ObjectiveAggregate& other)
      {
        into.Merge(other);
      },
      treeAggregateDepth);

  transform.FinishGradient(total.rawSum, total.scalarSum, hv);
  if (l2Weight != 0.0)
    hv += l2Weight * v;
}

} // namespace normglm

#endif
