/**
 * statistical_summary_impl.hpp
 *
 * Implementation of the distributed statistical summary.
 */
#ifndef STATISTICAL_SUMMARY_IMPL_HPP
#define STATISTICAL_SUMMARY_IMPL_HPP

#include "statistical_summary.hpp"
#include "exceptions.hpp"
#include <limits>

namespace normglm {

inline SummaryAggregate::SummaryAggregate() : count(0)
{
  // Nothing to do.
}

inline SummaryAggregate::SummaryAggregate(const size_t dimension) :
    count(0),
    sum(dimension, arma::fill::zeros),
    sumOfSquares(dimension, arma::fill::zeros),
    min(dimension),
    max(dimension)
{
  min.fill(std::numeric_limits<double>::infinity());
  max.fill(-std::numeric_limits<double>::infinity());
}

template<typename eT>
void SummaryAggregate::Add(const arma::Mat<eT>& features)
{
  CheckDimension("SummaryAggregate::Add()", Dimension(), features.n_rows);

  for (size_t i = 0; i < features.n_cols; ++i)
  {
    for (size_t j = 0; j < features.n_rows; ++j)
    {
      const double v = (double) features(j, i);
      sum[j] += v;
      sumOfSquares[j] += v * v;
      if (v < min[j])
        min[j] = v;
      if (v > max[j])
        max[j] = v;
    }
  }

  count += features.n_cols;
}

template<typename eT>
void SummaryAggregate::Add(const arma::SpMat<eT>& features)
{
  CheckDimension("SummaryAggregate::Add()", Dimension(), features.n_rows);

  // Only nonzeros are visited; a feature with fewer nonzeros than columns also
  // takes the value 0 somewhere, which matters for min and max.
  arma::Col<uint64_t> nonzeros(features.n_rows, arma::fill::zeros);
  for (size_t i = 0; i < features.n_cols; ++i)
  {
    typename arma::SpMat<eT>::const_iterator it = features.begin_col(i);
    while (it != features.end_col(i))
    {
      const size_t j = it.row();
      const double v = (double) (*it);
      sum[j] += v;
      sumOfSquares[j] += v * v;
      if (v < min[j])
        min[j] = v;
      if (v > max[j])
        max[j] = v;
      ++nonzeros[j];
      ++it;
    }
  }

  for (size_t j = 0; j < features.n_rows; ++j)
  {
    if (nonzeros[j] < features.n_cols)
    {
      min[j] = std::min(min[j], 0.0);
      max[j] = std::max(max[j], 0.0);
    }
  }

  count += features.n_cols;
}

inline void SummaryAggregate::Merge(const SummaryAggregate& other)
{
  CheckDimension("SummaryAggregate::Merge()", Dimension(), other.Dimension());

  count += other.count;
  sum += other.sum;
  sumOfSquares += other.sumOfSquares;
  for (size_t j = 0; j < min.n_elem; ++j)
  {
    min[j] = std::min(min[j], other.min[j]);
    max[j] = std::max(max[j], other.max[j]);
  }
}

inline arma::vec SummaryAggregate::Pack() const
{
  const size_t d = Dimension();
  arma::vec packed(2 + 4 * d);
  packed[0] = (double) d;
  packed[1] = (double) count;
  if (d > 0)
  {
    packed.subvec(2, 1 + d) = sum;
    packed.subvec(2 + d, 1 + 2 * d) = sumOfSquares;
    packed.subvec(2 + 2 * d, 1 + 3 * d) = min;
    packed.subvec(2 + 3 * d, 1 + 4 * d) = max;
  }

  return packed;
}

inline SummaryAggregate SummaryAggregate::Unpack(const arma::vec& packed)
{
  if (packed.n_elem < 2)
  {
    throw std::invalid_argument("SummaryAggregate::Unpack(): truncated "
                                "aggregate");
  }

  const size_t d = (size_t) packed[0];
  CheckDimension("SummaryAggregate::Unpack()", 2 + 4 * d, packed.n_elem);

  SummaryAggregate result(d);
  result.count = (uint64_t) packed[1];
  if (d > 0)
  {
    result.sum = packed.subvec(2, 1 + d);
    result.sumOfSquares = packed.subvec(2 + d, 1 + 2 * d);
    result.min = packed.subvec(2 + 2 * d, 1 + 3 * d);
    result.max = packed.subvec(2 + 3 * d, 1 + 4 * d);
  }

  return result;
}

inline StatisticalSummary::StatisticalSummary() : count(0)
{
  // Nothing to do.
}

inline StatisticalSummary::StatisticalSummary(
    const SummaryAggregate& aggregate,
    const size_t ddof) :
    count(aggregate.count)
{
  const size_t d = aggregate.Dimension();
  if (count == 0)
  {
    mean.zeros(d);
    variance.zeros(d);
    min.zeros(d);
    max.zeros(d);
    return;
  }

  mean = aggregate.sum / (double) count;
  min = aggregate.min;
  max = aggregate.max;

  if (count <= ddof)
  {
    variance.zeros(d);
    return;
  }

  // Cancellation leaves small nonzero values for constant features, so those
  // are set to zero from the range.
  variance = (aggregate.sumOfSquares - (double) count * (mean % mean)) /
      (double) (count - ddof);
  for (size_t i = 0; i < d; ++i)
  {
    if (variance[i] < 0.0 || max[i] == min[i])
      variance[i] = 0.0;
  }
}

template<typename MatType>
StatisticalSummary ComputeStatisticalSummary(
    const PartitionedDataset<MatType>& dataset,
    const size_t dimension,
    const size_t treeDepth,
    const size_t ddof)
{
  dataset.CheckDimension(dimension);

  const SummaryAggregate aggregate = dataset.TreeAggregate(
      SummaryAggregate(dimension),
      [dimension](const LabeledPartition<MatType>& partition)
          -> SummaryAggregate
      {
        SummaryAggregate partial(dimension);
        partial.Add(partition.Features());
        return partial;
      },
      [](SummaryAggregate& into, const SummaryAggregate& other)
      {
        into.Merge(other);
      },
      treeDepth);

  return StatisticalSummary(aggregate, ddof);
}

} // namespace normglm

#endif
