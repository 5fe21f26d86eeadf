/**
 * statistical_summary.hpp
 *
 * Per-feature count, mean, variance, min, and max of a partitioned dataset,
 * computed in one distributed pass.
 */
#ifndef STATISTICAL_SUMMARY_HPP
#define STATISTICAL_SUMMARY_HPP

#include <armadillo>
#include "partitioned_dataset.hpp"

namespace normglm {

/**
 * Running sums for one partition (or several merged partitions).  Merge() is
 * associative and commutative up to floating-point rounding.
 */
class SummaryAggregate
{
 public:
  SummaryAggregate();
  explicit SummaryAggregate(const size_t dimension);

  // Single pass over the columns of a dense or sparse feature matrix.
  template<typename eT>
  void Add(const arma::Mat<eT>& features);
  template<typename eT>
  void Add(const arma::SpMat<eT>& features);

  void Merge(const SummaryAggregate& other);

  arma::vec Pack() const;
  static SummaryAggregate Unpack(const arma::vec& packed);

  size_t Dimension() const { return sum.n_elem; }

  uint64_t count;
  arma::vec sum;
  arma::vec sumOfSquares;
  arma::vec min;
  arma::vec max;
};

class StatisticalSummary
{
 public:
  StatisticalSummary();

  /**
   * Finish an aggregate.  The variance divides by (count - ddof) and is clamped
   * at zero; ddof = 0 gives the population variance.
   */
  StatisticalSummary(const SummaryAggregate& aggregate, const size_t ddof);

  size_t Dimension() const { return mean.n_elem; }

  uint64_t count;
  arma::vec mean;
  arma::vec variance;
  arma::vec min;
  arma::vec max;
};

/**
 * Compute the summary of every example in `dataset` (across all MPI
 * processes).  Each partition must have exactly `dimension` features or
 * DimensionMismatch is thrown before any aggregation starts.
 *
 * @param treeDepth Maximum depth of the reduction tree (at least 1).
 * @param ddof Delta degrees of freedom for the variance.
 */
template<typename MatType>
StatisticalSummary ComputeStatisticalSummary(
    const PartitionedDataset<MatType>& dataset,
    const size_t dimension,
    const size_t treeDepth = 2,
    const size_t ddof = 0);

} // namespace normglm

#include "statistical_summary_impl.hpp"

#endif
