/**
 * partitioned_dataset_impl.hpp
 *
 * Implementation of PartitionedDataset.
 */
#ifndef PARTITIONED_DATASET_IMPL_HPP
#define PARTITIONED_DATASET_IMPL_HPP

#include "partitioned_dataset.hpp"
#include "tree_reduce.hpp"
#include "mpi/mpi_tree_reduce.hpp"
#include "exceptions.hpp"

namespace normglm {

template<typename MatType>
PartitionedDataset<MatType>::PartitionedDataset()
{
  // Nothing to do.
}

template<typename MatType>
PartitionedDataset<MatType>::PartitionedDataset(
    std::vector<LabeledPartition<MatType>> partitions) :
    partitions(std::move(partitions))
{
  // Nothing else to do.
}

template<typename MatType>
PartitionedDataset<MatType> PartitionedDataset<MatType>::Split(
    const MatType& data,
    const arma::rowvec& labels,
    const size_t partitions,
    const arma::rowvec& weights,
    const arma::rowvec& offsets)
{
  if (partitions == 0)
  {
    throw std::invalid_argument("PartitionedDataset::Split(): need at least "
                                "one partition");
  }

  normglm::CheckDimension("PartitionedDataset::Split(): labels", data.n_cols,
      labels.n_elem);
  const arma::rowvec w = weights.is_empty() ?
      arma::rowvec(arma::ones<arma::rowvec>(data.n_cols)) : weights;
  const arma::rowvec o = offsets.is_empty() ?
      arma::rowvec(arma::zeros<arma::rowvec>(data.n_cols)) : offsets;
  normglm::CheckDimension("PartitionedDataset::Split(): weights", data.n_cols,
      w.n_elem);
  normglm::CheckDimension("PartitionedDataset::Split(): offsets", data.n_cols,
      o.n_elem);

  std::vector<LabeledPartition<MatType>> result;
  result.reserve(partitions);
  const size_t batchSize = (data.n_cols + partitions - 1) / partitions;
  for (size_t p = 0; p < partitions; ++p)
  {
    const size_t start = std::min(p * batchSize, (size_t) data.n_cols);
    const size_t end = ((p + 1) * batchSize >= data.n_cols) ? data.n_cols :
        (p + 1) * batchSize;

    if (start == end)
    {
      // More partitions than points; keep the partition count but leave
      // this one empty.
      result.push_back(LabeledPartition<MatType>(MatType(data.n_rows, 0),
          arma::rowvec(), arma::rowvec(), arma::rowvec()));
      continue;
    }

    result.push_back(LabeledPartition<MatType>(
        MatType(data.cols(start, end - 1)),
        labels.subvec(start, end - 1),
        w.subvec(start, end - 1),
        o.subvec(start, end - 1)));
  }

  return PartitionedDataset(std::move(result));
}

template<typename MatType>
size_t PartitionedDataset<MatType>::NumLocalExamples() const
{
  size_t total = 0;
  for (size_t i = 0; i < partitions.size(); ++i)
    total += partitions[i].NumExamples();
  return total;
}

template<typename MatType>
void PartitionedDataset<MatType>::CheckDimension(const size_t dimension) const
{
  for (size_t i = 0; i < partitions.size(); ++i)
  {
    if (partitions[i].Dimension() != dimension)
    {
      std::ostringstream oss;
      oss << "PartitionedDataset: partition " << i << " has "
          << partitions[i].Dimension() << " features, expected " << dimension;
      throw DimensionMismatch(oss.str());
    }
  }
}

template<typename MatType>
template<typename ResultType, typename MapFunction>
std::vector<ResultType> PartitionedDataset<MatType>::Map(MapFunction f) const
{
  std::vector<ResultType> results(partitions.size());
  std::vector<std::exception_ptr> errors(partitions.size());

  #pragma omp parallel for schedule(dynamic)
  for (size_t i = 0; i < partitions.size(); ++i)
  {
    try
    {
      results[i] = f(partitions[i]);
    }
    catch (...)
    {
      errors[i] = std::current_exception();
    }
  }

  // A failure in any partition fails the whole map.
  for (size_t i = 0; i < errors.size(); ++i)
  {
    if (errors[i])
      std::rethrow_exception(errors[i]);
  }

  return results;
}

template<typename MatType>
template<typename AggregateType, typename SeqOp, typename CombOp>
AggregateType PartitionedDataset<MatType>::TreeAggregate(
    const AggregateType& zero,
    SeqOp seqOp,
    CombOp combOp,
    const size_t depth) const
{
  std::vector<AggregateType> partials = Map<AggregateType>(seqOp);
  if (partials.empty())
    partials.push_back(zero);

  const AggregateType local = TreeReduce(std::move(partials), combOp, depth);
  return MPITreeReduce(local, combOp, depth);
}

} // namespace normglm

#endif
