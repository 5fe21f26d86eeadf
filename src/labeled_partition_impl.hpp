/**
 * labeled_partition_impl.hpp
 *
 * Implementation of LabeledPartition.
 */
#ifndef LABELED_PARTITION_IMPL_HPP
#define LABELED_PARTITION_IMPL_HPP

#include "labeled_partition.hpp"
#include "exceptions.hpp"

namespace normglm {

template<typename MatType>
LabeledPartition<MatType>::LabeledPartition()
{
  // Nothing to do; an empty partition.
}

template<typename MatType>
LabeledPartition<MatType>::LabeledPartition(MatType features,
                                            arma::rowvec labels) :
    features(std::move(features)),
    labels(std::move(labels))
{
  weights.ones(this->labels.n_elem);
  offsets.zeros(this->labels.n_elem);
  Validate();
}

template<typename MatType>
LabeledPartition<MatType>::LabeledPartition(MatType features,
                                            arma::rowvec labels,
                                            arma::rowvec weights,
                                            arma::rowvec offsets) :
    features(std::move(features)),
    labels(std::move(labels)),
    weights(std::move(weights)),
    offsets(std::move(offsets))
{
  Validate();
}

template<typename MatType>
void LabeledPartition<MatType>::Validate() const
{
  CheckDimension("LabeledPartition: labels", features.n_cols, labels.n_elem);
  CheckDimension("LabeledPartition: weights", features.n_cols, weights.n_elem);
  CheckDimension("LabeledPartition: offsets", features.n_cols, offsets.n_elem);

  if (weights.n_elem > 0 && weights.min() < 0.0)
  {
    throw std::invalid_argument("LabeledPartition: example weights must be "
                                "non-negative");
  }
}

} // namespace normglm

#endif
