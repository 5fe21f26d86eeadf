/**
 * labeled_partition.hpp
 *
 * One partition of a labeled dataset: a feature matrix with one column per
 * example, plus per-example labels, weights, and offsets.
 */
#ifndef LABELED_PARTITION_HPP
#define LABELED_PARTITION_HPP

#include <armadillo>

namespace normglm {

/**
 * A partition is read-only once constructed.  Weights default to 1 and offsets
 * to 0 when they are not given.  MatType may be arma::mat or arma::sp_mat.
 */
template<typename MatType>
class LabeledPartition
{
 public:
  LabeledPartition();

  LabeledPartition(MatType features, arma::rowvec labels);

  LabeledPartition(MatType features,
                   arma::rowvec labels,
                   arma::rowvec weights,
                   arma::rowvec offsets);

  const MatType& Features() const { return features; }
  const arma::rowvec& Labels() const { return labels; }
  const arma::rowvec& Weights() const { return weights; }
  const arma::rowvec& Offsets() const { return offsets; }

  size_t NumExamples() const { return features.n_cols; }
  size_t Dimension() const { return features.n_rows; }

 private:
  MatType features;
  arma::rowvec labels;
  arma::rowvec weights;
  arma::rowvec offsets;

  void Validate() const;
};

} // namespace normglm

#include "labeled_partition_impl.hpp"

#endif
