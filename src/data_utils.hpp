/**
 * data_utils.hpp
 *
 * Miscellaneous utilities for data preprocessing and model evaluation.
 */
#ifndef DATA_UTILS_HPP
#define DATA_UTILS_HPP

#include <armadillo>
#include <string>
#include <tuple>
#include "partitioned_dataset.hpp"
#include "glm_model.hpp"

namespace normglm {

// Get training and test files, if they were specified as one parameter.
// The test file will be empty if not given.
std::tuple<std::string, std::string> SplitDatasetArgument(
    const std::string& arg);

/**
 * Append a constant feature of value 1 as the last row of `data`, and return
 * its index.
 */
template<typename MatType>
size_t AppendIntercept(MatType& data);

// Shuffle the data, and split it into training and test set.
void TrainTestSplit(const arma::sp_mat& data,
                    const arma::rowvec& labels,
                    const double trainPct,
                    arma::sp_mat& trainData,
                    arma::rowvec& trainLabels,
                    arma::sp_mat& testData,
                    arma::rowvec& testLabels);

// Weighted counts used to evaluate a model over a partitioned dataset.
struct MetricAggregate
{
  double weight;
  double correct;
  double squaredError;

  MetricAggregate() : weight(0.0), correct(0.0), squaredError(0.0) { }

  void Merge(const MetricAggregate& other);

  arma::vec Pack() const;
  static MetricAggregate Unpack(const arma::vec& packed);
};

/**
 * Accuracy for logistic regression models (labels in {0, 1}), and root mean
 * squared error of the predicted mean otherwise.  The result is the same on
 * every MPI process.
 */
template<typename MatType>
double EvaluateModel(const GeneralizedLinearModel& model,
                     const PartitionedDataset<MatType>& dataset,
                     const size_t treeAggregateDepth = 2);

// Single-matrix convenience form of EvaluateModel().
template<typename MatType>
double EvaluateModel(const GeneralizedLinearModel& model,
                     const MatType& data,
                     const arma::rowvec& labels);

} // namespace normglm

#include "data_utils_impl.hpp"

#endif
