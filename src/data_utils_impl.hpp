/**
 * data_utils_impl.hpp
 *
 * Implementation of miscellaneous data preprocessing and evaluation utilities.
 */
#ifndef DATA_UTILS_IMPL_HPP
#define DATA_UTILS_IMPL_HPP

#include "data_utils.hpp"
#include "exceptions.hpp"
#include <cmath>
#include <sstream>

namespace normglm {

// Get training and test files, if they were specified as one parameter.
// The test file will be empty if not given.
inline std::tuple<std::string, std::string> SplitDatasetArgument(
    const std::string& arg)
{
  size_t idx = arg.find_first_of(',');
  if (idx == std::string::npos)
  {
    return std::make_tuple(arg, std::string(""));
  }
  else
  {
    std::string trainFile = arg.substr(0, idx);
    std::string testFile = arg.substr(idx + 1);

    return std::make_tuple(trainFile, testFile);
  }
}

template<typename MatType>
size_t AppendIntercept(MatType& data)
{
  data = arma::join_cols(data,
      MatType(arma::ones<arma::rowvec>(data.n_cols)));
  return data.n_rows - 1;
}

// Column i of the training set comes from column order[i] of the input.
inline arma::uvec ShuffledOrder(const size_t n)
{
  return arma::shuffle(arma::linspace<arma::uvec>(0, n - 1, n));
}

inline size_t TrainSize(const size_t n, const double trainPct)
{
  if (trainPct <= 0.0 || trainPct > 1.0)
  {
    std::ostringstream oss;
    oss << "TrainTestSplit(): training fraction must be in (0, 1] (got "
        << trainPct << ")";
    throw std::invalid_argument(oss.str());
  }

  return (size_t) (trainPct * n);
}

inline void TrainTestSplit(const arma::sp_mat& data,
                           const arma::rowvec& labels,
                           const double trainPct,
                           arma::sp_mat& trainData,
                           arma::rowvec& trainLabels,
                           arma::sp_mat& testData,
                           arma::rowvec& testLabels)
{
  CheckDimension("TrainTestSplit(): labels", data.n_cols, labels.n_elem);
  const size_t lastTrainIndex = TrainSize(data.n_cols, trainPct);
  if (lastTrainIndex == 0 || lastTrainIndex == data.n_cols)
  {
    trainData = data;
    trainLabels = labels;
    testData.set_size(data.n_rows, 0);
    testLabels.set_size(0);
    return;
  }

  const arma::uvec order = ShuffledOrder(data.n_cols);
  trainLabels = labels.cols(order.subvec(0, lastTrainIndex - 1));
  testLabels = labels.cols(order.subvec(lastTrainIndex, order.n_elem - 1));

  // Compute the size we will need for the train and test sets.
  size_t trainNonzeros = 0;
  size_t testNonzeros = 0;
  for (size_t i = 0; i < order.n_elem; ++i)
  {
    arma::sp_mat::const_iterator it = data.begin_col(order[i]);
    for (; it != data.end_col(order[i]); ++it)
    {
      if (i < lastTrainIndex)
        ++trainNonzeros;
      else
        ++testNonzeros;
    }
  }

  arma::umat trainLocations(2, trainNonzeros), testLocations(2, testNonzeros);
  arma::vec trainValues(trainNonzeros), testValues(testNonzeros);
  size_t trainPos = 0;
  size_t testPos = 0;
  for (size_t i = 0; i < order.n_elem; ++i)
  {
    arma::sp_mat::const_iterator it = data.begin_col(order[i]);
    for (; it != data.end_col(order[i]); ++it)
    {
      if (i < lastTrainIndex)
      {
        trainLocations(0, trainPos) = it.row();
        trainLocations(1, trainPos) = i;
        trainValues[trainPos++] = (*it);
      }
      else
      {
        testLocations(0, testPos) = it.row();
        testLocations(1, testPos) = i - lastTrainIndex;
        testValues[testPos++] = (*it);
      }
    }
  }

  trainData = arma::sp_mat(trainLocations, trainValues, data.n_rows,
      lastTrainIndex);
  testData = arma::sp_mat(testLocations, testValues, data.n_rows,
      data.n_cols - lastTrainIndex);
}

inline void MetricAggregate::Merge(const MetricAggregate& other)
{
  weight += other.weight;
  correct += other.correct;
  squaredError += other.squaredError;
}

inline arma::vec MetricAggregate::Pack() const
{
  arma::vec packed(3);
  packed[0] = weight;
  packed[1] = correct;
  packed[2] = squaredError;
  return packed;
}

inline MetricAggregate MetricAggregate::Unpack(const arma::vec& packed)
{
  CheckDimension("MetricAggregate::Unpack()", 3, packed.n_elem);
  MetricAggregate m;
  m.weight = packed[0];
  m.correct = packed[1];
  m.squaredError = packed[2];
  return m;
}

// Metric counts for one partition.
template<typename MatType>
MetricAggregate PartitionMetric(const GeneralizedLinearModel& model,
                                const LabeledPartition<MatType>& p)
{
  MetricAggregate m;
  if (p.NumExamples() == 0)
    return m;

  arma::rowvec means;
  model.PredictMean(p.Features(), means, p.Offsets());
  const arma::rowvec& y = p.Labels();
  const arma::rowvec& w = p.Weights();
  for (size_t i = 0; i < p.NumExamples(); ++i)
  {
    const double predictedClass = (means[i] >= 0.5) ? 1.0 : 0.0;
    const double residual = means[i] - y[i];
    m.weight += w[i];
    m.correct += (predictedClass == y[i]) ? w[i] : 0.0;
    m.squaredError += w[i] * residual * residual;
  }

  return m;
}

inline double MetricValue(const GeneralizedLinearModel& model,
                          const MetricAggregate& total)
{
  if (total.weight == 0.0)
    return 0.0;

  if (model.Task() == TaskType::LOGISTIC_REGRESSION)
    return total.correct / total.weight;
  else
    return std::sqrt(total.squaredError / total.weight);
}

template<typename MatType>
double EvaluateModel(const GeneralizedLinearModel& model,
                     const PartitionedDataset<MatType>& dataset,
                     const size_t treeAggregateDepth)
{
  const MetricAggregate total = dataset.TreeAggregate(MetricAggregate(),
      [&model](const LabeledPartition<MatType>& p)
      {
        return PartitionMetric(model, p);
      },
      [](MetricAggregate& into, const MetricAggregate& other)
      {
        into.Merge(other);
      },
      treeAggregateDepth);

  return MetricValue(model, total);
}

template<typename MatType>
double EvaluateModel(const GeneralizedLinearModel& model,
                     const MatType& data,
                     const arma::rowvec& labels)
{
  // Local to this process, even in an MPI run.
  const LabeledPartition<MatType> p(data, labels);
  return MetricValue(model, PartitionMetric(model, p));
}

} // namespace normglm

#endif
