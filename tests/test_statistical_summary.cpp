/**
 * test_statistical_summary.cpp
 *
 * Tests for the tree reduction and the distributed feature summary.
 */
#include "../src/tree_reduce.hpp"
#include "../src/partitioned_dataset.hpp"
#include "../src/statistical_summary.hpp"
#include "../src/exceptions.hpp"
#include "test_utils.hpp"

using namespace normglm;
using namespace normglm::test;

void TestTreeReduceSums()
{
  std::vector<double> values;
  for (size_t i = 1; i <= 100; ++i)
    values.push_back((double) i);

  for (size_t depth = 1; depth <= 3; ++depth)
  {
    const double total = TreeReduce(values,
        [](double& into, const double& other) { into += other; }, depth);
    CheckClose(total, 5050.0, 1e-15, "TreeReduce() sum");
  }

  // A single partial comes back unchanged.
  const double single = TreeReduce(std::vector<double>(1, 3.5),
      [](double& into, const double& other) { into += other; }, 2);
  CheckClose(single, 3.5, 1e-15, "TreeReduce() single partial");

  CheckThrows<std::invalid_argument>([&values]()
      {
        TreeReduce(values,
            [](double& into, const double& other) { into += other; }, 0);
      }, "TreeReduce() with depth 0");
  CheckThrows<std::invalid_argument>([]()
      {
        TreeReduce(std::vector<double>(),
            [](double& into, const double& other) { into += other; }, 2);
      }, "TreeReduce() with no partials");

  TestPassed("TestTreeReduceSums");
}

void TestSummaryMatchesArmadillo()
{
  arma::arma_rng::set_seed(11);
  arma::mat X = 3.0 * arma::randn<arma::mat>(6, 157) + 2.0;
  X.row(2) *= 1000.0;
  X.row(4).fill(7.0);
  const arma::rowvec labels(X.n_cols, arma::fill::zeros);

  const arma::vec mean = arma::mean(X, 1);
  const arma::vec variance = arma::var(X, 1, 1);

  const size_t partitionCounts[] = { 1, 3, 16, 157 };
  for (size_t p = 0; p < 4; ++p)
  {
    const PartitionedDataset<arma::mat> dataset =
        PartitionedDataset<arma::mat>::Split(X, labels, partitionCounts[p]);
    CheckTrue(dataset.NumLocalExamples() == 157, "split keeps every example");
    for (size_t depth = 1; depth <= 3; ++depth)
    {
      const StatisticalSummary s = ComputeStatisticalSummary(dataset, 6,
          depth);
      CheckTrue(s.count == 157, "summary count");
      CheckClose(s.mean, mean, 1e-12, "summary mean");
      CheckClose(s.variance, variance, 1e-9, "summary variance");
      CheckClose(s.min, arma::vec(arma::min(X, 1)), 1e-15, "summary min");
      CheckClose(s.max, arma::vec(arma::max(X, 1)), 1e-15, "summary max");
      CheckTrue(s.variance[4] == 0.0, "constant feature has zero variance");
    }
  }

  TestPassed("TestSummaryMatchesArmadillo");
}

void TestSummaryIgnoresPartitionOrder()
{
  arma::arma_rng::set_seed(12);
  const arma::mat X = arma::randu<arma::mat>(4, 60);

  std::vector<LabeledPartition<arma::mat>> forward, backward;
  for (size_t i = 0; i < 6; ++i)
  {
    forward.push_back(LabeledPartition<arma::mat>(
        X.cols(10 * i, 10 * i + 9), arma::rowvec(10, arma::fill::zeros)));
  }
  for (size_t i = 6; i > 0; --i)
    backward.push_back(forward[i - 1]);

  const StatisticalSummary a = ComputeStatisticalSummary(
      PartitionedDataset<arma::mat>(forward), 4);
  const StatisticalSummary b = ComputeStatisticalSummary(
      PartitionedDataset<arma::mat>(backward), 4);

  CheckTrue(a.count == b.count, "reordered count");
  CheckClose(a.mean, b.mean, 1e-12, "reordered mean");
  CheckClose(a.variance, b.variance, 1e-12, "reordered variance");
  CheckClose(a.min, b.min, 0.0, "reordered min");
  CheckClose(a.max, b.max, 0.0, "reordered max");

  TestPassed("TestSummaryIgnoresPartitionOrder");
}

void TestSampleVariance()
{
  arma::arma_rng::set_seed(13);
  const arma::mat X = arma::randn<arma::mat>(3, 40);
  const PartitionedDataset<arma::mat> dataset =
      PartitionedDataset<arma::mat>::Split(X, arma::rowvec(40,
      arma::fill::zeros), 4);

  const StatisticalSummary s = ComputeStatisticalSummary(dataset, 3, 2, 1);
  CheckClose(s.variance, arma::vec(arma::var(X, 0, 1)), 1e-10,
      "sample variance");

  TestPassed("TestSampleVariance");
}

void TestSparseMatchesDense()
{
  arma::arma_rng::set_seed(14);
  arma::sp_mat S = arma::sprandu<arma::sp_mat>(8, 90, 0.2);
  // One all-positive column block and one all-zero feature.
  S.row(0).ones();
  S.row(5).zeros();
  const arma::mat D(S);
  const arma::rowvec labels(90, arma::fill::zeros);

  const StatisticalSummary sparse = ComputeStatisticalSummary(
      PartitionedDataset<arma::sp_mat>::Split(S, labels, 5), 8);
  const StatisticalSummary dense = ComputeStatisticalSummary(
      PartitionedDataset<arma::mat>::Split(D, labels, 5), 8);

  CheckTrue(sparse.count == dense.count, "sparse count");
  CheckClose(sparse.mean, dense.mean, 1e-12, "sparse mean");
  CheckClose(sparse.variance, dense.variance, 1e-12, "sparse variance");
  CheckClose(sparse.min, dense.min, 0.0, "sparse min");
  CheckClose(sparse.max, dense.max, 0.0, "sparse max");
  CheckTrue(sparse.min[0] == 1.0, "implicit zeros absent from full feature");
  CheckTrue(sparse.min[5] == 0.0 && sparse.max[5] == 0.0,
      "all-zero feature");

  TestPassed("TestSparseMatchesDense");
}

void TestSummaryDimensionMismatch()
{
  const arma::mat X(5, 10, arma::fill::ones);
  const PartitionedDataset<arma::mat> dataset =
      PartitionedDataset<arma::mat>::Split(X, arma::rowvec(10,
      arma::fill::zeros), 2);

  CheckThrows<DimensionMismatch>([&dataset]()
      {
        ComputeStatisticalSummary(dataset, 4);
      }, "summary with wrong dimension");

  TestPassed("TestSummaryDimensionMismatch");
}

void TestEmptyDataset()
{
  const PartitionedDataset<arma::mat> dataset;
  const StatisticalSummary s = ComputeStatisticalSummary(dataset, 3);

  CheckTrue(dataset.NumLocalExamples() == 0, "empty dataset has no examples");
  CheckTrue(s.count == 0, "empty count");
  CheckTrue(s.Dimension() == 3, "empty dimension");
  CheckClose(s.mean, arma::vec(3, arma::fill::zeros), 0.0, "empty mean");
  CheckClose(s.variance, arma::vec(3, arma::fill::zeros), 0.0,
      "empty variance");

  TestPassed("TestEmptyDataset");
}

int main()
{
  TestTreeReduceSums();
  TestSummaryMatchesArmadillo();
  TestSummaryIgnoresPartitionOrder();
  TestSampleVariance();
  TestSparseMatchesDense();
  TestSummaryDimensionMismatch();
  TestEmptyDataset();

  return 0;
}
