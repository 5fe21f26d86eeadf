/**
 * train_mpi_glm.cpp
 *
 * Train a generalized linear model over MPI across a range of L2
 * regularization weights, with each worker holding one shard of the data.
 * Objectives and train/test metrics are stored in a CSV file.
 */
#include <mpi.h>
#include <omp.h>
#include "mpi_utils.hpp"
#include "mpi_normalization.hpp"
#include "../libsvm.hpp"
#include "../data_utils.hpp"
#include "../statistical_summary.hpp"
#include "../glm_training.hpp"
#include <cmath>
#include <fstream>
#include <iostream>

using namespace std;
using namespace normglm;

void help(char** argv)
{
  cout << "Usage: " << argv[0] << " <input_data_basename> <test_data_basename> "
       << "<extension> data_dim output_file.csv seed task optimizer "
       << "normalization min_reg max_reg count [warm_start [verbose]]" << endl
       << endl
       << " - note: first two arguments should be basename of data;"
       << endl
       << "     data should be stored as input_data.partition.ext"
       << endl
       << "     for some extension ext (svm/csv/etc.)"
       << endl
       << " - note: dimensionality of data must be specified"
       << endl
       << " - task is one of 'logistic', 'linear', 'poisson'"
       << endl
       << " - optimizer is one of 'lbfgs', 'tron'"
       << endl
       << " - normalization is one of 'none', 'scale', 'standardization'"
       << endl
       << " - note: lambda values go from 10^{max_reg} down to 10^{min_reg}"
       << endl
       << " - if warm_start is 1, each model starts from the previous one"
       << endl
       << " - verbose output is given if *any* argument is given"
       << endl
       << " - number of shards is set by number of MPI workers"
       << endl;
}

// Load this worker's shard and append the intercept row.
void LoadShard(const std::string& prefix,
               const std::string& extension,
               const size_t worker,
               const size_t dataDim,
               const bool binaryLabels,
               const bool verbose,
               arma::sp_mat& data,
               arma::rowvec& labels)
{
  std::ostringstream filename;
  filename << prefix << "." << worker << "." << extension;
  std::tuple<arma::sp_mat, arma::rowvec> t = load_libsvm<arma::sp_mat>(
      filename.str(), binaryLabels, dataDim, verbose);
  data = std::move(std::get<0>(t));
  labels = std::move(std::get<1>(t));

  if (data.n_rows != dataDim)
  {
    std::ostringstream oss;
    oss << "file '" << filename.str() << "' has " << data.n_rows
        << " dimensions, but data_dim is " << dataDim;
    throw std::invalid_argument(oss.str());
  }

  AppendIntercept(data);
}

int main(int argc, char** argv)
{
  // Make sure we got the right number of arguments.
  if (argc != 13 && argc != 14 && argc != 15)
  {
    help(argv);
    exit(1);
  }

  MPI_Init(NULL, NULL);
  int worker, worldSize;
  MPI_Comm_rank(MPI_COMM_WORLD, &worker);
  MPI_Comm_size(MPI_COMM_WORLD, &worldSize);

  try
  {
    const std::string inputFilePrefix(argv[1]);
    const std::string testFilePrefix(argv[2]);
    const std::string extension(argv[3]);
    const size_t dataDim = atoi(argv[4]);
    const std::string outputFile(argv[5]);
    const size_t seed = atoi(argv[6]);
    const TaskType task = TaskTypeFromString(argv[7]);
    const OptimizerType optimizer = OptimizerTypeFromString(argv[8]);
    const NormalizationType normalization =
        NormalizationTypeFromString(argv[9]);
    const double minReg = atof(argv[10]);
    const double maxReg = atof(argv[11]);
    const size_t count = atoi(argv[12]);
    const bool warmStart = (argc >= 14) ? (atoi(argv[13]) != 0) : true;
    const bool verbose = (argc == 15);

    srand(seed);
    arma::arma_rng::set_seed(seed);

    fstream f;
    if (worker == 0)
    {
      f.open(outputFile, fstream::out);
      if (!f.is_open())
      {
        std::ostringstream oss;
        oss << "failed to open output file '" << outputFile << "'";
        throw std::runtime_error(oss.str());
      }

      f << "task,optimizer,normalization,workers,lambda,objective,iterations,"
          << "status,train_metric,test_metric,time" << endl;
    }

    // Each worker loads only its own shard.
    const bool binaryLabels = (task == TaskType::LOGISTIC_REGRESSION);
    arma::sp_mat trainData, testData;
    arma::rowvec trainLabels, testLabels;
    LoadShard(inputFilePrefix, extension, worker, dataDim, binaryLabels,
        verbose && worker == 0, trainData, trainLabels);
    LoadShard(testFilePrefix, extension, worker, dataDim, binaryLabels,
        verbose && worker == 0, testData, testLabels);
    const size_t interceptIndex = dataDim;

    // Local partitions are processed by OpenMP threads.
    const size_t threads = omp_get_max_threads();
    const PartitionedDataset<arma::sp_mat> dataset =
        PartitionedDataset<arma::sp_mat>::Split(trainData, trainLabels,
        threads);
    const PartitionedDataset<arma::sp_mat> testDataset =
        PartitionedDataset<arma::sp_mat>::Split(testData, testLabels, threads);
    if (verbose)
    {
      cout << "Worker " << worker << " holds " << dataset.NumLocalExamples()
          << " training points in " << dataset.NumPartitions()
          << " partitions." << endl;
    }

    GLMTrainer trainer(task, optimizer);
    trainer.warmStart = warmStart;
    trainer.verbose = verbose;
    trainer.keepFailedModels = true;

    // Make sure no workers are hung up on something, so that our timing is
    // accurate.
    MPI_Barrier(MPI_COMM_WORLD);
    arma::wall_clock c;
    c.tic();
    const StatisticalSummary summary = ComputeStatisticalSummary(dataset,
        dataDim + 1, trainer.treeAggregateDepth);

    NormalizationContext context;
    if (worker == 0)
    {
      context = NormalizationContext::Build(summary, normalization,
          interceptIndex);
    }
    BroadcastNormalizationContext(context, 0);
    const double summaryTime = c.toc();

    if (worker == 0)
    {
      cout << "Computed feature summary over " << summary.count << " points "
          << "on " << worldSize << " workers in " << summaryTime << "s."
          << endl;
    }

    // Strongest regularization first, so warm starts follow the path.
    std::vector<double> lambdas;
    const double step = (count > 1) ? (maxReg - minReg) / (count - 1) : 0.0;
    for (size_t i = 0; i < count; ++i)
      lambdas.push_back(std::pow(10.0, maxReg - (step * i)));

    const std::vector<TrainedModel> models = trainer.Train(dataset, context,
        lambdas);

    MPI_Barrier(MPI_COMM_WORLD);

    for (size_t i = 0; i < models.size(); ++i)
    {
      // Every worker holds the same model; metrics are reduced over shards.
      const TrainedModel& m = models[i];
      const double trainMetric = EvaluateModel(m.model, dataset,
          trainer.treeAggregateDepth);
      const double testMetric = EvaluateModel(m.model, testDataset,
          trainer.treeAggregateDepth);

      if (worker == 0)
      {
        f << ToString(task) << "," << ToString(optimizer) << ","
            << ToString(normalization) << "," << worldSize << ","
            << m.l2Weight << "," << m.state.objectiveValue << ","
            << m.state.iterationCount << "," << ToString(m.state.status) << ","
            << trainMetric << "," << testMetric << "," << m.trainingTime
            << endl;
        cout << ToString(task) << " regression, " << worldSize << " workers ("
            << ToString(optimizer) << ", " << ToString(normalization)
            << "), lambda " << m.l2Weight << ": " << m.trainingTime
            << "s training time; " << m.state.iterationCount << " iterations; "
            << trainMetric << " training metric; " << testMetric
            << " testing metric." << endl;
      }
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << "Worker " << worker << ": error: " << e.what() << std::endl;
    MPI_Abort(MPI_COMM_WORLD, 1);
  }

  MPI_Finalize();
}
