/**
 * train_glm.cpp
 *
 * Train a generalized linear model across a range of L2 regularization
 * weights with normalization folded into the objective, storing the
 * objectives and train/test metrics in a CSV file.
 */
#include "libsvm.hpp"
#include "data_utils.hpp"
#include "statistical_summary.hpp"
#include "normalization_context.hpp"
#include "glm_training.hpp"
#include <cmath>
#include <fstream>
#include <iostream>

using namespace std;
using namespace normglm;

void help(char** argv)
{
  cout << "Usage: " << argv[0] << " input_data.svm[,test_data.svm] "
       << "output_file.csv seed task optimizer normalization partitions "
       << "min_reg max_reg count [warm_start [verbose]]" << endl
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
       << endl;
}

int main(int argc, char** argv)
{
  // Make sure we got the right number of arguments.
  if (argc != 11 && argc != 12 && argc != 13)
  {
    help(argv);
    exit(1);
  }

  try
  {
    const std::tuple<std::string, std::string> inputFiles =
        SplitDatasetArgument(argv[1]);
    const std::string inputFile(std::get<0>(inputFiles));
    const std::string testFile(std::get<1>(inputFiles));
    const std::string outputFile(argv[2]);
    const size_t seed = atoi(argv[3]);
    const TaskType task = TaskTypeFromString(argv[4]);
    const OptimizerType optimizer = OptimizerTypeFromString(argv[5]);
    const NormalizationType normalization =
        NormalizationTypeFromString(argv[6]);
    const size_t partitions = atoi(argv[7]);
    const double minReg = atof(argv[8]);
    const double maxReg = atof(argv[9]);
    const size_t count = atoi(argv[10]);
    const bool warmStart = (argc >= 12) ? (atoi(argv[11]) != 0) : true;
    const bool verbose = (argc == 13);

    if (count == 0 || partitions == 0)
    {
      help(argv);
      exit(1);
    }

    const bool binaryLabels = (task == TaskType::LOGISTIC_REGRESSION);
    std::tuple<arma::sp_mat, arma::rowvec> t = load_libsvm<arma::sp_mat>(
        inputFile, binaryLabels, 0, verbose);

    srand(seed);
    arma::arma_rng::set_seed(seed);

    // Split into training and test sets.
    arma::sp_mat trainData, testData;
    arma::rowvec trainLabels, testLabels;
    if (testFile.empty())
    {
      TrainTestSplit(std::get<0>(t), std::get<1>(t), 0.8, trainData,
          trainLabels, testData, testLabels);
    }
    else
    {
      // Load the test file separately.
      std::tuple<arma::sp_mat, arma::rowvec> t2 = load_libsvm<arma::sp_mat>(
          testFile, binaryLabels, 0, verbose);

      trainData = std::move(std::get<0>(t));
      trainLabels = std::move(std::get<1>(t));
      testData = std::move(std::get<0>(t2));
      testLabels = std::move(std::get<1>(t2));

      // Ensure matrices have the same dimension.
      const size_t maxDimension = std::max(trainData.n_rows, testData.n_rows);
      trainData.resize(maxDimension, trainData.n_cols);
      testData.resize(maxDimension, testData.n_cols);
    }

    const size_t interceptIndex = AppendIntercept(trainData);
    AppendIntercept(testData);

    const PartitionedDataset<arma::sp_mat> dataset =
        PartitionedDataset<arma::sp_mat>::Split(trainData, trainLabels,
        partitions);

    arma::wall_clock c;
    c.tic();
    GLMTrainer trainer(task, optimizer);
    trainer.warmStart = warmStart;
    trainer.verbose = verbose;

    const StatisticalSummary summary = ComputeStatisticalSummary(dataset,
        trainData.n_rows, trainer.treeAggregateDepth);
    const NormalizationContext context = NormalizationContext::Build(summary,
        normalization, interceptIndex);
    const double summaryTime = c.toc();
    cout << "Computed feature summary over " << summary.count << " points and "
        << summary.Dimension() << " dimensions in " << summaryTime << "s."
        << endl;

    // Strongest regularization first, so warm starts follow the path.
    std::vector<double> lambdas;
    const double step = (count > 1) ? (maxReg - minReg) / (count - 1) : 0.0;
    for (size_t i = 0; i < count; ++i)
      lambdas.push_back(std::pow(10.0, maxReg - (step * i)));

    // Failed models are reported in the output, not fatal.
    trainer.keepFailedModels = true;
    const std::vector<TrainedModel> models = trainer.Train(dataset, context,
        lambdas);

    fstream f(outputFile, fstream::out);
    if (!f.is_open())
    {
      std::cerr << "Failed to open output file '" << outputFile << "'!"
          << std::endl;
      exit(1);
    }

    f << "task,optimizer,normalization,lambda,objective,iterations,status,"
        << "train_metric,test_metric,time" << endl;
    for (size_t i = 0; i < models.size(); ++i)
    {
      const TrainedModel& m = models[i];
      const double trainMetric = EvaluateModel(m.model, dataset,
          trainer.treeAggregateDepth);
      const double testMetric = EvaluateModel(m.model, testData, testLabels);

      f << ToString(task) << "," << ToString(optimizer) << ","
          << ToString(normalization) << "," << m.l2Weight << ","
          << m.state.objectiveValue << "," << m.state.iterationCount << ","
          << ToString(m.state.status) << "," << trainMetric << ","
          << testMetric << "," << m.trainingTime << endl;
      cout << ToString(task) << " regression (" << ToString(optimizer) << ", "
          << ToString(normalization) << "), lambda " << m.l2Weight << ": "
          << m.trainingTime << "s training time; " << m.state.iterationCount
          << " iterations; " << trainMetric << " training "
          << ((task == TaskType::LOGISTIC_REGRESSION) ? "accuracy" : "RMSE")
          << "; " << testMetric << " testing "
          << ((task == TaskType::LOGISTIC_REGRESSION) ? "accuracy" : "RMSE")
          << "." << endl;
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
