/**
 * test_normalization_training.cpp
 *
 * End-to-end tests of GLMTrainer: training with normalization folded into the
 * objective must give the same models as training on explicitly normalized
 * data, and must recover a noiseless logistic model under every
 * normalization type.
 */
#include "../src/glm_training.hpp"
#include "../src/statistical_summary.hpp"
#include "../src/libsvm.hpp"
#include "../src/data_utils.hpp"
#include "../src/exceptions.hpp"
#include "test_utils.hpp"

using namespace normglm;
using namespace normglm::test;

/**
 * Draw `n` points from a noiseless logistic model over 10 features with very
 * different scales.  Points closer than 0.75 to the decision boundary (in
 * standardized units) are rejected, so the classes are separated by a gap.
 * An intercept row is appended.
 */
void GenerateSeparable(const size_t n, arma::mat& data, arma::rowvec& labels)
{
  const arma::vec direction = arma::normalise(arma::vec(
      "1.0 -2.0 0.5 1.5 -1.0 0.0 2.0 -0.5 1.0 0.8"));
  const arma::vec scales("1.0 10.0 0.5 5.0 20.0 1.0 0.2 2.0 3.0 1.0");
  const arma::vec offsets("0.0 5.0 -1.0 2.0 0.0 -3.0 1.0 10.0 0.0 2.0");
  const double bias = 0.3;

  data.set_size(10, n);
  labels.set_size(n);
  size_t i = 0;
  while (i < n)
  {
    const arma::vec z = arma::randn<arma::vec>(10);
    const double s = arma::dot(direction, z) - bias;
    if (std::abs(s) < 0.75)
      continue;

    data.col(i) = scales % z + offsets;
    labels[i] = (s > 0) ? 1.0 : 0.0;
    ++i;
  }

  AppendIntercept(data);
}

void TestSeparableLogistic()
{
  arma::arma_rng::set_seed(61);
  arma::mat trainData, testData;
  arma::rowvec trainLabels, testLabels;
  GenerateSeparable(100, trainData, trainLabels);
  GenerateSeparable(100, testData, testLabels);

  const PartitionedDataset<arma::mat> dataset =
      PartitionedDataset<arma::mat>::Split(trainData, trainLabels, 4);
  const StatisticalSummary summary = ComputeStatisticalSummary(dataset,
      trainData.n_rows);

  const NormalizationType types[] = { NormalizationType::NONE,
      NormalizationType::SCALE, NormalizationType::STANDARDIZATION };
  for (size_t k = 0; k < 3; ++k)
  {
    const NormalizationContext context = NormalizationContext::Build(summary,
        types[k], trainData.n_rows - 1);

    GLMTrainer trainer(TaskType::LOGISTIC_REGRESSION, OptimizerType::LBFGS);
    trainer.maxNumIterations = 100;
    trainer.tolerance = 1e-5;
    // Without regularization the separable optimum is at infinity; only the
    // classifier matters here.
    trainer.keepFailedModels = true;
    const std::vector<TrainedModel> models = trainer.Train(dataset, context,
        std::vector<double>(1, 0.0));
    CheckTrue(models.size() == 1, "one model per weight");
    CheckTrue(models[0].model.Coefficients().is_finite(),
        "finite coefficients");

    arma::rowvec predicted;
    models[0].model.PredictClass(trainData, predicted);
    const std::string name = ToString(types[k]);
    CheckTrue(arma::accu(predicted != trainLabels) == 0,
        name + ": every training point classified correctly");

    const double testAccuracy = EvaluateModel(models[0].model, testData,
        testLabels);
    CheckTrue(testAccuracy >= 0.95, name + ": test accuracy at least 95%");
  }

  TestPassed("TestSeparableLogistic");
}

void LoadHeart(arma::sp_mat& data, arma::rowvec& labels)
{
  std::tuple<arma::sp_mat, arma::rowvec> t = load_libsvm<arma::sp_mat>(
      std::string(NORMGLM_TEST_DATA_DIR) + "/heart_like.svm", true);
  data = std::move(std::get<0>(t));
  labels = std::move(std::get<1>(t));
  AppendIntercept(data);
}

/**
 * Train on raw features with the context folded into the objective, and on
 * explicitly transformed features with the identity; both must agree.
 */
void CheckHeartEquivalence(const TaskType task,
                           const OptimizerType optimizer,
                           const NormalizationType type)
{
  arma::sp_mat data;
  arma::rowvec labels;
  LoadHeart(data, labels);
  const size_t interceptIndex = data.n_rows - 1;

  const PartitionedDataset<arma::sp_mat> raw =
      PartitionedDataset<arma::sp_mat>::Split(data, labels, 4);
  const NormalizationContext context = NormalizationContext::Build(
      ComputeStatisticalSummary(raw, data.n_rows), type, interceptIndex);
  const CoefficientSpaceTransform transform(context);

  const arma::mat transformed = transform.TransformFeatures(data);
  const PartitionedDataset<arma::mat> explicitly =
      PartitionedDataset<arma::mat>::Split(transformed, labels, 4);
  const NormalizationContext identity = NormalizationContext::Identity(
      data.n_rows);

  GLMTrainer trainer(task, optimizer);
  trainer.maxNumIterations = 500;
  trainer.tolerance = 1e-10;
  trainer.keepFailedModels = true;
  const std::vector<double> lambdas(1, 1.0);

  const TrainedModel a = trainer.Train(raw, context, lambdas)[0];
  const TrainedModel b = trainer.Train(explicitly, identity, lambdas)[0];

  const std::string name = ToString(task) + "/" + ToString(optimizer) + "/" +
      ToString(type);
  CheckTrue(a.state.status == b.state.status, name + ": same status");
  CheckTrue(a.state.status != OptimizerStatus::FAILED, name + ": not failed");
  CheckClose(a.state.objectiveValue, b.state.objectiveValue, 1e-6,
      name + ": objective");
  CheckClose(a.normalizedCoefficients, b.normalizedCoefficients, 1e-6,
      name + ": normalized coefficients");

  // The reported model predicts on raw features what the explicit model
  // predicts on transformed ones.
  arma::rowvec rawMargins, transformedMargins;
  a.model.Predict(data, rawMargins);
  b.model.Predict(transformed, transformedMargins);
  CheckClose(rawMargins.t(), transformedMargins.t(), 1e-5,
      name + ": margins");

  // And the reported model maps back to the optimizer's solution.
  CheckClose(transform.ToNormalizedSpace(a.model.Coefficients(),
      a.model.InterceptCorrection()), a.normalizedCoefficients, 1e-6,
      name + ": round trip");
}

void TestHeartEquivalence()
{
  const TaskType tasks[] = { TaskType::LOGISTIC_REGRESSION,
      TaskType::LINEAR_REGRESSION, TaskType::POISSON_REGRESSION };
  const OptimizerType optimizers[] = { OptimizerType::LBFGS,
      OptimizerType::TRON };
  for (size_t t = 0; t < 3; ++t)
  {
    for (size_t o = 0; o < 2; ++o)
    {
      CheckHeartEquivalence(tasks[t], optimizers[o],
          NormalizationType::STANDARDIZATION);
    }
  }

  CheckHeartEquivalence(TaskType::LOGISTIC_REGRESSION, OptimizerType::TRON,
      NormalizationType::SCALE);

  TestPassed("TestHeartEquivalence");
}

void TestWarmStartPath()
{
  arma::sp_mat data;
  arma::rowvec labels;
  LoadHeart(data, labels);
  const PartitionedDataset<arma::sp_mat> dataset =
      PartitionedDataset<arma::sp_mat>::Split(data, labels, 3);
  const NormalizationContext context = NormalizationContext::Build(
      ComputeStatisticalSummary(dataset, data.n_rows),
      NormalizationType::STANDARDIZATION, data.n_rows - 1);

  double lambdaArray[] = { 100.0, 10.0, 1.0 };
  const std::vector<double> lambdas(lambdaArray, lambdaArray + 3);

  GLMTrainer trainer(TaskType::LOGISTIC_REGRESSION, OptimizerType::TRON);
  trainer.tolerance = 1e-10;
  const std::vector<TrainedModel> warm = trainer.Train(dataset, context,
      lambdas);
  trainer.warmStart = false;
  const std::vector<TrainedModel> cold = trainer.Train(dataset, context,
      lambdas);

  CheckTrue(warm.size() == 3 && cold.size() == 3, "one model per weight");
  for (size_t i = 0; i < 3; ++i)
  {
    CheckTrue(warm[i].l2Weight == lambdas[i], "models in the given order");
    CheckClose(warm[i].normalizedCoefficients, cold[i].normalizedCoefficients,
        1e-5, "warm and cold starts agree");
  }

  // Weaker regularization fits the training data at least as well.
  const double strong = EvaluateModel(warm[0].model, dataset);
  const double weak = EvaluateModel(warm[2].model, dataset);
  CheckTrue(weak >= strong - 0.05, "weaker regularization is not worse");
  CheckTrue(arma::norm(warm[2].normalizedCoefficients, 2) >
      arma::norm(warm[0].normalizedCoefficients, 2),
      "weaker regularization gives larger coefficients");

  TestPassed("TestWarmStartPath");
}

void TestL1Penalty()
{
  arma::sp_mat data;
  arma::rowvec labels;
  LoadHeart(data, labels);
  const PartitionedDataset<arma::sp_mat> dataset =
      PartitionedDataset<arma::sp_mat>::Split(data, labels, 2);
  const NormalizationContext context = NormalizationContext::Build(
      ComputeStatisticalSummary(dataset, data.n_rows),
      NormalizationType::STANDARDIZATION, data.n_rows - 1);

  // A penalty this strong keeps every coefficient at zero.
  GLMTrainer trainer(TaskType::LOGISTIC_REGRESSION, OptimizerType::LBFGS);
  trainer.l1Weight = 1e4;
  const std::vector<TrainedModel> models = trainer.Train(dataset, context,
      std::vector<double>(1, 1.0));
  CheckTrue(models[0].state.status == OptimizerStatus::CONVERGED,
      "L1 converged");
  CheckTrue(arma::accu(models[0].normalizedCoefficients != 0.0) == 0,
      "L1 zeroes every coefficient");

  trainer.optimizer = OptimizerType::TRON;
  CheckThrows<std::invalid_argument>([&trainer, &dataset, &context]()
      {
        trainer.Train(dataset, context, std::vector<double>(1, 1.0));
      }, "TRON with an L1 penalty");

  TestPassed("TestL1Penalty");
}

void TestTrainerErrors()
{
  arma::sp_mat data;
  arma::rowvec labels;
  LoadHeart(data, labels);
  const PartitionedDataset<arma::sp_mat> dataset =
      PartitionedDataset<arma::sp_mat>::Split(data, labels, 2);
  const NormalizationContext context = NormalizationContext::Build(
      ComputeStatisticalSummary(dataset, data.n_rows),
      NormalizationType::STANDARDIZATION, data.n_rows - 1);

  GLMTrainer trainer(TaskType::POISSON_REGRESSION, OptimizerType::TRON);
  CheckThrows<std::invalid_argument>([&trainer, &dataset, &context]()
      {
        trainer.Train(dataset, context, std::vector<double>());
      }, "no regularization weights");

  // exp() overflows at this starting point.
  trainer.initialCoefficients = arma::vec(data.n_rows);
  trainer.initialCoefficients.fill(1000.0);
  CheckThrows<OptimizationFailure>([&trainer, &dataset, &context]()
      {
        trainer.Train(dataset, context, std::vector<double>(1, 1.0));
      }, "non-finite starting point");

  trainer.keepFailedModels = true;
  const std::vector<TrainedModel> kept = trainer.Train(dataset, context,
      std::vector<double>(1, 1.0));
  CheckTrue(kept[0].state.convergenceReason ==
      ConvergenceReason::NON_FINITE_VALUE, "failed model is kept");

  trainer.initialCoefficients = arma::vec(3, arma::fill::zeros);
  CheckThrows<DimensionMismatch>([&trainer, &dataset, &context]()
      {
        trainer.Train(dataset, context, std::vector<double>(1, 1.0));
      }, "starting point of the wrong dimension");

  CheckThrows<std::invalid_argument>([]()
      {
        TaskTypeFromString("probit");
      }, "unknown task");
  CheckThrows<std::invalid_argument>([]()
      {
        OptimizerTypeFromString("sgd");
      }, "unknown optimizer");

  TestPassed("TestTrainerErrors");
}

int main()
{
  TestSeparableLogistic();
  TestHeartEquivalence();
  TestWarmStartPath();
  TestL1Penalty();
  TestTrainerErrors();

  return 0;
}
