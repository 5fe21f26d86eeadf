/**
 * test_glm_objective.cpp
 *
 * Tests for the normalization-transparent GLM objective: values, gradients,
 * and Hessian-vector products computed over raw features must agree with the
 * same quantities computed over explicitly normalized features.
 */
#include "../src/glm_objective.hpp"
#include "../src/statistical_summary.hpp"
#include "../src/data_utils.hpp"
#include "../src/exceptions.hpp"
#include "test_utils.hpp"

using namespace normglm;
using namespace normglm::test;

// Features on very different scales, with an intercept row at index 6.
arma::mat MakeFeatures(const size_t seed)
{
  arma::arma_rng::set_seed(seed);
  arma::mat X = arma::randn<arma::mat>(6, 120);
  X.row(0) = 40.0 * X.row(0) + 120.0;
  X.row(1) = 0.05 * X.row(1) + 3.0;
  X.row(2) = arma::round(arma::abs(X.row(2)));
  X.row(4) = 1000.0 * X.row(4);
  AppendIntercept(X);
  return X;
}

// Labels that make sense for each loss.
template<typename LossType>
arma::rowvec MakeLabels(const size_t n);

template<>
arma::rowvec MakeLabels<LogisticLoss>(const size_t n)
{
  arma::rowvec y(n);
  for (size_t i = 0; i < n; ++i)
    y[i] = (i % 3 == 0) ? 1.0 : 0.0;
  return y;
}

template<>
arma::rowvec MakeLabels<SquaredLoss>(const size_t n)
{
  return arma::linspace<arma::rowvec>(-2.0, 5.0, n);
}

template<>
arma::rowvec MakeLabels<PoissonLoss>(const size_t n)
{
  arma::rowvec y(n);
  for (size_t i = 0; i < n; ++i)
    y[i] = (double) (i % 4);
  return y;
}

/**
 * Compare the objective over raw features under a standardization context
 * against the objective over explicitly standardized features under the
 * identity.
 */
template<typename LossType, typename MatType>
void CheckEquivalence(const MatType& X, const std::string& name)
{
  const size_t n = X.n_cols;
  const size_t d = X.n_rows;
  const arma::rowvec labels = MakeLabels<LossType>(n);
  const arma::rowvec weights = arma::linspace<arma::rowvec>(0.5, 2.0, n);
  const arma::rowvec offsets = arma::linspace<arma::rowvec>(-0.1, 0.1, n);

  const PartitionedDataset<MatType> raw = PartitionedDataset<MatType>::Split(
      X, labels, 5, weights, offsets);
  const StatisticalSummary summary = ComputeStatisticalSummary(raw, d);

  const NormalizationType types[] = { NormalizationType::SCALE,
      NormalizationType::STANDARDIZATION };
  for (size_t k = 0; k < 2; ++k)
  {
    const NormalizationContext context = NormalizationContext::Build(summary,
        types[k], d - 1);
    const CoefficientSpaceTransform transform(context);
    const arma::mat Xn = transform.TransformFeatures(X);
    const PartitionedDataset<arma::mat> normalized =
        PartitionedDataset<arma::mat>::Split(Xn, labels, 3, weights, offsets);
    const NormalizationContext identity;

    const NormalizationTransparentObjective<LossType, MatType> implicit(raw,
        context, 0.3);
    const NormalizationTransparentObjective<LossType, arma::mat> explicitly(
        normalized, identity, 0.3);
    CheckTrue(implicit.DomainDimension() == d, name + ": dimension");
    CheckTrue(explicitly.DomainDimension() == d, name + ": inferred dimension");

    arma::arma_rng::set_seed(31 + k);
    for (size_t trial = 0; trial < 3; ++trial)
    {
      const arma::vec theta = 0.2 * arma::randn<arma::vec>(d);
      const arma::vec v = arma::randn<arma::vec>(d);

      arma::vec g1, g2, hv1, hv2;
      const double f1 = implicit.EvaluateWithGradient(theta, g1);
      const double f2 = explicitly.EvaluateWithGradient(theta, g2);
      implicit.HessianVector(theta, v, hv1);
      explicitly.HessianVector(theta, v, hv2);

      CheckClose(f1, f2, 1e-9, name + ": value");
      CheckClose(implicit.Evaluate(theta), f1, 1e-12, name + ": Evaluate()");
      CheckClose(g1, g2, 1e-9, name + ": gradient");
      CheckClose(hv1, hv2, 1e-9, name + ": Hessian-vector product");
    }
  }
}

void TestEquivalenceDense()
{
  const arma::mat X = MakeFeatures(41);
  CheckEquivalence<LogisticLoss>(X, "dense logistic");
  CheckEquivalence<SquaredLoss>(X, "dense linear");
  CheckEquivalence<PoissonLoss>(X, "dense poisson");

  TestPassed("TestEquivalenceDense");
}

void TestEquivalenceSparse()
{
  arma::arma_rng::set_seed(42);
  arma::sp_mat X = arma::sprandu<arma::sp_mat>(8, 150, 0.25);
  X.row(1) *= 50.0;
  X.row(3) *= 0.02;
  AppendIntercept(X);

  CheckEquivalence<LogisticLoss>(X, "sparse logistic");
  CheckEquivalence<SquaredLoss>(X, "sparse linear");
  CheckEquivalence<PoissonLoss>(X, "sparse poisson");

  TestPassed("TestEquivalenceSparse");
}

void TestNoneMatchesPlainObjective()
{
  const arma::mat X = MakeFeatures(43);
  const arma::rowvec labels = MakeLabels<LogisticLoss>(X.n_cols);
  const PartitionedDataset<arma::mat> dataset =
      PartitionedDataset<arma::mat>::Split(X, labels, 4);
  const NormalizationContext context = NormalizationContext::Build(
      ComputeStatisticalSummary(dataset, X.n_rows), NormalizationType::NONE,
      X.n_rows - 1);

  const double lambda = 2.5;
  const NormalizationTransparentObjective<LogisticLoss, arma::mat> objective(
      dataset, context, lambda);

  arma::arma_rng::set_seed(44);
  const arma::vec theta = 0.01 * arma::randn<arma::vec>(X.n_rows);

  double expected = 0.5 * lambda * arma::dot(theta, theta);
  arma::vec expectedGradient = lambda * theta;
  for (size_t i = 0; i < X.n_cols; ++i)
  {
    const double z = arma::dot(theta, X.col(i));
    expected += LogisticLoss::Loss(labels[i], z);
    expectedGradient += LogisticLoss::Derivative(labels[i], z) * X.col(i);
  }

  arma::vec gradient;
  const double value = objective.EvaluateWithGradient(theta, gradient);
  CheckClose(value, expected, 1e-12, "identity value");
  CheckClose(gradient, expectedGradient, 1e-10, "identity gradient");

  TestPassed("TestNoneMatchesPlainObjective");
}

void TestFiniteDifferences()
{
  const arma::mat X = MakeFeatures(45);
  const arma::rowvec labels = MakeLabels<LogisticLoss>(X.n_cols);
  const PartitionedDataset<arma::mat> dataset =
      PartitionedDataset<arma::mat>::Split(X, labels, 2);
  const NormalizationContext context = NormalizationContext::Build(
      ComputeStatisticalSummary(dataset, X.n_rows),
      NormalizationType::STANDARDIZATION, X.n_rows - 1);
  const NormalizationTransparentObjective<LogisticLoss, arma::mat> objective(
      dataset, context, 0.1);

  arma::arma_rng::set_seed(46);
  const arma::vec theta = 0.3 * arma::randn<arma::vec>(X.n_rows);
  const arma::vec v = arma::normalise(arma::randn<arma::vec>(X.n_rows));

  arma::vec gradient, hv;
  objective.Gradient(theta, gradient);
  objective.HessianVector(theta, v, hv);

  const double h = 1e-5;
  for (size_t j = 0; j < theta.n_elem; ++j)
  {
    arma::vec plus(theta), minus(theta);
    plus[j] += h;
    minus[j] -= h;
    const double fd = (objective.Evaluate(plus) - objective.Evaluate(minus)) /
        (2 * h);
    CheckClose(gradient[j], fd, 1e-5, "finite-difference gradient");
  }

  arma::vec gPlus, gMinus;
  objective.Gradient(theta + h * v, gPlus);
  objective.Gradient(theta - h * v, gMinus);
  CheckClose(hv, arma::vec((gPlus - gMinus) / (2 * h)), 1e-5,
      "finite-difference Hessian-vector product");

  TestPassed("TestFiniteDifferences");
}

void TestObjectiveDimensionChecks()
{
  const arma::mat X = MakeFeatures(47);
  const arma::rowvec labels = MakeLabels<SquaredLoss>(X.n_cols);
  const PartitionedDataset<arma::mat> dataset =
      PartitionedDataset<arma::mat>::Split(X, labels, 3);
  const NormalizationContext context = NormalizationContext::Build(
      ComputeStatisticalSummary(dataset, X.n_rows), NormalizationType::SCALE);
  const NormalizationContext shorter = NormalizationContext::Identity(
      X.n_rows - 1);

  CheckThrows<DimensionMismatch>([&dataset, &shorter]()
      {
        NormalizationTransparentObjective<SquaredLoss, arma::mat> objective(
            dataset, shorter);
      }, "context shorter than the data");
  CheckThrows<std::invalid_argument>([&dataset, &context]()
      {
        NormalizationTransparentObjective<SquaredLoss, arma::mat> objective(
            dataset, context, -1.0);
      }, "negative L2 weight");

  const NormalizationTransparentObjective<SquaredLoss, arma::mat> objective(
      dataset, context);
  CheckThrows<DimensionMismatch>([&objective, &X]()
      {
        objective.Evaluate(arma::vec(X.n_rows + 1, arma::fill::zeros));
      }, "coefficients of the wrong length");
  CheckThrows<DimensionMismatch>([&objective, &X]()
      {
        arma::vec hv;
        objective.HessianVector(arma::vec(X.n_rows, arma::fill::zeros),
            arma::vec(2, arma::fill::ones), hv);
      }, "direction of the wrong length");

  const PartitionedDataset<arma::mat> empty;
  CheckThrows<std::invalid_argument>([&empty]()
      {
        const NormalizationContext identity;
        NormalizationTransparentObjective<SquaredLoss, arma::mat> objective(
            empty, identity);
      }, "unknown dimension");

  TestPassed("TestObjectiveDimensionChecks");
}

void TestEmptyProcessContributesNothing()
{
  // A process without data still takes part, given the dimension.
  const PartitionedDataset<arma::mat> empty;
  const NormalizationContext identity;
  const NormalizationTransparentObjective<LogisticLoss, arma::mat> objective(
      empty, identity, 4, 2.0, 2);

  const arma::vec theta("1.0 -1.0 0.5 2.0");
  arma::vec gradient;
  const double value = objective.EvaluateWithGradient(theta, gradient);
  CheckClose(value, 0.5 * 2.0 * arma::dot(theta, theta), 1e-15,
      "empty objective value");
  CheckClose(gradient, arma::vec(2.0 * theta), 1e-15,
      "empty objective gradient");

  TestPassed("TestEmptyProcessContributesNothing");
}

int main()
{
  TestEquivalenceDense();
  TestEquivalenceSparse();
  TestNoneMatchesPlainObjective();
  TestFiniteDifferences();
  TestObjectiveDimensionChecks();
  TestEmptyProcessContributesNothing();

  return 0;
}
