/**
 * glm_model_impl.hpp
 *
 * Implementation of GeneralizedLinearModel.
 */
#ifndef GLM_MODEL_IMPL_HPP
#define GLM_MODEL_IMPL_HPP

#include "glm_model.hpp"
#include "loss_functions.hpp"
#include "exceptions.hpp"

namespace normglm {

inline std::string ToString(const TaskType task)
{
  switch (task)
  {
    case TaskType::LOGISTIC_REGRESSION:
      return LogisticLoss::Name();
    case TaskType::LINEAR_REGRESSION:
      return SquaredLoss::Name();
    case TaskType::POISSON_REGRESSION:
      return PoissonLoss::Name();
  }

  return "unknown";
}

inline TaskType TaskTypeFromString(const std::string& name)
{
  if (name == LogisticLoss::Name())
    return TaskType::LOGISTIC_REGRESSION;
  else if (name == SquaredLoss::Name())
    return TaskType::LINEAR_REGRESSION;
  else if (name == PoissonLoss::Name())
    return TaskType::POISSON_REGRESSION;

  std::ostringstream oss;
  oss << "unknown task '" << name << "'; expected 'logistic', 'linear', or "
      << "'poisson'";
  throw std::invalid_argument(oss.str());
}

inline GeneralizedLinearModel::GeneralizedLinearModel() :
    task(TaskType::LOGISTIC_REGRESSION),
    interceptCorrection(0.0)
{
  // Nothing to do.
}

inline GeneralizedLinearModel::GeneralizedLinearModel(
    const TaskType task,
    arma::vec coefficients,
    const double interceptCorrection) :
    task(task),
    coefficients(std::move(coefficients)),
    interceptCorrection(interceptCorrection)
{
  // Nothing else to do.
}

template<typename MatType>
void GeneralizedLinearModel::Predict(const MatType& data,
                                     arma::rowvec& margins,
                                     const arma::rowvec& offsets) const
{
  CheckDimension("GeneralizedLinearModel::Predict()", coefficients.n_elem,
      data.n_rows);

  margins = coefficients.t() * data;
  margins += interceptCorrection;
  if (!offsets.is_empty())
  {
    CheckDimension("GeneralizedLinearModel::Predict(): offsets", data.n_cols,
        offsets.n_elem);
    margins += offsets;
  }
}

template<typename MatType>
void GeneralizedLinearModel::PredictMean(const MatType& data,
                                         arma::rowvec& means,
                                         const arma::rowvec& offsets) const
{
  Predict(data, means, offsets);
  switch (task)
  {
    case TaskType::LOGISTIC_REGRESSION:
      means.transform([](double z) { return LogisticLoss::Mean(z); });
      break;
    case TaskType::LINEAR_REGRESSION:
      break;
    case TaskType::POISSON_REGRESSION:
      means.transform([](double z) { return PoissonLoss::Mean(z); });
      break;
  }
}

template<typename MatType>
void GeneralizedLinearModel::PredictClass(const MatType& data,
                                          arma::rowvec& labels,
                                          const double threshold,
                                          const arma::rowvec& offsets) const
{
  if (task != TaskType::LOGISTIC_REGRESSION)
  {
    throw std::invalid_argument("GeneralizedLinearModel::PredictClass(): "
                                "only logistic regression models predict "
                                "classes");
  }

  arma::rowvec means;
  PredictMean(data, means, offsets);
  labels = arma::conv_to<arma::rowvec>::from(means >= threshold);
}

} // namespace normglm

#endif
