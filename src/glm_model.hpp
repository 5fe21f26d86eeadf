/**
 * glm_model.hpp
 *
 * A trained generalized linear model, expressed in the original (raw) feature
 * space.
 */
#ifndef GLM_MODEL_HPP
#define GLM_MODEL_HPP

#include <armadillo>
#include <string>

namespace normglm {

enum class TaskType
{
  LOGISTIC_REGRESSION,
  LINEAR_REGRESSION,
  POISSON_REGRESSION
};

std::string ToString(const TaskType task);
TaskType TaskTypeFromString(const std::string& name);

class GeneralizedLinearModel
{
 public:
  GeneralizedLinearModel();

  GeneralizedLinearModel(const TaskType task,
                         arma::vec coefficients,
                         const double interceptCorrection = 0.0);

  /**
   * Linear predictor for every column of `data`:
   * coefficients . x + interceptCorrection + offset.  Empty `offsets` means
   * zero offsets.
   */
  template<typename MatType>
  void Predict(const MatType& data,
               arma::rowvec& margins,
               const arma::rowvec& offsets = arma::rowvec()) const;

  // The inverse link applied to Predict().
  template<typename MatType>
  void PredictMean(const MatType& data,
                   arma::rowvec& means,
                   const arma::rowvec& offsets = arma::rowvec()) const;

  /**
   * Class labels in {0, 1}: 1 where the predicted mean reaches `threshold`.
   * Only valid for logistic regression models.
   */
  template<typename MatType>
  void PredictClass(const MatType& data,
                    arma::rowvec& labels,
                    const double threshold = 0.5,
                    const arma::rowvec& offsets = arma::rowvec()) const;

  TaskType Task() const { return task; }
  const arma::vec& Coefficients() const { return coefficients; }
  double InterceptCorrection() const { return interceptCorrection; }
  size_t Dimension() const { return coefficients.n_elem; }

 private:
  TaskType task;
  arma::vec coefficients;
  double interceptCorrection;
};

} // namespace normglm

#include "glm_model_impl.hpp"

#endif
