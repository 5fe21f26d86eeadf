/**
 * coefficient_transform.hpp
 *
 * Evaluate linear predictors and their derivatives in normalized space while
 * reading only the untransformed features.
 *
 * With x' = (x - s) % f, a predictor in normalized space expands to
 *
 *   theta' . x' = (theta' % f) . x - theta' . (f % s),
 *
 * so one dot product against the raw column plus a per-evaluation constant
 * gives the normalized margin.  Sums of the form sum_i c_i x'_i similarly
 * become f % (sum_i c_i x_i - s * sum_i c_i).
 */
#ifndef COEFFICIENT_TRANSFORM_HPP
#define COEFFICIENT_TRANSFORM_HPP

#include <armadillo>
#include "normalization_context.hpp"

namespace normglm {

// Dot product of `v` with column `col` of `X`.
template<typename eT>
double ColumnDot(const arma::vec& v, const arma::Mat<eT>& X, const size_t col);

template<typename eT>
double ColumnDot(const arma::vec& v,
                 const arma::SpMat<eT>& X,
                 const size_t col);

// y += a * X.col(col).
template<typename eT>
void ColumnAxpy(const double a,
                const arma::Mat<eT>& X,
                const size_t col,
                arma::vec& y);

template<typename eT>
void ColumnAxpy(const double a,
                const arma::SpMat<eT>& X,
                const size_t col,
                arma::vec& y);

/**
 * A coefficient (or direction) vector prepared for one evaluation: `effective`
 * is theta' % f and `shiftTerm` is theta' . (f % s).
 */
struct PreparedCoefficients
{
  arma::vec effective;
  double shiftTerm;
};

/**
 * Coefficients mapped back to the raw feature space.  If the context has an
 * intercept, the correction is already folded into the intercept coefficient
 * and `interceptCorrection` is 0.
 */
struct OriginalCoefficients
{
  arma::vec coefficients;
  double interceptCorrection;
};

class CoefficientSpaceTransform
{
 public:
  /**
   * The transform keeps a reference to `context`, which must outlive it.
   */
  explicit CoefficientSpaceTransform(const NormalizationContext& context);

  PreparedCoefficients Prepare(const arma::vec& coefficients) const;

  // theta' . x'_col without forming x'.
  template<typename MatType>
  double Margin(const PreparedCoefficients& prepared,
                const MatType& X,
                const size_t col) const
  {
    return ColumnDot(prepared.effective, X, col) - prepared.shiftTerm;
  }

  /**
   * Given rawSum = sum_i c_i x_i and scalarSum = sum_i c_i, store
   * sum_i c_i x'_i in `result`.
   */
  void FinishGradient(const arma::vec& rawSum,
                      const double scalarSum,
                      arma::vec& result) const;

  // Explicit transform of one vector, (x - s) % f.
  arma::vec TransformVector(const arma::vec& x) const;

  // Explicit transform of every column; the result is always dense.
  template<typename MatType>
  arma::mat TransformFeatures(const MatType& X) const;

  OriginalCoefficients ToOriginalSpace(const arma::vec& normalized) const;

  /**
   * Inverse of ToOriginalSpace().  A nonzero correction can only be absorbed
   * when the context has an intercept.
   */
  arma::vec ToNormalizedSpace(const arma::vec& coefficients,
                              const double interceptCorrection = 0.0) const;

  const NormalizationContext& Context() const { return context; }

 private:
  const NormalizationContext& context;
};

} // namespace normglm

#include "coefficient_transform_impl.hpp"

#endif
