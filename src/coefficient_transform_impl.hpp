/**
 * coefficient_transform_impl.hpp
 *
 * Implementation of CoefficientSpaceTransform and the column helpers.
 */
#ifndef COEFFICIENT_TRANSFORM_IMPL_HPP
#define COEFFICIENT_TRANSFORM_IMPL_HPP

#include "coefficient_transform.hpp"
#include "exceptions.hpp"

namespace normglm {

template<typename eT>
inline double ColumnDot(const arma::vec& v,
                        const arma::Mat<eT>& X,
                        const size_t col)
{
  const eT* x = X.colptr(col);
  double ret = 0;
  for (size_t j = 0; j < X.n_rows; ++j)
    ret += v[j] * x[j];
  return ret;
}

template<typename eT>
inline double ColumnDot(const arma::vec& v,
                        const arma::SpMat<eT>& X,
                        const size_t col)
{
  double ret = 0;
  typename arma::SpMat<eT>::const_iterator it = X.begin_col(col);
  while (it != X.end_col(col))
  {
    ret += v[it.row()] * (*it);
    ++it;
  }
  return ret;
}

template<typename eT>
inline void ColumnAxpy(const double a,
                       const arma::Mat<eT>& X,
                       const size_t col,
                       arma::vec& y)
{
  const eT* x = X.colptr(col);
  for (size_t j = 0; j < X.n_rows; ++j)
    y[j] += a * x[j];
}

template<typename eT>
inline void ColumnAxpy(const double a,
                       const arma::SpMat<eT>& X,
                       const size_t col,
                       arma::vec& y)
{
  typename arma::SpMat<eT>::const_iterator it = X.begin_col(col);
  while (it != X.end_col(col))
  {
    y[it.row()] += a * (*it);
    ++it;
  }
}

inline CoefficientSpaceTransform::CoefficientSpaceTransform(
    const NormalizationContext& context) :
    context(context)
{
  // Nothing else to do.
}

inline PreparedCoefficients CoefficientSpaceTransform::Prepare(
    const arma::vec& coefficients) const
{
  context.CheckDimension(coefficients.n_elem);

  PreparedCoefficients prepared;
  switch (context.GetKind())
  {
    case NormalizationContext::IDENTITY:
      prepared.effective = coefficients;
      prepared.shiftTerm = 0.0;
      break;

    case NormalizationContext::SCALE_ONLY:
      prepared.effective = coefficients % context.Factors();
      prepared.shiftTerm = 0.0;
      break;

    case NormalizationContext::SHIFT_ONLY:
      prepared.effective = coefficients;
      prepared.shiftTerm = arma::dot(coefficients, context.Shifts());
      break;

    case NormalizationContext::SCALE_AND_SHIFT:
      prepared.effective = coefficients % context.Factors();
      prepared.shiftTerm = arma::dot(prepared.effective, context.Shifts());
      break;
  }

  return prepared;
}

inline void CoefficientSpaceTransform::FinishGradient(
    const arma::vec& rawSum,
    const double scalarSum,
    arma::vec& result) const
{
  switch (context.GetKind())
  {
    case NormalizationContext::IDENTITY:
      result = rawSum;
      break;

    case NormalizationContext::SCALE_ONLY:
      result = rawSum % context.Factors();
      break;

    case NormalizationContext::SHIFT_ONLY:
      result = rawSum - scalarSum * context.Shifts();
      break;

    case NormalizationContext::SCALE_AND_SHIFT:
      result = (rawSum - scalarSum * context.Shifts()) % context.Factors();
      break;
  }
}

inline arma::vec CoefficientSpaceTransform::TransformVector(
    const arma::vec& x) const
{
  context.CheckDimension(x.n_elem);

  arma::vec result = x;
  if (context.HasShifts())
    result -= context.Shifts();
  if (context.HasFactors())
    result %= context.Factors();
  return result;
}

template<typename MatType>
arma::mat CoefficientSpaceTransform::TransformFeatures(const MatType& X) const
{
  context.CheckDimension(X.n_rows);

  arma::mat result(X);
  if (context.HasShifts())
    result.each_col() -= context.Shifts();
  if (context.HasFactors())
    result.each_col() %= context.Factors();
  return result;
}

inline OriginalCoefficients CoefficientSpaceTransform::ToOriginalSpace(
    const arma::vec& normalized) const
{
  const PreparedCoefficients prepared = Prepare(normalized);

  OriginalCoefficients result;
  result.coefficients = prepared.effective;
  result.interceptCorrection = -prepared.shiftTerm;

  if (context.HasIntercept())
  {
    result.coefficients[context.InterceptIndex()] +=
        result.interceptCorrection;
    result.interceptCorrection = 0.0;
  }

  return result;
}

inline arma::vec CoefficientSpaceTransform::ToNormalizedSpace(
    const arma::vec& coefficients,
    const double interceptCorrection) const
{
  context.CheckDimension(coefficients.n_elem);

  arma::vec result = coefficients;
  if (context.HasFactors())
    result /= context.Factors();

  // The intercept absorbs theta . s plus any explicit correction.
  double correction = interceptCorrection;
  if (context.HasShifts())
    correction += arma::dot(coefficients, context.Shifts());

  if (correction != 0.0)
  {
    if (!context.HasIntercept())
    {
      throw std::invalid_argument("CoefficientSpaceTransform::"
          "ToNormalizedSpace(): a shifted model without an intercept cannot "
          "represent this intercept correction");
    }

    result[context.InterceptIndex()] += correction;
  }

  return result;
}

} // namespace normglm

#endif
