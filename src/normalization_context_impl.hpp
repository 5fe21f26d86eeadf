/**
 * normalization_context_impl.hpp
 *
 * Implementation of NormalizationContext.
 */
#ifndef NORMALIZATION_CONTEXT_IMPL_HPP
#define NORMALIZATION_CONTEXT_IMPL_HPP

#include "normalization_context.hpp"
#include "exceptions.hpp"
#include <cmath>

namespace normglm {

inline std::string ToString(const NormalizationType type)
{
  switch (type)
  {
    case NormalizationType::NONE:
      return "none";
    case NormalizationType::SCALE:
      return "scale";
    case NormalizationType::STANDARDIZATION:
      return "standardization";
  }

  return "unknown";
}

inline NormalizationType NormalizationTypeFromString(const std::string& name)
{
  if (name == "none")
    return NormalizationType::NONE;
  else if (name == "scale")
    return NormalizationType::SCALE;
  else if (name == "standardization")
    return NormalizationType::STANDARDIZATION;

  std::ostringstream oss;
  oss << "unknown normalization type '" << name << "'; expected 'none', "
      << "'scale', or 'standardization'";
  throw std::invalid_argument(oss.str());
}

inline NormalizationContext::NormalizationContext() :
    kind(IDENTITY),
    hasIntercept(false),
    interceptIndex(0),
    dimension(0)
{
  // Nothing to do.
}

inline NormalizationContext::NormalizationContext(arma::vec factorsIn,
                                                  arma::vec shiftsIn,
                                                  const bool hasIntercept,
                                                  const size_t interceptIndex) :
    factors(std::move(factorsIn)),
    shifts(std::move(shiftsIn)),
    hasIntercept(hasIntercept),
    interceptIndex(interceptIndex),
    dimension(0)
{
  if (!factors.is_empty() && !shifts.is_empty() &&
      factors.n_elem != shifts.n_elem)
  {
    std::ostringstream oss;
    oss << "NormalizationContext: " << factors.n_elem << " factors but "
        << shifts.n_elem << " shifts";
    throw InvalidDimension(oss.str());
  }

  if (factors.is_empty() && shifts.is_empty())
    kind = IDENTITY;
  else if (shifts.is_empty())
    kind = SCALE_ONLY;
  else if (factors.is_empty())
    kind = SHIFT_ONLY;
  else
    kind = SCALE_AND_SHIFT;

  dimension = std::max(factors.n_elem, shifts.n_elem);

  if (hasIntercept && dimension > 0 && interceptIndex >= dimension)
  {
    std::ostringstream oss;
    oss << "NormalizationContext: intercept index " << interceptIndex
        << " is out of range for dimension " << dimension;
    throw InvalidDimension(oss.str());
  }

  // The intercept is an additive term, never a measured feature.
  if (hasIntercept && HasFactors())
    factors[interceptIndex] = 1.0;
  if (hasIntercept && HasShifts())
    shifts[interceptIndex] = 0.0;
}

inline NormalizationContext NormalizationContext::Identity(
    const size_t dimension)
{
  NormalizationContext context;
  context.dimension = dimension;
  return context;
}

inline NormalizationContext NormalizationContext::Build(
    const StatisticalSummary& summary,
    const NormalizationType type)
{
  return FromSummary(summary, type, false, 0, kVarianceEpsilon);
}

inline NormalizationContext NormalizationContext::Build(
    const StatisticalSummary& summary,
    const NormalizationType type,
    const size_t interceptIndex)
{
  return FromSummary(summary, type, true, interceptIndex, kVarianceEpsilon);
}

inline NormalizationContext NormalizationContext::FromSummary(
    const StatisticalSummary& summary,
    const NormalizationType type,
    const bool hasIntercept,
    const size_t interceptIndex,
    const double varianceEpsilon)
{
  const size_t d = summary.Dimension();
  if (hasIntercept && interceptIndex >= d)
  {
    std::ostringstream oss;
    oss << "NormalizationContext::Build(): intercept index " << interceptIndex
        << " is out of range for dimension " << d;
    throw InvalidDimension(oss.str());
  }

  if (type == NormalizationType::NONE)
  {
    NormalizationContext context = Identity(d);
    context.hasIntercept = hasIntercept;
    context.interceptIndex = interceptIndex;
    return context;
  }

  // Near-constant features keep a factor of 1 instead of blowing up.
  arma::vec factors(d);
  for (size_t i = 0; i < d; ++i)
  {
    const double m = summary.mean[i];
    const double threshold = varianceEpsilon * std::max(m * m, 1.0);
    if (summary.max[i] == summary.min[i] || summary.variance[i] <= threshold)
      factors[i] = 1.0;
    else
      factors[i] = 1.0 / std::sqrt(summary.variance[i]);
  }

  arma::vec shifts;
  if (type == NormalizationType::STANDARDIZATION)
    shifts = summary.mean;

  NormalizationContext context(std::move(factors), std::move(shifts),
      hasIntercept, interceptIndex);
  context.dimension = d;
  return context;
}

inline void NormalizationContext::CheckDimension(const size_t d) const
{
  if (dimension != 0 && d != dimension)
  {
    std::ostringstream oss;
    oss << "NormalizationContext: context has dimension " << dimension
        << " but the data has dimension " << d;
    throw InvalidDimension(oss.str());
  }
}

inline arma::vec NormalizationContext::Pack() const
{
  // [kind, hasIntercept, interceptIndex, dimension, factors..., shifts...]
  const size_t nf = factors.n_elem;
  const size_t ns = shifts.n_elem;
  arma::vec packed(4 + nf + ns);
  packed[0] = (double) kind;
  packed[1] = hasIntercept ? 1.0 : 0.0;
  packed[2] = (double) interceptIndex;
  packed[3] = (double) dimension;
  if (nf > 0)
    packed.subvec(4, 3 + nf) = factors;
  if (ns > 0)
    packed.subvec(4 + nf, 3 + nf + ns) = shifts;
  return packed;
}

inline NormalizationContext NormalizationContext::Unpack(
    const arma::vec& packed)
{
  if (packed.n_elem < 4)
  {
    throw InvalidDimension("NormalizationContext::Unpack(): truncated "
                           "context");
  }

  NormalizationContext context;
  context.kind = (Kind) (int) packed[0];
  context.hasIntercept = (packed[1] != 0.0);
  context.interceptIndex = (size_t) packed[2];
  context.dimension = (size_t) packed[3];

  const size_t d = context.dimension;
  size_t expected = 4;
  if (context.HasFactors())
    expected += d;
  if (context.HasShifts())
    expected += d;
  normglm::CheckDimension("NormalizationContext::Unpack()", expected,
      packed.n_elem);

  size_t pos = 4;
  if (context.HasFactors())
  {
    context.factors = packed.subvec(pos, pos + d - 1);
    pos += d;
  }
  if (context.HasShifts())
    context.shifts = packed.subvec(pos, pos + d - 1);

  return context;
}

} // namespace normglm

#endif
