/**
 * normalization_context.hpp
 *
 * Per-feature scale factors and shifts derived from a statistical summary.
 */
#ifndef NORMALIZATION_CONTEXT_HPP
#define NORMALIZATION_CONTEXT_HPP

#include <armadillo>
#include <string>
#include "statistical_summary.hpp"

namespace normglm {

enum class NormalizationType
{
  NONE,            // identity
  SCALE,           // divide by the standard deviation
  STANDARDIZATION  // subtract the mean, then divide by the standard deviation
};

std::string ToString(const NormalizationType type);
NormalizationType NormalizationTypeFromString(const std::string& name);

/**
 * The transform x' = (x - shifts) % factors, where either vector may be
 * absent (all ones / all zeros).  Which of the two are present is the Kind of
 * the context; consumers switch on it once per evaluation.
 *
 * A context is immutable after construction and may be shared read-only by
 * any number of threads.
 */
class NormalizationContext
{
 public:
  enum Kind
  {
    IDENTITY,
    SCALE_ONLY,
    SHIFT_ONLY,
    SCALE_AND_SHIFT
  };

  // Constant features (min == max), and features whose variance is at most
  // kVarianceEpsilon * max(mean^2, 1), keep a factor of exactly 1.
  static constexpr double kVarianceEpsilon = 1e-12;

  // The identity transform, valid for any dimension.
  NormalizationContext();

  /**
   * Build a context from explicit factors and shifts.  An empty vector means
   * the part is absent.  If both are present their lengths must agree.
   */
  NormalizationContext(arma::vec factors,
                       arma::vec shifts,
                       const bool hasIntercept = false,
                       const size_t interceptIndex = 0);

  // Identity transform for a known dimension.
  static NormalizationContext Identity(const size_t dimension);

  /**
   * Derive the context for `type` from `summary`.  If an intercept index is
   * given, that feature always has factor 1 and shift 0.
   */
  static NormalizationContext Build(const StatisticalSummary& summary,
                                    const NormalizationType type);

  static NormalizationContext Build(const StatisticalSummary& summary,
                                    const NormalizationType type,
                                    const size_t interceptIndex);

  Kind GetKind() const { return kind; }
  bool HasFactors() const { return kind == SCALE_ONLY ||
      kind == SCALE_AND_SHIFT; }
  bool HasShifts() const { return kind == SHIFT_ONLY ||
      kind == SCALE_AND_SHIFT; }

  // Empty when absent.
  const arma::vec& Factors() const { return factors; }
  const arma::vec& Shifts() const { return shifts; }

  bool HasIntercept() const { return hasIntercept; }
  size_t InterceptIndex() const { return interceptIndex; }

  // 0 for an identity context that was not given a dimension.
  size_t Dimension() const { return dimension; }

  /**
   * Throw InvalidDimension if vectors of `dimension` features cannot be used
   * with this context.
   */
  void CheckDimension(const size_t dimension) const;

  // Serialized form used to broadcast the context.
  arma::vec Pack() const;
  static NormalizationContext Unpack(const arma::vec& packed);

 private:
  static NormalizationContext FromSummary(const StatisticalSummary& summary,
                                          const NormalizationType type,
                                          const bool hasIntercept,
                                          const size_t interceptIndex,
                                          const double varianceEpsilon);

  Kind kind;
  arma::vec factors;
  arma::vec shifts;
  bool hasIntercept;
  size_t interceptIndex;
  size_t dimension;
};

} // namespace normglm

#include "normalization_context_impl.hpp"

#endif
