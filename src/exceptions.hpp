/**
 * exceptions.hpp
 *
 * Error types raised by the GLM training code.  Everything derives from the
 * standard exception hierarchy so callers can catch std::invalid_argument or
 * std::runtime_error as usual.
 */
#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <sstream>
#include <stdexcept>
#include <string>

namespace normglm {

// A feature vector, summary, or coefficient vector has the wrong dimension.
class DimensionMismatch : public std::invalid_argument
{
 public:
  explicit DimensionMismatch(const std::string& what) :
      std::invalid_argument(what) { }
};

// A normalization context was built or used with an inconsistent dimension.
class InvalidDimension : public std::invalid_argument
{
 public:
  explicit InvalidDimension(const std::string& what) :
      std::invalid_argument(what) { }
};

// Raised by the training driver when an optimizer ended in the FAILED state.
class OptimizationFailure : public std::runtime_error
{
 public:
  explicit OptimizationFailure(const std::string& what) :
      std::runtime_error(what) { }
};

/**
 * Throw a DimensionMismatch of the form
 * "<where>: expected dimension <expected>, got <actual>".
 */
inline void CheckDimension(const std::string& where,
                           const size_t expected,
                           const size_t actual)
{
  if (expected != actual)
  {
    std::ostringstream oss;
    oss << where << ": expected dimension " << expected << ", got " << actual;
    throw DimensionMismatch(oss.str());
  }
}

} // namespace normglm

#endif
