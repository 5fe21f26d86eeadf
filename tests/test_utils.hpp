/**
 * test_utils.hpp
 *
 * Small checking helpers shared by the test programs.  A failed check prints
 * the reason and exits with a nonzero status.
 */
#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <armadillo>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace normglm {
namespace test {

inline void TestPassed(const std::string& name)
{
  std::cout << "[ok] " << name << std::endl;
}

inline void TestFailed(const std::string& name, const std::string& reason)
{
  std::cerr << "[FAILED] " << name << ": " << reason << std::endl;
  exit(1);
}

inline void CheckTrue(const bool condition, const std::string& what)
{
  if (!condition)
    TestFailed(what, "condition is false");
}

// |a - b| <= tol * max(1, |a|, |b|).
inline void CheckClose(const double a,
                       const double b,
                       const double tol,
                       const std::string& what)
{
  const double scale = std::max(1.0, std::max(std::abs(a), std::abs(b)));
  if (!(std::abs(a - b) <= tol * scale))
  {
    std::ostringstream oss;
    oss.precision(17);
    oss << "expected " << b << ", got " << a << " (tolerance " << tol << ")";
    TestFailed(what, oss.str());
  }
}

inline void CheckClose(const arma::vec& a,
                       const arma::vec& b,
                       const double tol,
                       const std::string& what)
{
  if (a.n_elem != b.n_elem)
  {
    std::ostringstream oss;
    oss << "expected " << b.n_elem << " elements, got " << a.n_elem;
    TestFailed(what, oss.str());
  }

  for (size_t i = 0; i < a.n_elem; ++i)
  {
    std::ostringstream element;
    element << what << " [" << i << "]";
    CheckClose(a[i], b[i], tol, element.str());
  }
}

// `f()` must throw ExceptionType.
template<typename ExceptionType, typename FunctionType>
void CheckThrows(FunctionType f, const std::string& what)
{
  try
  {
    f();
  }
  catch (const ExceptionType&)
  {
    return;
  }

  TestFailed(what, "no exception was thrown");
}

} // namespace test
} // namespace normglm

#endif
