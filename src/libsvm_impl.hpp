/**
 * libsvm_impl.hpp
 *
 * Simple loader for libsvm data.
 */
#ifndef LIBSVM_IMPL_HPP
#define LIBSVM_IMPL_HPP

#include "libsvm.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace normglm {

// Split "dim:val" into a 0-based dimension and a value.
inline void ParseLibSVMToken(const std::string& token,
                             const size_t lineNum,
                             size_t& dim,
                             double& val)
{
  const size_t colon = token.find(':');
  if (colon == std::string::npos)
  {
    std::ostringstream oss;
    oss << "Error on line " << lineNum << ": no ':' found in token: " << token;
    throw std::runtime_error(oss.str());
  }
  else if (colon == 0)
  {
    std::ostringstream oss;
    oss << "Error on line " << lineNum << ": no dimension found for token: "
        << token;
    throw std::runtime_error(oss.str());
  }

  const int rawDim = atoi(token.substr(0, colon).c_str());
  if (rawDim <= 0)
  {
    std::ostringstream oss;
    oss << "Error on line " << lineNum << ": could not parse dimension: "
        << token.substr(0, colon) << "; note that dimensions must start from 1";
    throw std::runtime_error(oss.str());
  }
  dim = (size_t) rawDim - 1;

  const std::string valStr = token.substr(colon + 1);
  char* end = NULL;
  errno = 0;
  val = std::strtod(valStr.c_str(), &end);
  if (errno == ERANGE)
  {
    std::ostringstream oss;
    oss << "Error on line " << lineNum << ": value '" << valStr << "' is out "
        << "of range";
    throw std::runtime_error(oss.str());
  }
  else if (valStr.empty() || *end != '\0')
  {
    std::ostringstream oss;
    oss << "Error on line " << lineNum << ": value '" << valStr << "' could "
        << "not be parsed to floating-point";
    throw std::runtime_error(oss.str());
  }
}

template<typename MatType>
std::tuple<MatType, arma::rowvec>
load_libsvm(const std::string& filename,
            const bool binaryLabels,
            const size_t dimension,
            const bool verbose)
{
  arma::wall_clock c;
  c.tic();

  // For the first pass, we have to compute the size of the matrix.
  std::ifstream f(filename);
  if (!f.good())
  {
    std::ostringstream oss;
    oss << "Error opening file '" << filename << "' for reading.";
    throw std::runtime_error(oss.str());
  }

  size_t rows = dimension;
  size_t points = 0;
  size_t lineNum = 0;
  std::string line, token;
  while (std::getline(f, line))
  {
    ++lineNum;
    std::istringstream iss(line);
    if (!(iss >> token) || token[0] == '#')
      continue;

    while (iss >> token)
    {
      size_t dim;
      double val;
      ParseLibSVMToken(token, lineNum, dim, val);
      rows = std::max(rows, dim + 1);
    }

    ++points;
  }

  if (verbose)
  {
    std::cout << "File '" << filename << "' contains a matrix with " << points
        << " observations in " << rows << " dimensions." << std::endl;
    std::cout << "First pass took " << c.toc() << "s." << std::endl;
  }

  c.tic();
  MatType result;
  result.zeros(rows, points);
  arma::rowvec labels(points);

  f.close();
  f.open(filename);
  if (!f.good())
  {
    std::ostringstream oss;
    oss << "Error opening file '" << filename << "' for reading.";
    throw std::runtime_error(oss.str());
  }

  size_t col = 0;
  lineNum = 0;
  while (std::getline(f, line))
  {
    ++lineNum;
    std::istringstream iss(line);
    if (!(iss >> token) || token[0] == '#')
      continue;

    // Handle label separately.
    char* end = NULL;
    const double label = std::strtod(token.c_str(), &end);
    if (*end != '\0')
    {
      std::ostringstream oss;
      oss << "Error on line " << lineNum << ": could not parse label '"
          << token << "'";
      throw std::runtime_error(oss.str());
    }

    if (binaryLabels)
      labels[col] = (label == 1.0) ? 1.0 : 0.0;
    else
      labels[col] = label;

    while (iss >> token)
    {
      size_t dim;
      double val;
      ParseLibSVMToken(token, lineNum, dim, val);
      if (val != 0.0)
        result(dim, col) = val;
    }

    ++col;
  }

  if (verbose)
  {
    std::cout << "Second pass for loading took " << c.toc() << "s."
        << std::endl;
  }

  return std::make_tuple(std::move(result), std::move(labels));
}

} // namespace normglm

#endif
