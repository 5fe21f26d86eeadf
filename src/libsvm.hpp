/**
 * libsvm.hpp
 *
 * Simple loader for libsvm data.
 */
#ifndef LIBSVM_HPP
#define LIBSVM_HPP

#include <armadillo>
#include <string>
#include <tuple>

namespace normglm {

/**
 * Given a filename, return a matrix containing the data (one column per line)
 * and the labels.  Feature indices start from 1.  Lines that are empty or start
 * with '#' are skipped.
 *
 * If `binaryLabels` is set, a label of 1 maps to 1 and every other label to 0;
 * otherwise labels are kept as given.  The number of rows is the largest index
 * in the file, or `dimension` if that is larger (shards of one dataset may not
 * all contain the last feature).
 */
template<typename MatType>
std::tuple<MatType, arma::rowvec>
load_libsvm(const std::string& filename,
            const bool binaryLabels = false,
            const size_t dimension = 0,
            const bool verbose = false);

} // namespace normglm

// Include implementation.
#include "libsvm_impl.hpp"

#endif
