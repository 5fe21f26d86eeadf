/**
 * liblinear_interface.hpp
 *
 * Convenience interface for dealing with LIBLINEAR, used as a reference solver
 * for L2-regularized logistic regression.
 */
#ifndef LIBLINEAR_INTERFACE_HPP
#define LIBLINEAR_INTERFACE_HPP

#include <linear.h>
#include <armadillo>

namespace normglm {

// One LIBLINEAR row per column of X, terminated by index -1.
template<typename MatType>
feature_node** MatToFeatureNodes(const MatType& X);

template<typename eT>
feature_node* ColToFeatureNode(const arma::Mat<eT>& X, const size_t col);

template<typename eT>
feature_node* ColToFeatureNode(const arma::SpMat<eT>& X, const size_t col);

void CleanFeatureNodes(feature_node**& nodes, const size_t n);

/**
 * Minimize sum_i log(1 + exp(-y_i w . x_i)) + 0.5 * l2Weight * ||w||^2 with
 * LIBLINEAR's L2R_LR solver, where y_i = +1 for labels equal to 1 and -1
 * otherwise.  Any intercept must already be a feature of X; it is regularized
 * like every other coefficient.
 */
template<typename MatType>
arma::vec TrainReferenceLogisticRegression(const MatType& X,
                                           const arma::rowvec& labels,
                                           const double l2Weight,
                                           const double epsilon = 1e-6,
                                           const bool verbose = false);

} // namespace normglm

#include "liblinear_interface_impl.hpp"

#endif
