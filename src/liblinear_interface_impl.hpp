/**
 * liblinear_interface_impl.hpp
 *
 * Convenience interface for dealing with LIBLINEAR.
 */
#ifndef LIBLINEAR_INTERFACE_IMPL_HPP
#define LIBLINEAR_INTERFACE_IMPL_HPP

#include "liblinear_interface.hpp"
#include "exceptions.hpp"
#include <cstring>

namespace normglm {

template<typename MatType>
feature_node** MatToFeatureNodes(const MatType& X)
{
  feature_node** result = new feature_node*[X.n_cols];
  #pragma omp parallel for
  for (size_t i = 0; i < X.n_cols; ++i)
  {
    result[i] = ColToFeatureNode(X, i);
  }

  return result;
}

template<typename eT>
feature_node* ColToFeatureNode(const arma::Mat<eT>& X, const size_t col)
{
  // For a fully dense matrix we have to look at all elements.
  size_t nnz = 0;
  for (size_t i = 0; i < X.n_rows; ++i)
  {
    if (X(i, col) != eT(0))
      ++nnz;
  }

  feature_node* c = new feature_node[nnz + 1];
  size_t current_index = 0;
  for (size_t i = 0; i < X.n_rows; ++i)
  {
    // Skip zero elements...
    if (X(i, col) == eT(0))
      continue;

    c[current_index].index = i + 1; // dimensions start from 1
    c[current_index].value = (double) X(i, col);
    ++current_index;
  }
  c[current_index].index = -1;
  c[current_index].value = 0.0;

  return c;
}

template<typename eT>
feature_node* ColToFeatureNode(const arma::SpMat<eT>& X, const size_t col)
{
  // For a sparse matrix we need to copy only nonzero elements.
  typename arma::SpMat<eT>::const_iterator it = X.begin_col(col);
  size_t subset_nnz = 0;
  while (it != X.end_col(col))
  {
    ++subset_nnz;
    ++it;
  }

  feature_node* c = new feature_node[subset_nnz + 1];
  size_t index = 0;
  it = X.begin_col(col);
  while (it != X.end_col(col))
  {
    c[index].index = it.row() + 1; // dimensions start from 1
    c[index].value = (*it);
    ++index;
    ++it;
  }
  c[subset_nnz].index = -1;
  c[subset_nnz].value = 0.0;

  return c;
}

inline void CleanFeatureNodes(feature_node**& nodes, const size_t n)
{
  if (nodes == NULL)
    return;

  for (size_t i = 0; i < n; ++i)
    delete[] nodes[i];
  delete[] nodes;
  nodes = NULL;
}

inline void SilentPrint(const char* /* s */) { }

template<typename MatType>
arma::vec TrainReferenceLogisticRegression(const MatType& X,
                                           const arma::rowvec& labels,
                                           const double l2Weight,
                                           const double epsilon,
                                           const bool verbose)
{
  CheckDimension("TrainReferenceLogisticRegression(): labels", X.n_cols,
      labels.n_elem);
  if (l2Weight <= 0.0)
  {
    throw std::invalid_argument("TrainReferenceLogisticRegression(): the L2 "
                                "weight must be positive");
  }

  arma::rowvec y(labels.n_elem);
  for (size_t i = 0; i < labels.n_elem; ++i)
    y[i] = (labels[i] == 1.0) ? 1.0 : -1.0;

  struct problem prob;
  std::memset(&prob, 0, sizeof(prob));
  prob.l = (int) X.n_cols;
  prob.n = (int) X.n_rows;
  prob.y = y.memptr();
  prob.x = MatToFeatureNodes(X);
  prob.bias = -1; // the intercept, if any, is already a feature

  // LIBLINEAR minimizes 0.5 ||w||^2 + C * sum(loss).
  struct parameter param;
  std::memset(&param, 0, sizeof(param));
  param.solver_type = L2R_LR;
  param.eps = epsilon;
  param.C = 1.0 / l2Weight;
  param.p = 0.1;
  param.regularize_bias = 1;

  set_print_string_function(verbose ? NULL : &SilentPrint);

  const char* error = check_parameter(&prob, &param);
  if (error != NULL)
  {
    CleanFeatureNodes(prob.x, X.n_cols);
    std::ostringstream oss;
    oss << "TrainReferenceLogisticRegression(): " << error;
    throw std::invalid_argument(oss.str());
  }

  struct model* m = train(&prob, &param);

  // The weight vector is for the positive class of label[0].
  arma::vec w(X.n_rows);
  const double sign = (m->label[0] == 1) ? 1.0 : -1.0;
  for (size_t j = 0; j < X.n_rows; ++j)
    w[j] = sign * m->w[j];

  free_and_destroy_model(&m);
  CleanFeatureNodes(prob.x, X.n_cols);

  return w;
}

} // namespace normglm

#endif
