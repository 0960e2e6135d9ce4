#ifndef GFCPD_SEXP_CPP_CONVERSION_UTILS_HPP
#define GFCPD_SEXP_CPP_CONVERSION_UTILS_HPP

#ifndef R_NO_REMAP
#define R_NO_REMAP
#endif
#include <R.h>
#include <Rinternals.h>

#include "gfcpd/eigen_config.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace gfcpd {

// R -> C++ (throw std::invalid_argument on malformed input)
Eigen::MatrixXd Rmatrix_to_eigen(SEXP s_matrix, const char* arg_name);
std::vector<double> Rvect_to_CppVect_double(SEXP s_vect, const char* arg_name);
std::vector<size_t> Rvect_to_breakpoints(SEXP s_breakpoints);

// C++ -> R (returned objects are unprotected)
SEXP convert_vector_double_to_R(const std::vector<double>& vec);
SEXP convert_breakpoints_to_R(const std::vector<size_t>& breakpoints);
SEXP eigen_vector_to_R(const Eigen::VectorXd& vec);
SEXP eigen_matrix_to_R(const Eigen::MatrixXd& mat);

} // namespace gfcpd

#endif // GFCPD_SEXP_CPP_CONVERSION_UTILS_HPP
