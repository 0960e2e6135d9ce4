// Conversions between R objects and the C++ types of the gfcpd core.
//
// R matrices are column-major like Eigen's default storage, so matrices are copied
// element for element without transposition. Breakpoints cross unchanged: the
// exclusive end index t of a 0-based segment [s, t) is the inclusive 1-based index of
// the segment's last row in R.

#include "SEXP_cpp_conversion_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace gfcpd {

/**
 * @brief Copies a numeric R matrix into an Eigen::MatrixXd
 *
 * @param s_matrix Numeric (double) R matrix
 * @param arg_name Argument name used in error messages
 *
 * @throws std::invalid_argument if s_matrix is not a double matrix
 */
Eigen::MatrixXd Rmatrix_to_eigen(SEXP s_matrix, const char* arg_name) {
    if (!Rf_isMatrix(s_matrix) || !Rf_isReal(s_matrix)) {
        throw std::invalid_argument(std::string(arg_name) + " must be a numeric (double) matrix");
    }

    const int nrows = Rf_nrows(s_matrix);
    const int ncols = Rf_ncols(s_matrix);

    return Eigen::Map<const Eigen::MatrixXd>(REAL(s_matrix), nrows, ncols);
}

std::vector<double> Rvect_to_CppVect_double(SEXP s_vect, const char* arg_name) {
    if (!Rf_isReal(s_vect)) {
        throw std::invalid_argument(std::string(arg_name) + " must be a numeric vector");
    }
    return std::vector<double>(REAL(s_vect), REAL(s_vect) + XLENGTH(s_vect));
}

/**
 * @brief Converts an R integer or numeric vector of breakpoints to size_t indices
 *
 * @throws std::invalid_argument on NA, negative or non-integral values
 */
std::vector<size_t> Rvect_to_breakpoints(SEXP s_breakpoints) {
    const R_xlen_t n = XLENGTH(s_breakpoints);
    std::vector<size_t> breakpoints;
    breakpoints.reserve(static_cast<size_t>(n));

    if (Rf_isInteger(s_breakpoints)) {
        const int* ptr = INTEGER(s_breakpoints);
        for (R_xlen_t i = 0; i < n; ++i) {
            if (ptr[i] == NA_INTEGER || ptr[i] < 0) {
                throw std::invalid_argument("breakpoints must be non-negative and not NA");
            }
            breakpoints.push_back(static_cast<size_t>(ptr[i]));
        }
    } else if (Rf_isReal(s_breakpoints)) {
        const double* ptr = REAL(s_breakpoints);
        for (R_xlen_t i = 0; i < n; ++i) {
            if (!std::isfinite(ptr[i]) || ptr[i] < 0 || ptr[i] != std::floor(ptr[i])) {
                throw std::invalid_argument("breakpoints must be non-negative whole numbers");
            }
            breakpoints.push_back(static_cast<size_t>(ptr[i]));
        }
    } else {
        throw std::invalid_argument("breakpoints must be an integer or numeric vector");
    }

    return breakpoints;
}

SEXP convert_vector_double_to_R(const std::vector<double>& vec) {
    const R_xlen_t n = static_cast<R_xlen_t>(vec.size());
    SEXP Rvec = PROTECT(Rf_allocVector(REALSXP, n));
    double* ptr = REAL(Rvec);
    for (R_xlen_t j = 0; j < n; ++j) {
        ptr[j] = vec[j];
    }
    UNPROTECT(1);
    return Rvec;
}

SEXP convert_breakpoints_to_R(const std::vector<size_t>& breakpoints) {
    const R_xlen_t n = static_cast<R_xlen_t>(breakpoints.size());
    SEXP Rvec = PROTECT(Rf_allocVector(INTSXP, n));
    int* ptr = INTEGER(Rvec);
    for (R_xlen_t j = 0; j < n; ++j) {
        ptr[j] = static_cast<int>(breakpoints[j]);
    }
    UNPROTECT(1);
    return Rvec;
}

SEXP eigen_vector_to_R(const Eigen::VectorXd& vec) {
    const R_xlen_t n = static_cast<R_xlen_t>(vec.size());
    SEXP Rvec = PROTECT(Rf_allocVector(REALSXP, n));
    double* ptr = REAL(Rvec);
    for (R_xlen_t j = 0; j < n; ++j) {
        ptr[j] = vec(j);
    }
    UNPROTECT(1);
    return Rvec;
}

SEXP eigen_matrix_to_R(const Eigen::MatrixXd& mat) {
    const int nrow = static_cast<int>(mat.rows());
    const int ncol = static_cast<int>(mat.cols());
    SEXP Rmat = PROTECT(Rf_allocMatrix(REALSXP, nrow, ncol));
    double* ptr = REAL(Rmat);
    for (int c = 0; c < ncol; ++c) {
        for (int r = 0; r < nrow; ++r) {
            ptr[r + nrow * c] = mat(r, c);
        }
    }
    UNPROTECT(1);
    return Rmat;
}

} // namespace gfcpd
