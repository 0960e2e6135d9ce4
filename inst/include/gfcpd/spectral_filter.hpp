/**
 * @file spectral_filter.hpp
 * @brief Graph-spectral low-pass filter used by the GFSS segment cost
 *
 * The filter is defined in the eigenbasis of a graph Laplacian L = U diag(lambda) U^T.
 * Each graph frequency lambda_i is scaled by the gain
 *
 *     g(0) = 1,    g(lambda) = min(1, sqrt(rho / lambda))  for lambda > 0,
 *
 * and the node-space operator is F = U diag(g(lambda)) U^T. Frequencies below the
 * cutoff rho pass unchanged; higher frequencies, i.e. components that vary sharply
 * between neighboring nodes, are attenuated.
 */

#ifndef GFCPD_SPECTRAL_FILTER_HPP
#define GFCPD_SPECTRAL_FILTER_HPP

#include "eigen_config.hpp"

#include <Eigen/Dense>
#include <cstddef>

namespace gfcpd {

/**
 * @brief Tolerances and reporting options for spectral_filter_t construction
 */
struct spectral_filter_params_t {
    /// Max |L_ij - L_ji| allowed, relative to max(1, max |L_ij|)
    double symmetry_tol = 1e-8;

    /// Eigenvalues with |lambda| below this (relative to max(1, lambda_max)) are zero
    double zero_eigenvalue_tol = 1e-10;

    /// Print eigendecomposition timing and spectrum summary
    bool verbose = false;
};

/**
 * @brief Low-pass gain of the GFSS filter at graph frequency lambda
 *
 * @param lambda Laplacian eigenvalue, already clamped to be non-negative
 * @param rho    Cutoff (cut sparsity), rho > 0
 * @return 1 for lambda <= rho (including lambda == 0), sqrt(rho/lambda) otherwise
 */
double gfss_gain(double lambda, double rho);

/**
 * @brief Reusable graph low-pass operator built from a Laplacian and a cutoff
 *
 * Construction computes the full symmetric eigendecomposition once; the filter
 * matrix and gains are cached for the lifetime of the object and never change.
 * A constructed filter is immutable and can be shared read-only across threads.
 */
class spectral_filter_t {
public:
    /**
     * @brief Decomposes the Laplacian and builds the filter operator
     *
     * @param laplacian Symmetric positive semi-definite d x d matrix
     * @param rho       Cutoff frequency, rho > 0
     * @param params    Tolerances and verbosity
     *
     * @throws invalid_graph_error     if the matrix is empty, not square, has non-finite
     *                                 entries, is not symmetric, has a clearly negative
     *                                 eigenvalue, or the eigensolver fails
     * @throws invalid_parameter_error if rho is not a finite positive number
     */
    spectral_filter_t(const Eigen::MatrixXd& laplacian,
                      double rho,
                      const spectral_filter_params_t& params = spectral_filter_params_t());

    /// Cached filter operator F = U diag(g) U^T (d x d, symmetric)
    const Eigen::MatrixXd& filter_matrix() const { return filter_matrix_; }

    /**
     * @brief Filters every time-row of a signal through F
     *
     * @param signal n x d matrix (rows = time, columns = nodes)
     * @return signal * F^T, n x d
     * @throws dimension_mismatch_error if signal.cols() != n_nodes()
     */
    Eigen::MatrixXd apply(const Eigen::MatrixXd& signal) const;

    /**
     * @brief Graph Fourier transform of every time-row
     *
     * @return signal * U, column i holding the coefficient on eigenvector i
     * @throws dimension_mismatch_error if signal.cols() != n_nodes()
     */
    Eigen::MatrixXd gft(const Eigen::MatrixXd& signal) const;

    const Eigen::VectorXd& eigenvalues() const { return eigenvalues_; }
    const Eigen::MatrixXd& eigenvectors() const { return eigenvectors_; }
    const Eigen::VectorXd& gains() const { return gains_; }

    double rho() const { return rho_; }
    size_t n_nodes() const { return static_cast<size_t>(eigenvalues_.size()); }

    /// Number of zero eigenvalues, i.e. connected components of the graph
    size_t n_components() const { return n_components_; }

private:
    void check_width(const Eigen::MatrixXd& signal, const char* caller) const;

    double rho_;
    size_t n_components_;
    Eigen::VectorXd eigenvalues_;   ///< ascending, clamped to >= 0
    Eigen::MatrixXd eigenvectors_;  ///< orthonormal columns
    Eigen::VectorXd gains_;         ///< g(eigenvalues_)
    Eigen::MatrixXd filter_matrix_;
};

} // namespace gfcpd

#endif // GFCPD_SPECTRAL_FILTER_HPP
