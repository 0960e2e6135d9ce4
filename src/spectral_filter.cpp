#include "gfcpd/spectral_filter.hpp"
#include "gfcpd/errors.hpp"
#include "progress_utils.hpp"   // Rprintf, elapsed_time()

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>

namespace gfcpd {

double gfss_gain(double lambda, double rho) {
    if (lambda <= rho) {
        return 1.0;
    }
    return std::sqrt(rho / lambda);
}

/**
 * @brief Builds the GFSS low-pass operator from a graph Laplacian
 *
 * @details
 * Steps:
 * 1. Validates rho and the Laplacian (square, finite, symmetric within tolerance)
 * 2. Computes the full eigendecomposition with Eigen::SelfAdjointEigenSolver
 *    (eigenvalues ascending, eigenvectors orthonormal)
 * 3. Rejects matrices with a clearly negative eigenvalue; round-off negatives and
 *    numerically zero eigenvalues are set to exactly 0, so every connected component
 *    contributes a DC direction with gain 1
 * 4. Forms F = V V^T with V = U diag(sqrt(g)), which is PSD by construction, and
 *    symmetrizes the product to remove round-off asymmetry
 *
 * All members are assigned only after every check has passed.
 */
spectral_filter_t::spectral_filter_t(const Eigen::MatrixXd& laplacian,
                                     double rho,
                                     const spectral_filter_params_t& params)
    : rho_(rho), n_components_(0) {

    if (!std::isfinite(rho) || rho <= 0.0) {
        throw invalid_parameter_error(
            "spectral_filter_t: rho must be a finite positive number, got " + std::to_string(rho));
    }

    const Eigen::Index d = laplacian.rows();
    if (d == 0 || laplacian.cols() != d) {
        throw invalid_graph_error(
            "spectral_filter_t: Laplacian must be a non-empty square matrix, got "
            + std::to_string(laplacian.rows()) + " x " + std::to_string(laplacian.cols()));
    }
    if (!laplacian.allFinite()) {
        throw invalid_graph_error("spectral_filter_t: Laplacian contains non-finite entries");
    }

    const double scale = std::max(1.0, laplacian.cwiseAbs().maxCoeff());
    const double asymmetry = (laplacian - laplacian.transpose()).cwiseAbs().maxCoeff();
    if (asymmetry > params.symmetry_tol * scale) {
        throw invalid_graph_error(
            "spectral_filter_t: Laplacian is not symmetric (max |L_ij - L_ji| = "
            + std::to_string(asymmetry) + ")");
    }

    auto ptm = std::chrono::steady_clock::now();

    const Eigen::MatrixXd sym_laplacian = 0.5 * (laplacian + laplacian.transpose());
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(sym_laplacian);
    if (solver.info() != Eigen::Success) {
        throw invalid_graph_error("spectral_filter_t: Laplacian eigendecomposition did not converge");
    }

    Eigen::VectorXd evalues = solver.eigenvalues();
    const double lambda_max = evalues(d - 1);
    const double zero_tol = params.zero_eigenvalue_tol * std::max(1.0, std::abs(lambda_max));

    if (evalues(0) < -zero_tol) {
        throw invalid_graph_error(
            "spectral_filter_t: Laplacian is not positive semi-definite (smallest eigenvalue "
            + std::to_string(evalues(0)) + ")");
    }

    size_t n_zero = 0;
    for (Eigen::Index i = 0; i < d; ++i) {
        if (evalues(i) <= zero_tol) {
            evalues(i) = 0.0;
            ++n_zero;
        }
    }

    Eigen::VectorXd gains = evalues.unaryExpr([rho](double lambda) { return gfss_gain(lambda, rho); });

    const Eigen::MatrixXd& evectors = solver.eigenvectors();
    const Eigen::MatrixXd v = evectors * gains.cwiseSqrt().asDiagonal();
    const Eigen::MatrixXd f = v * v.transpose();

    filter_matrix_ = 0.5 * (f + f.transpose());
    eigenvectors_ = evectors;
    eigenvalues_ = std::move(evalues);
    gains_ = std::move(gains);
    n_components_ = n_zero;

    if (params.verbose) {
        Rprintf("spectral_filter_t: %d nodes, rho = %.6e\n", static_cast<int>(d), rho_);
        Rprintf("  - Eigenvalue range: [%.6e, %.6e]\n", eigenvalues_(0), lambda_max);
        Rprintf("  - Zero eigenvalues (components): %zu\n", n_components_);
        Rprintf("  - Frequencies attenuated (lambda > rho): %d\n",
                static_cast<int>((eigenvalues_.array() > rho_).count()));
        elapsed_time(ptm, "  - Eigendecomposition and filter construction", true);
    }
}

void spectral_filter_t::check_width(const Eigen::MatrixXd& signal, const char* caller) const {
    if (static_cast<size_t>(signal.cols()) != n_nodes()) {
        throw dimension_mismatch_error(
            std::string(caller) + ": signal has " + std::to_string(signal.cols())
            + " columns but the graph has " + std::to_string(n_nodes()) + " nodes");
    }
}

Eigen::MatrixXd spectral_filter_t::apply(const Eigen::MatrixXd& signal) const {
    check_width(signal, "spectral_filter_t::apply");
    return signal * filter_matrix_.transpose();
}

Eigen::MatrixXd spectral_filter_t::gft(const Eigen::MatrixXd& signal) const {
    check_width(signal, "spectral_filter_t::gft");
    return signal * eigenvectors_;
}

} // namespace gfcpd
