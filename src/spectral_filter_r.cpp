#include "gfcpd/spectral_filter.hpp"        // spectral_filter_t
#include "gfcpd/spectral_filter_r.h"
#include "SEXP_cpp_conversion_utils.hpp"    // Rmatrix_to_eigen, eigen_matrix_to_R, eigen_vector_to_R
#include "gfcpd/errors.hpp"                 // capture_error_message()
#include "error_utils.h"                    // REPORT_ERROR()

#include <memory>

/**
 * @brief R interface to the GFSS graph low-pass filter
 *
 * @param s_laplacian Numeric d x d graph Laplacian
 * @param s_rho       Cutoff rho > 0
 * @param s_verbose   Logical; print spectrum summary and timing
 *
 * @return Named list with components
 *   - evalues:       Laplacian eigenvalues (ascending, numerically zero ones set to 0)
 *   - evectors:      Eigenvectors as columns (d x d)
 *   - gains:         Filter gain g(lambda) for each eigenvalue
 *   - filter_matrix: Low-pass operator F = U diag(g) U^T (d x d)
 *   - n_components:  Number of zero eigenvalues
 *   - rho:           Cutoff used
 */
extern "C" SEXP S_gfss_spectral_filter(
	SEXP s_laplacian,
	SEXP s_rho,
	SEXP s_verbose
	) {

	// 1) Convert scalar inputs
	gfcpd::spectral_filter_params_t params;
	params.verbose   = (Rf_asLogical(s_verbose) == TRUE);
	const double rho = Rf_asReal(s_rho);

	// 2) Build the filter; C++ state is released before any R error is raised
	char error_buffer[512] = "";
	std::unique_ptr<gfcpd::spectral_filter_t> filter;
	const bool ok = gfcpd::capture_error_message([&]() {
		Eigen::MatrixXd laplacian = gfcpd::Rmatrix_to_eigen(s_laplacian, "laplacian");
		filter = std::make_unique<gfcpd::spectral_filter_t>(laplacian, rho, params);
	}, error_buffer, sizeof(error_buffer));
	if (!ok) {
		filter.reset();
		REPORT_ERROR("S_gfss_spectral_filter: %s", error_buffer);
	}

	// 3) Build the R list to return
	const int n_fields = 6;
	SEXP r_result = PROTECT(Rf_allocVector(VECSXP, n_fields));
	{
		SEXP names = PROTECT(Rf_allocVector(STRSXP, n_fields));
		SET_STRING_ELT(names, 0, Rf_mkChar("evalues"));
		SET_STRING_ELT(names, 1, Rf_mkChar("evectors"));
		SET_STRING_ELT(names, 2, Rf_mkChar("gains"));
		SET_STRING_ELT(names, 3, Rf_mkChar("filter_matrix"));
		SET_STRING_ELT(names, 4, Rf_mkChar("n_components"));
		SET_STRING_ELT(names, 5, Rf_mkChar("rho"));
		Rf_setAttrib(r_result, R_NamesSymbol, names);
		UNPROTECT(1); // names
	}

	SET_VECTOR_ELT(r_result, 0, gfcpd::eigen_vector_to_R(filter->eigenvalues()));
	SET_VECTOR_ELT(r_result, 1, gfcpd::eigen_matrix_to_R(filter->eigenvectors()));
	SET_VECTOR_ELT(r_result, 2, gfcpd::eigen_vector_to_R(filter->gains()));
	SET_VECTOR_ELT(r_result, 3, gfcpd::eigen_matrix_to_R(filter->filter_matrix()));
	SET_VECTOR_ELT(r_result, 4, Rf_ScalarInteger(static_cast<int>(filter->n_components())));
	SET_VECTOR_ELT(r_result, 5, Rf_ScalarReal(filter->rho()));

	UNPROTECT(1); // r_result
	return r_result;
}
