#ifndef GFCPD_PELT_R_H_
#define GFCPD_PELT_R_H_

#ifndef R_NO_REMAP
#define R_NO_REMAP
#endif
#include <Rinternals.h>

#ifdef __cplusplus
extern "C" {
#endif

	SEXP S_pelt_l2(
		SEXP s_signal,
		SEXP s_penalty,
		SEXP s_jump,
		SEXP s_min_size,
		SEXP s_n_cores,
		SEXP s_verbose
		);

	SEXP S_pelt_gfss(
		SEXP s_signal,
		SEXP s_laplacian,
		SEXP s_rho,
		SEXP s_penalty,
		SEXP s_jump,
		SEXP s_min_size,
		SEXP s_n_cores,
		SEXP s_verbose
		);

	SEXP S_pelt_penalty_path(
		SEXP s_signal,
		SEXP s_laplacian,
		SEXP s_rho,
		SEXP s_penalties,
		SEXP s_jump,
		SEXP s_min_size,
		SEXP s_n_cores
		);

	SEXP S_segment_costs(
		SEXP s_signal,
		SEXP s_laplacian,
		SEXP s_rho,
		SEXP s_breakpoints
		);

#ifdef __cplusplus
}
#endif
#endif // GFCPD_PELT_R_H_
