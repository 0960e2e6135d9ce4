#ifndef GFCPD_SPECTRAL_FILTER_R_H_
#define GFCPD_SPECTRAL_FILTER_R_H_

#ifndef R_NO_REMAP
#define R_NO_REMAP
#endif
#include <Rinternals.h>

#ifdef __cplusplus
extern "C" {
#endif

	SEXP S_gfss_spectral_filter(
		SEXP s_laplacian,
		SEXP s_rho,
		SEXP s_verbose
		);

#ifdef __cplusplus
}
#endif
#endif // GFCPD_SPECTRAL_FILTER_R_H_
