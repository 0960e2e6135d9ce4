#ifndef R_NO_REMAP
#define R_NO_REMAP
#endif
#include <R.h>
#include <Rinternals.h>
#include <R_ext/Rdynload.h>

#include "gfcpd/spectral_filter_r.h"
#include "gfcpd/pelt_r.h"

static const R_CallMethodDef CallMethods[] = {
	{"S_gfss_spectral_filter", (DL_FUNC) &S_gfss_spectral_filter, 3},
	{"S_pelt_l2",              (DL_FUNC) &S_pelt_l2,              6},
	{"S_pelt_gfss",            (DL_FUNC) &S_pelt_gfss,            8},
	{"S_pelt_penalty_path",    (DL_FUNC) &S_pelt_penalty_path,    7},
	{"S_segment_costs",        (DL_FUNC) &S_segment_costs,        4},
	{NULL, NULL, 0}
};

extern "C" void R_init_gfcpd(DllInfo* dll) {
	R_registerRoutines(dll, NULL, CallMethods, NULL, NULL);
	R_useDynamicSymbols(dll, FALSE);
}
