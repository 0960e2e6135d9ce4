#ifndef GFCPD_ERROR_UTILS_H_
#define GFCPD_ERROR_UTILS_H_

#ifndef R_NO_REMAP
#define R_NO_REMAP
#endif
#include <R.h>

// Reports a failure to the R session; does not return
#define REPORT_ERROR(...) Rf_error(__VA_ARGS__)

#endif // GFCPD_ERROR_UTILS_H_
