#pragma once

// Some SDKs leak macros that break OpenMP pragmas; sanitize.
#ifdef match
#  undef match
#endif
#ifdef check
#  undef check
#endif

#ifdef _OPENMP
  #include <omp.h>
  static inline int  gfcpd_get_max_threads(void) { return omp_get_max_threads(); }
#else
  // Single-threaded fallbacks for builds without OpenMP
  static inline int  gfcpd_get_max_threads(void) { return 1; }
#endif
