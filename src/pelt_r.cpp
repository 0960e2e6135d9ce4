#include "gfcpd/pelt.hpp"                   // pelt_search, pelt_penalty_path
#include "gfcpd/segment_cost.hpp"           // l2_cost_t, gfss_cost_t, sum_of_costs
#include "gfcpd/pelt_r.h"
#include "SEXP_cpp_conversion_utils.hpp"
#include "gfcpd/errors.hpp"                 // capture_error_message()
#include "error_utils.h"                    // REPORT_ERROR()

#include <memory>
#include <vector>

namespace {

// Non-positive and NA counts become 0 so the core reports invalid_grid_error
size_t as_count(SEXP s_value) {
	const int value = Rf_asInteger(s_value);
	return (value == NA_INTEGER || value < 0) ? 0 : static_cast<size_t>(value);
}

gfcpd::pelt_params_t pelt_params_from_R(
	SEXP s_penalty,
	SEXP s_jump,
	SEXP s_min_size,
	SEXP s_n_cores,
	SEXP s_verbose
	) {
	gfcpd::pelt_params_t params;
	params.penalty  = Rf_asReal(s_penalty);
	params.jump     = as_count(s_jump);
	params.min_size = as_count(s_min_size);
	params.n_cores  = Rf_asInteger(s_n_cores);
	params.verbose  = (Rf_asLogical(s_verbose) == TRUE);
	if (params.n_cores == NA_INTEGER) {
		params.n_cores = 1;
	}
	return params;
}

/**
 * @brief Builds the list(breakpoints, total_cost, n_cost_evaluations, max_candidates)
 *
 * @note The returned SEXP is unprotected
 */
SEXP pelt_result_to_R(const gfcpd::pelt_result_t& result) {
	const int n_fields = 4;
	SEXP r_result = PROTECT(Rf_allocVector(VECSXP, n_fields));
	{
		SEXP names = PROTECT(Rf_allocVector(STRSXP, n_fields));
		SET_STRING_ELT(names, 0, Rf_mkChar("breakpoints"));
		SET_STRING_ELT(names, 1, Rf_mkChar("total_cost"));
		SET_STRING_ELT(names, 2, Rf_mkChar("n_cost_evaluations"));
		SET_STRING_ELT(names, 3, Rf_mkChar("max_candidates"));
		Rf_setAttrib(r_result, R_NamesSymbol, names);
		UNPROTECT(1); // names
	}

	SET_VECTOR_ELT(r_result, 0, gfcpd::convert_breakpoints_to_R(result.breakpoints));
	SET_VECTOR_ELT(r_result, 1, Rf_ScalarReal(result.total_cost));
	SET_VECTOR_ELT(r_result, 2, Rf_ScalarReal(static_cast<double>(result.n_cost_evaluations)));
	SET_VECTOR_ELT(r_result, 3, Rf_ScalarReal(static_cast<double>(result.max_candidates)));

	UNPROTECT(1); // r_result
	return r_result;
}

} // anonymous namespace

/**
 * @brief R interface to PELT with the plain least-squares cost
 *
 * @param s_signal   Numeric n x d matrix (rows = time)
 * @param s_penalty  Penalty per additional segment (>= 0)
 * @param s_jump     Breakpoint grid step (>= 1)
 * @param s_min_size Minimum segment length (>= 1)
 * @param s_n_cores  Threads for candidate evaluation
 * @param s_verbose  Logical; print search statistics
 *
 * @return list(breakpoints, total_cost, n_cost_evaluations, max_candidates)
 */
extern "C" SEXP S_pelt_l2(
	SEXP s_signal,
	SEXP s_penalty,
	SEXP s_jump,
	SEXP s_min_size,
	SEXP s_n_cores,
	SEXP s_verbose
	) {

	gfcpd::pelt_params_t params = pelt_params_from_R(s_penalty, s_jump, s_min_size, s_n_cores, s_verbose);

	char error_buffer[512] = "";
	std::unique_ptr<gfcpd::pelt_result_t> result;
	const bool ok = gfcpd::capture_error_message([&]() {
		gfcpd::l2_cost_t cost;
		cost.fit(gfcpd::Rmatrix_to_eigen(s_signal, "signal"));
		result = std::make_unique<gfcpd::pelt_result_t>(gfcpd::pelt_search(cost, params));
	}, error_buffer, sizeof(error_buffer));
	if (!ok) {
		REPORT_ERROR("S_pelt_l2: %s", error_buffer);
	}

	SEXP r_result = PROTECT(pelt_result_to_R(*result));
	result.reset();
	UNPROTECT(1);
	return r_result;
}

/**
 * @brief R interface to PELT with the graph-filtered (GFSS) cost
 *
 * @param s_laplacian Numeric d x d graph Laplacian; d must equal ncol(signal)
 * @param s_rho       Filter cutoff (> 0)
 *
 * Remaining arguments and the return value are as in S_pelt_l2().
 */
extern "C" SEXP S_pelt_gfss(
	SEXP s_signal,
	SEXP s_laplacian,
	SEXP s_rho,
	SEXP s_penalty,
	SEXP s_jump,
	SEXP s_min_size,
	SEXP s_n_cores,
	SEXP s_verbose
	) {

	gfcpd::pelt_params_t params = pelt_params_from_R(s_penalty, s_jump, s_min_size, s_n_cores, s_verbose);
	gfcpd::spectral_filter_params_t filter_params;
	filter_params.verbose = params.verbose;
	const double rho = Rf_asReal(s_rho);

	char error_buffer[512] = "";
	std::unique_ptr<gfcpd::pelt_result_t> result;
	const bool ok = gfcpd::capture_error_message([&]() {
		gfcpd::gfss_cost_t cost(gfcpd::Rmatrix_to_eigen(s_laplacian, "laplacian"), rho, filter_params);
		cost.fit(gfcpd::Rmatrix_to_eigen(s_signal, "signal"));
		result = std::make_unique<gfcpd::pelt_result_t>(gfcpd::pelt_search(cost, params));
	}, error_buffer, sizeof(error_buffer));
	if (!ok) {
		REPORT_ERROR("S_pelt_gfss: %s", error_buffer);
	}

	SEXP r_result = PROTECT(pelt_result_to_R(*result));
	result.reset();
	UNPROTECT(1);
	return r_result;
}

/**
 * @brief R interface to independent PELT runs over a vector of penalties
 *
 * @param s_laplacian NULL for the least-squares cost, otherwise a d x d Laplacian (GFSS)
 * @param s_rho       Filter cutoff, ignored when s_laplacian is NULL
 * @param s_penalties Numeric vector of penalties
 *
 * @return List of breakpoint vectors, one per penalty
 */
extern "C" SEXP S_pelt_penalty_path(
	SEXP s_signal,
	SEXP s_laplacian,
	SEXP s_rho,
	SEXP s_penalties,
	SEXP s_jump,
	SEXP s_min_size,
	SEXP s_n_cores
	) {

	const size_t jump     = as_count(s_jump);
	const size_t min_size = as_count(s_min_size);
	int n_cores           = Rf_asInteger(s_n_cores);
	if (n_cores == NA_INTEGER) {
		n_cores = 1;
	}
	const double rho = Rf_asReal(s_rho);

	char error_buffer[512] = "";
	std::unique_ptr<std::vector<gfcpd::pelt_result_t>> results;
	const bool ok = gfcpd::capture_error_message([&]() {
		std::vector<double> penalties = gfcpd::Rvect_to_CppVect_double(s_penalties, "penalties");
		Eigen::MatrixXd signal = gfcpd::Rmatrix_to_eigen(s_signal, "signal");
		if (Rf_isNull(s_laplacian)) {
			gfcpd::l2_cost_t cost;
			cost.fit(signal);
			results = std::make_unique<std::vector<gfcpd::pelt_result_t>>(
				gfcpd::pelt_penalty_path(cost, penalties, jump, min_size, n_cores));
		} else {
			gfcpd::gfss_cost_t cost(gfcpd::Rmatrix_to_eigen(s_laplacian, "laplacian"), rho);
			cost.fit(signal);
			results = std::make_unique<std::vector<gfcpd::pelt_result_t>>(
				gfcpd::pelt_penalty_path(cost, penalties, jump, min_size, n_cores));
		}
	}, error_buffer, sizeof(error_buffer));
	if (!ok) {
		REPORT_ERROR("S_pelt_penalty_path: %s", error_buffer);
	}

	const int n_penalties = static_cast<int>(results->size());
	SEXP r_result = PROTECT(Rf_allocVector(VECSXP, n_penalties));
	for (int i = 0; i < n_penalties; ++i) {
		SET_VECTOR_ELT(r_result, i, gfcpd::convert_breakpoints_to_R((*results)[i].breakpoints));
	}
	results.reset();
	UNPROTECT(1);
	return r_result;
}

/**
 * @brief R interface returning the cost of every segment of a given partition
 *
 * @param s_laplacian   NULL for the least-squares cost, otherwise a d x d Laplacian
 * @param s_rho         Filter cutoff, ignored when s_laplacian is NULL
 * @param s_breakpoints Increasing segment ends, the last equal to nrow(signal)
 *
 * @return Numeric vector of per-segment costs with attribute "total_cost", their sum
 */
extern "C" SEXP S_segment_costs(
	SEXP s_signal,
	SEXP s_laplacian,
	SEXP s_rho,
	SEXP s_breakpoints
	) {

	const double rho = Rf_asReal(s_rho);

	char error_buffer[512] = "";
	std::unique_ptr<std::vector<double>> costs;
	double total_cost = 0.0;
	const bool ok = gfcpd::capture_error_message([&]() {
		std::vector<size_t> breakpoints = gfcpd::Rvect_to_breakpoints(s_breakpoints);
		Eigen::MatrixXd signal = gfcpd::Rmatrix_to_eigen(s_signal, "signal");

		auto per_segment = [&breakpoints, &total_cost](const auto& cost) {
			// validates the partition as a whole before splitting it up
			total_cost = gfcpd::sum_of_costs(cost, breakpoints);
			std::vector<double> out;
			out.reserve(breakpoints.size());
			size_t start = 0;
			for (size_t bkp : breakpoints) {
				out.push_back(cost.error(start, bkp));
				start = bkp;
			}
			return out;
		};

		if (Rf_isNull(s_laplacian)) {
			gfcpd::l2_cost_t cost;
			cost.fit(signal);
			costs = std::make_unique<std::vector<double>>(per_segment(cost));
		} else {
			gfcpd::gfss_cost_t cost(gfcpd::Rmatrix_to_eigen(s_laplacian, "laplacian"), rho);
			cost.fit(signal);
			costs = std::make_unique<std::vector<double>>(per_segment(cost));
		}
	}, error_buffer, sizeof(error_buffer));
	if (!ok) {
		REPORT_ERROR("S_segment_costs: %s", error_buffer);
	}

	SEXP r_result = PROTECT(gfcpd::convert_vector_double_to_R(*costs));
	costs.reset();
	Rf_setAttrib(r_result, Rf_install("total_cost"), Rf_ScalarReal(total_cost));
	UNPROTECT(1);
	return r_result;
}
