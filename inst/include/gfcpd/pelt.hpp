/**
 * @file pelt.hpp
 * @brief Exact penalized optimal partitioning with pruning (PELT)
 *
 * Finds the partition of [0, n) into contiguous segments that minimizes
 *
 *     sum_{segments} cost.error(segment) + penalty * (number_of_segments - 1)
 *
 * over all partitions whose interior breakpoints are multiples of jump and whose
 * segments are at least min_size long. The cost type must satisfy the contract
 * documented in segment_cost.hpp; l2_cost_t and gfss_cost_t are instantiated.
 */

#ifndef GFCPD_PELT_HPP
#define GFCPD_PELT_HPP

#include <cstddef>
#include <vector>

namespace gfcpd {

/**
 * @brief Search settings for pelt_search()
 */
struct pelt_params_t {
    /// Cost charged per additional segment, finite and >= 0
    double penalty = 0.0;

    /// Interior breakpoints are restricted to multiples of jump (1 = every index)
    size_t jump = 5;

    /// Shortest admissible segment; raised to the cost's own minimum if smaller
    size_t min_size = 2;

    /// Threads used to evaluate the candidate set at each position
    int n_cores = 1;

    /// Print grid size, pruning statistics and timing
    bool verbose = false;
};

/**
 * @brief Optimal partition and search statistics
 */
struct pelt_result_t {
    std::vector<size_t> breakpoints;  ///< Strictly increasing segment ends; last element is n
    double total_cost = 0.0;          ///< Sum of segment errors plus penalty per extra segment
    size_t n_cost_evaluations = 0;    ///< Number of cost.error() calls made by the sweep
    size_t max_candidates = 0;        ///< Largest candidate set held during the sweep
};

/**
 * @brief Optimal change points of a fitted cost
 *
 * @details
 * Dynamic program over the grid of admissible segment ends T (multiples of jump with
 * min_size <= T <= n - min_size, then n):
 *
 *     F(0) = -penalty,    F(T) = min_s F(s) + error(s, T) + penalty
 *
 * over candidates s with T - s >= min_size. A candidate s with
 * F(s) + error(s, T) > F(T) can never be the best predecessor of any T' >= T + min_size
 * (least-squares costs satisfy error(s, T) + error(T, T') <= error(s, T')), so it is
 * dropped from the candidate set once the sweep reaches T + min_size. Until then T
 * itself is not an admissible predecessor and s is kept. The result is the exact
 * optimum over the grid for every jump and min_size.
 *
 * jump > 1 trades breakpoint resolution for speed: changes are reported at the nearest
 * admissible multiple of jump.
 *
 * If n < 2 * min_size no split is feasible and {n} is returned.
 *
 * @throws invalid_penalty_error  if penalty is negative, NaN or infinite
 * @throws invalid_grid_error     if jump < 1 or min_size < 1
 * @throws cost_not_fitted_error  if cost.fit() has not been called
 * @throws empty_signal_error     if the fitted signal has no samples
 */
template <class cost_t>
pelt_result_t pelt_search(const cost_t& cost, const pelt_params_t& params);

/// Same search with the settings given explicitly, single-threaded and quiet
template <class cost_t>
pelt_result_t pelt_search(const cost_t& cost, double penalty, size_t jump, size_t min_size) {
    pelt_params_t params;
    params.penalty  = penalty;
    params.jump     = jump;
    params.min_size = min_size;
    return pelt_search(cost, params);
}

/**
 * @brief Runs independent searches over a list of penalties on one fitted cost
 *
 * The cost is only read, so the searches run concurrently (n_cores threads).
 * Every penalty is validated before any search starts.
 *
 * @return One result per penalty, in the order given
 */
template <class cost_t>
std::vector<pelt_result_t> pelt_penalty_path(const cost_t& cost,
                                             const std::vector<double>& penalties,
                                             size_t jump,
                                             size_t min_size,
                                             int n_cores = 1);

} // namespace gfcpd

#endif // GFCPD_PELT_HPP
