#include "gfcpd/pelt.hpp"
#include "gfcpd/segment_cost.hpp"
#include "gfcpd/errors.hpp"
#include "gfcpd/omp_compat.h"
#include "progress_utils.hpp"   // Rprintf, progress_tracker_t, elapsed_time()

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

namespace gfcpd {

namespace {

constexpr size_t NEVER = std::numeric_limits<size_t>::max();

/// Candidate predecessor and the position from which it is no longer considered
struct candidate_t {
    size_t index;
    size_t expires_at;
};

void validate_pelt_params(const pelt_params_t& params) {
    if (!std::isfinite(params.penalty) || params.penalty < 0.0) {
        throw invalid_penalty_error(
            "pelt_search: penalty must be finite and non-negative, got " + std::to_string(params.penalty));
    }
    if (params.jump < 1) {
        throw invalid_grid_error("pelt_search: jump must be at least 1");
    }
    if (params.min_size < 1) {
        throw invalid_grid_error("pelt_search: min_size must be at least 1");
    }
}

template <class cost_t>
size_t checked_n_samples(const cost_t& cost) {
    if (!cost.is_fitted()) {
        throw cost_not_fitted_error("pelt_search: fit() must be called on the cost first");
    }
    if (cost.n_samples() == 0) {
        throw empty_signal_error("pelt_search: signal has no samples");
    }
    return cost.n_samples();
}

/**
 * Admissible segment ends in increasing order: multiples of jump that leave at least
 * min_size samples on both sides, followed by n. Requires min_size <= n / 2.
 */
std::vector<size_t> segment_ends(size_t n, size_t jump, size_t min_size) {
    std::vector<size_t> ends;
    if (jump <= n - min_size) {
        const size_t first = ((min_size + jump - 1) / jump) * jump;
        for (size_t t = first; t <= n - min_size; t += jump) {
            ends.push_back(t);
        }
    }
    ends.push_back(n);
    return ends;
}

std::vector<size_t> backtrack(const std::vector<size_t>& last_changepoint, size_t n) {
    std::vector<size_t> breakpoints;
    for (size_t t = n; t > 0; t = last_changepoint[t]) {
        breakpoints.push_back(t);
    }
    std::reverse(breakpoints.begin(), breakpoints.end());
    return breakpoints;
}

int effective_threads(int n_cores) {
    return std::max(1, std::min(n_cores, gfcpd_get_max_threads()));
}

} // anonymous namespace

template <class cost_t>
pelt_result_t pelt_search(const cost_t& cost, const pelt_params_t& params) {
    validate_pelt_params(params);
    const size_t n = checked_n_samples(cost);
    const size_t min_size = std::max(params.min_size, cost.min_size());
    const double penalty = params.penalty;

    pelt_result_t result;

    if (min_size > n / 2) {
        result.breakpoints = {n};
        result.total_cost = cost.error(0, n);
        result.n_cost_evaluations = 1;
        result.max_candidates = 1;
        return result;
    }

    const std::vector<size_t> ends = segment_ends(n, params.jump, min_size);
    const int n_threads = effective_threads(params.n_cores);

    auto ptm = std::chrono::steady_clock::now();
    std::unique_ptr<progress_tracker_t> progress;
    if (params.verbose) {
        Rprintf("pelt_search: n = %zu, jump = %zu, min_size = %zu, penalty = %.6e\n",
                n, params.jump, min_size, penalty);
        Rprintf("  - Admissible segment ends: %zu\n", ends.size());
        Rprintf("  - Threads: %d\n", n_threads);
        progress = std::make_unique<progress_tracker_t>(
            ends.size(), "  - PELT sweep", std::max<size_t>(1, ends.size() / 20));
    }

    std::vector<double> best_cost(n + 1, std::numeric_limits<double>::infinity());
    std::vector<size_t> last_changepoint(n + 1, 0);
    best_cost[0] = -penalty;

    std::vector<candidate_t> candidates;
    candidates.reserve(ends.size() + 1);
    candidates.push_back({0, NEVER});
    result.max_candidates = 1;

    std::vector<size_t> eligible;
    std::vector<double> scores;  // best_cost[s] + error(s, t), penalty excluded

    for (size_t k = 0; k < ends.size(); ++k) {
        const size_t t = ends[k];

        candidates.erase(
            std::remove_if(candidates.begin(), candidates.end(),
                           [t](const candidate_t& c) { return c.expires_at <= t; }),
            candidates.end());

        eligible.clear();
        for (const candidate_t& c : candidates) {
            if (t - c.index >= min_size) {
                eligible.push_back(c.index);
            }
        }
        if (eligible.empty()) {
            continue;
        }

        const long n_eligible = static_cast<long>(eligible.size());
        scores.resize(eligible.size());

        std::exception_ptr failure;
        #pragma omp parallel for schedule(static) num_threads(n_threads) if(n_threads > 1 && n_eligible > 64)
        for (long i = 0; i < n_eligible; ++i) {
            try {
                const size_t s = eligible[i];
                scores[i] = best_cost[s] + cost.error(s, t);
            } catch (...) {
                #pragma omp critical(gfcpd_pelt_scores)
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
        result.n_cost_evaluations += eligible.size();

        // first minimum wins, eligible is in increasing order
        size_t best_i = 0;
        for (size_t i = 1; i < eligible.size(); ++i) {
            if (scores[i] < scores[best_i]) {
                best_i = i;
            }
        }
        best_cost[t] = scores[best_i] + penalty;
        last_changepoint[t] = eligible[best_i];

        if (t == n) {
            break;
        }

        // PELT rule; the tolerance only makes pruning more conservative
        const double threshold = best_cost[t] + 1e-12 * std::max(1.0, std::abs(best_cost[t]));
        const size_t expiry = t + min_size;
        size_t i = 0;
        for (candidate_t& c : candidates) {
            if (i < eligible.size() && c.index == eligible[i]) {
                if (scores[i] > threshold) {
                    c.expires_at = std::min(c.expires_at, expiry);
                }
                ++i;
            }
        }

        candidates.push_back({t, NEVER});
        result.max_candidates = std::max(result.max_candidates, candidates.size());

        if (progress) {
            progress->update(k + 1);
        }
    }

    if (!std::isfinite(best_cost[n])) {
        throw std::runtime_error("pelt_search: no finite-cost partition found; check the cost values");
    }

    result.total_cost = best_cost[n];
    result.breakpoints = backtrack(last_changepoint, n);

    if (progress) {
        progress->finish();
        Rprintf("  - Change points found: %zu\n", result.breakpoints.size() - 1);
        Rprintf("  - Cost evaluations: %zu (without pruning at most %zu)\n",
                result.n_cost_evaluations, ends.size() * (ends.size() + 1) / 2);
        Rprintf("  - Largest candidate set: %zu\n", result.max_candidates);
        elapsed_time(ptm, "pelt_search total", true);
    }

    return result;
}

template <class cost_t>
std::vector<pelt_result_t> pelt_penalty_path(const cost_t& cost,
                                             const std::vector<double>& penalties,
                                             size_t jump,
                                             size_t min_size,
                                             int n_cores) {
    std::vector<pelt_params_t> params(penalties.size());
    for (size_t i = 0; i < penalties.size(); ++i) {
        params[i].penalty  = penalties[i];
        params[i].jump     = jump;
        params[i].min_size = min_size;
        params[i].n_cores  = 1;
        validate_pelt_params(params[i]);
    }
    checked_n_samples(cost);

    std::vector<pelt_result_t> results(penalties.size());
    std::exception_ptr failure;
    const int n_threads = effective_threads(n_cores);
    const long n_penalties = static_cast<long>(penalties.size());

    #pragma omp parallel for schedule(dynamic) num_threads(n_threads) if(n_threads > 1)
    for (long i = 0; i < n_penalties; ++i) {
        try {
            results[i] = pelt_search(cost, params[i]);
        } catch (...) {
            #pragma omp critical(gfcpd_penalty_path)
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}

template pelt_result_t pelt_search<l2_cost_t>(const l2_cost_t&, const pelt_params_t&);
template pelt_result_t pelt_search<gfss_cost_t>(const gfss_cost_t&, const pelt_params_t&);

template std::vector<pelt_result_t> pelt_penalty_path<l2_cost_t>(
    const l2_cost_t&, const std::vector<double>&, size_t, size_t, int);
template std::vector<pelt_result_t> pelt_penalty_path<gfss_cost_t>(
    const gfss_cost_t&, const std::vector<double>&, size_t, size_t, int);

} // namespace gfcpd
