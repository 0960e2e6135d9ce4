/**
 * @file segment_cost.hpp
 * @brief Least-squares segment costs for change-point search
 *
 * Every cost type consumed by pelt_search() provides
 *
 *     cost_t& fit(const Eigen::MatrixXd& signal);          // bind to an n x d signal
 *     double  error(size_t start, size_t end) const;       // cost of rows [start, end)
 *     size_t  n_samples() const;                           // n of the fitted signal
 *     size_t  min_size() const;                            // shortest admissible segment
 *     bool    is_fitted() const;
 *
 * Two variants are provided: l2_cost_t on the raw signal and gfss_cost_t on the
 * graph-filtered signal. Both evaluate
 *
 *     error(start, end) = sum_{t in [start, end)} || y_t - ybar ||^2
 *
 * in O(d) from prefix sums built once by fit(). A one-row segment has cost 0, so the
 * minimum admissible segment length is 1 for both.
 */

#ifndef GFCPD_SEGMENT_COST_HPP
#define GFCPD_SEGMENT_COST_HPP

#include "eigen_config.hpp"
#include "spectral_filter.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <memory>
#include <vector>

namespace gfcpd {

/**
 * @brief Prefix sums of rows and squared row norms of a (column-centered) signal
 *
 * sums_ row k holds sum_{t < k} y_t, sq_sums_(k) holds sum_{t < k} ||y_t||^2.
 * Columns are centered by their mean before accumulation; the within-segment sum of
 * squares is shift invariant and centering keeps the final subtraction well conditioned.
 */
class cumulative_sums_t {
public:
    cumulative_sums_t() = default;

    /// Accumulates the prefix sums; columns are processed in parallel with OpenMP
    explicit cumulative_sums_t(const Eigen::MatrixXd& signal);

    /// Sum over [start, end) of squared deviations from the segment mean; caller checks range
    double sum_of_squares(size_t start, size_t end) const;

    size_t n_samples() const { return n_samples_; }
    size_t n_dims() const { return static_cast<size_t>(sums_.cols()); }

private:
    size_t n_samples_ = 0;
    Eigen::MatrixXd sums_;    ///< (n + 1) x d
    Eigen::VectorXd sq_sums_; ///< n + 1
};

/**
 * @brief Graph-agnostic least-squares cost (baseline)
 */
class l2_cost_t {
public:
    l2_cost_t() = default;

    /**
     * @brief Binds the cost to an n x d signal
     * @throws invalid_signal_error if the signal has NaN or infinite values
     */
    l2_cost_t& fit(const Eigen::MatrixXd& signal);

    /**
     * @brief Sum of squared deviations from the segment mean over rows [start, end)
     *
     * @throws cost_not_fitted_error   before fit()
     * @throws segment_too_short_error if end - start < min_size() (including start >= end)
     * @throws std::out_of_range       if end > n_samples()
     */
    double error(size_t start, size_t end) const;

    size_t n_samples() const { return sums_.n_samples(); }
    size_t min_size() const { return 1; }
    bool is_fitted() const { return fitted_; }

private:
    bool fitted_ = false;
    cumulative_sums_t sums_;
};

/**
 * @brief Least-squares cost on the graph low-pass filtered signal (GFSS)
 *
 * fit() filters the signal once through spectral_filter_t::apply() and keeps the
 * filtered copy; error() is the l2 formula on that copy. Energy on graph frequencies
 * above rho, e.g. white noise or a shift on one weakly connected node, is attenuated
 * before the within-segment variance is measured.
 */
class gfss_cost_t {
public:
    /// Uses an existing filter; the filter must outlive this cost
    explicit gfss_cost_t(const spectral_filter_t& filter);

    /// Builds and owns a filter from a Laplacian and a cutoff
    gfss_cost_t(const Eigen::MatrixXd& laplacian,
                double rho,
                const spectral_filter_params_t& params = spectral_filter_params_t());

    /**
     * @brief Filters the signal and builds the prefix sums
     *
     * @throws dimension_mismatch_error if signal.cols() differs from the number of nodes
     * @throws invalid_signal_error     if the signal has NaN or infinite values
     */
    gfss_cost_t& fit(const Eigen::MatrixXd& signal);

    /// Same contract as l2_cost_t::error(), evaluated on the filtered signal
    double error(size_t start, size_t end) const;

    size_t n_samples() const { return sums_.n_samples(); }
    size_t min_size() const { return 1; }
    bool is_fitted() const { return fitted_; }

    const spectral_filter_t& filter() const { return *filter_; }

    /// Filtered copy of the last fitted signal (n x d)
    const Eigen::MatrixXd& filtered_signal() const { return filtered_; }

private:
    std::shared_ptr<const spectral_filter_t> owned_filter_;
    const spectral_filter_t* filter_;
    bool fitted_ = false;
    Eigen::MatrixXd filtered_;
    cumulative_sums_t sums_;
};

/**
 * @brief Sum of segment errors of a partition
 *
 * @param cost        Fitted cost
 * @param breakpoints Strictly increasing segment ends, last one equal to n_samples()
 * @return sum over segments [t_{k-1}, t_k) of cost.error(), with t_0 = 0
 *
 * @throws invalid_breakpoints_error if the sequence is empty, not strictly increasing,
 *                                   starts at 0 or does not end at n_samples()
 */
template <class cost_t>
double sum_of_costs(const cost_t& cost, const std::vector<size_t>& breakpoints);
// Instantiated for l2_cost_t and gfss_cost_t in segment_cost.cpp

} // namespace gfcpd

#endif // GFCPD_SEGMENT_COST_HPP
