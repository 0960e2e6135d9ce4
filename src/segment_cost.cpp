#include "gfcpd/segment_cost.hpp"
#include "gfcpd/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace gfcpd {

namespace {

void check_segment(const char* caller,
                   bool fitted,
                   size_t n_samples,
                   size_t min_size,
                   size_t start,
                   size_t end) {
    if (!fitted) {
        throw cost_not_fitted_error(std::string(caller) + ": fit() must be called before error()");
    }
    if (end > n_samples) {
        throw std::out_of_range(
            std::string(caller) + ": segment end " + std::to_string(end)
            + " exceeds the number of samples " + std::to_string(n_samples));
    }
    if (end <= start || end - start < min_size) {
        throw segment_too_short_error(
            std::string(caller) + ": segment [" + std::to_string(start) + ", "
            + std::to_string(end) + ") is shorter than the minimum size " + std::to_string(min_size));
    }
}

void check_finite(const Eigen::MatrixXd& signal, const char* caller) {
    if (!signal.allFinite()) {
        throw invalid_signal_error(std::string(caller) + ": signal contains NaN or infinite values");
    }
}

} // anonymous namespace

cumulative_sums_t::cumulative_sums_t(const Eigen::MatrixXd& signal)
    : n_samples_(static_cast<size_t>(signal.rows())) {

    const Eigen::Index n = signal.rows();
    const Eigen::Index d = signal.cols();

    sums_ = Eigen::MatrixXd::Zero(n + 1, d);
    sq_sums_ = Eigen::VectorXd::Zero(n + 1);
    if (n == 0) {
        return;
    }

    const Eigen::RowVectorXd col_means = signal.colwise().mean();

    #pragma omp parallel for schedule(static) if(d > 8)
    for (Eigen::Index j = 0; j < d; ++j) {
        const double mu = col_means(j);
        for (Eigen::Index i = 0; i < n; ++i) {
            sums_(i + 1, j) = sums_(i, j) + (signal(i, j) - mu);
        }
    }

    for (Eigen::Index i = 0; i < n; ++i) {
        sq_sums_(i + 1) = sq_sums_(i) + (signal.row(i) - col_means).squaredNorm();
    }
}

double cumulative_sums_t::sum_of_squares(size_t start, size_t end) const {
    const double len = static_cast<double>(end - start);
    const Eigen::Index s = static_cast<Eigen::Index>(start);
    const Eigen::Index e = static_cast<Eigen::Index>(end);

    const double seg_sq = sq_sums_(e) - sq_sums_(s);
    const double seg_sum_sq = (sums_.row(e) - sums_.row(s)).squaredNorm();

    // round-off can push a zero-variance segment slightly below 0
    return std::max(0.0, seg_sq - seg_sum_sq / len);
}

l2_cost_t& l2_cost_t::fit(const Eigen::MatrixXd& signal) {
    check_finite(signal, "l2_cost_t::fit");
    sums_ = cumulative_sums_t(signal);
    fitted_ = true;
    return *this;
}

double l2_cost_t::error(size_t start, size_t end) const {
    check_segment("l2_cost_t::error", fitted_, n_samples(), min_size(), start, end);
    return sums_.sum_of_squares(start, end);
}

gfss_cost_t::gfss_cost_t(const spectral_filter_t& filter)
    : filter_(&filter) {}

gfss_cost_t::gfss_cost_t(const Eigen::MatrixXd& laplacian,
                         double rho,
                         const spectral_filter_params_t& params)
    : owned_filter_(std::make_shared<const spectral_filter_t>(laplacian, rho, params)),
      filter_(owned_filter_.get()) {}

/**
 * @brief Filters the signal through the graph low-pass operator and caches prefix sums
 *
 * @details The filtered signal costs one n x d by d x d product. The previous fit
 *          stays in place if any check or allocation fails.
 */
gfss_cost_t& gfss_cost_t::fit(const Eigen::MatrixXd& signal) {
    check_finite(signal, "gfss_cost_t::fit");
    Eigen::MatrixXd filtered = filter_->apply(signal);
    cumulative_sums_t sums(filtered);

    filtered_.swap(filtered);
    sums_ = std::move(sums);
    fitted_ = true;
    return *this;
}

double gfss_cost_t::error(size_t start, size_t end) const {
    check_segment("gfss_cost_t::error", fitted_, n_samples(), min_size(), start, end);
    return sums_.sum_of_squares(start, end);
}

template <class cost_t>
double sum_of_costs(const cost_t& cost, const std::vector<size_t>& breakpoints) {
    if (!cost.is_fitted()) {
        throw cost_not_fitted_error("sum_of_costs: fit() must be called first");
    }
    if (breakpoints.empty()) {
        throw invalid_breakpoints_error("sum_of_costs: breakpoint sequence is empty");
    }
    if (breakpoints.back() != cost.n_samples()) {
        throw invalid_breakpoints_error(
            "sum_of_costs: last breakpoint " + std::to_string(breakpoints.back())
            + " differs from the number of samples " + std::to_string(cost.n_samples()));
    }

    double total = 0.0;
    size_t start = 0;
    for (size_t bkp : breakpoints) {
        if (bkp <= start) {
            throw invalid_breakpoints_error(
                "sum_of_costs: breakpoints must be positive and strictly increasing");
        }
        total += cost.error(start, bkp);
        start = bkp;
    }
    return total;
}

template double sum_of_costs<l2_cost_t>(const l2_cost_t&, const std::vector<size_t>&);
template double sum_of_costs<gfss_cost_t>(const gfss_cost_t&, const std::vector<size_t>&);

} // namespace gfcpd
