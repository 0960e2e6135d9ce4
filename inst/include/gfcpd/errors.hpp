#ifndef GFCPD_ERRORS_HPP
#define GFCPD_ERRORS_HPP

#include <cstddef>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>

namespace gfcpd {

/// Laplacian is empty, not square, not finite, not symmetric or not PSD
struct invalid_graph_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// Filter cutoff rho is not a finite positive number
struct invalid_parameter_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// Negative or NaN penalty
struct invalid_penalty_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// jump < 1 or min_size < 1
struct invalid_grid_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// Search over a signal with no samples
struct empty_signal_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// Segment shorter than the cost's minimum admissible length
struct segment_too_short_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// Signal width differs from the number of graph nodes
struct dimension_mismatch_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// Signal contains NaN or infinite values
struct invalid_signal_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// Breakpoint sequence is not a partition of [0, n)
struct invalid_breakpoints_error : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// error() called before fit()
struct cost_not_fitted_error : std::logic_error {
    using std::logic_error::logic_error;
};

/**
 * @brief Runs body and copies the message of anything it throws into buffer
 *
 * The .Call entry points use this so that every C++ object is released before
 * Rf_error() unwinds the stack. Exceptions not derived from std::exception are
 * reported as "unknown C++ exception".
 *
 * @return true if body returned normally
 */
template <class F>
bool capture_error_message(F&& body, char* buffer, size_t buffer_size) noexcept {
    try {
        body();
        return true;
    } catch (const std::exception& e) {
        std::snprintf(buffer, buffer_size, "%s", e.what());
    } catch (...) {
        std::snprintf(buffer, buffer_size, "unknown C++ exception");
    }
    return false;
}

} // namespace gfcpd

#endif // GFCPD_ERRORS_HPP
