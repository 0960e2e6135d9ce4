// progress_utils.hpp
#ifndef GFCPD_PROGRESS_UTILS_HPP
#define GFCPD_PROGRESS_UTILS_HPP

#ifndef R_NO_REMAP
#define R_NO_REMAP
#endif
#include <R.h>
#include <Rinternals.h>
#include <R_ext/Print.h>
#include <chrono>
#include <cstddef>

namespace gfcpd {

void elapsed_time(std::chrono::time_point<std::chrono::steady_clock> start_time,
                  const char* message,
                  bool with_brackets = false);

/**
 * @brief Console progress for long sequential sweeps (PELT over n positions)
 *
 * Prints "<task>: xx.x% complete. Est. remaining: Ns" every update_frequency steps.
 */
struct progress_tracker_t {
    std::chrono::steady_clock::time_point start_time;
    size_t total_steps;
    size_t update_frequency;  // How often to show progress (in steps)
    const char* task_name;

    progress_tracker_t(size_t total, const char* name, size_t freq = 10)
        : start_time(std::chrono::steady_clock::now()),
          total_steps(total > 0 ? total : 1),
          update_frequency(freq > 0 ? freq : 1),
          task_name(name) {}

    void update(size_t step, bool force = false) {
        if (step == 0 || (!force && step % update_frequency != 0)) {
            return;
        }
        auto now = std::chrono::steady_clock::now();
        double progress = static_cast<double>(step) / total_steps * 100;
        double elapsed = std::chrono::duration<double>(now - start_time).count();
        double remaining = elapsed * (static_cast<double>(total_steps) / step - 1.0);

        Rprintf("\r%s: %.1f%% complete. Est. remaining: %ds",
                task_name, progress, static_cast<int>(remaining));
        R_FlushConsole();
    }

    void finish() {
        Rprintf("\n");
        elapsed_time(start_time, task_name, true);
        R_FlushConsole();
    }
};

} // namespace gfcpd

#endif // GFCPD_PROGRESS_UTILS_HPP
