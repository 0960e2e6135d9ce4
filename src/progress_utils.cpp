#include "progress_utils.hpp"

#include <cmath>   // For std::fmod
#include <cstdio>  // For snprintf

namespace gfcpd {

/**
 * @brief Prints elapsed wall time since start_time, prefixed by a message
 *
 * @param start_time    Starting time point from std::chrono::steady_clock
 * @param message       Message to display alongside the elapsed time
 * @param with_brackets If true, elapsed time is shown in parentheses
 *
 * @details Time format is "mm:ss.xxx" for durations of a minute or more and
 *          "ss.xxx" otherwise. Output goes to the R console through Rprintf.
 *
 * @example
 * auto ptm = std::chrono::steady_clock::now();
 * // ... eigendecomposition ...
 * elapsed_time(ptm, "Laplacian eigendecomposition", true);  // "Laplacian eigendecomposition (0.012)"
 */
void elapsed_time(std::chrono::time_point<std::chrono::steady_clock> start_time,
                  const char* message,
                  bool with_brackets) {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    double elapsed = duration.count() / 1000.0;
    int minutes = static_cast<int>(elapsed / 60);
    int seconds = static_cast<int>(std::fmod(elapsed, 60));
    int ms = static_cast<int>(std::fmod(elapsed * 1000, 1000));

    char time_str[32];
    if (minutes > 0) {
        snprintf(time_str, sizeof(time_str), "%d:%02d.%03d", minutes, seconds, ms);
    } else {
        snprintf(time_str, sizeof(time_str), "%d.%03d", seconds, ms);
    }

    if (with_brackets) {
        Rprintf("%s (%s)\n", message, time_str);
    } else {
        Rprintf("%s %s\n", message, time_str);
    }
}

} // namespace gfcpd
