#pragma once
/**
 * @file affinity.hpp
 * @brief Pin the *current thread* to a CPU (reactor loops in multicore mode).
 * @note Linux implemented via pthread_setaffinity_np; other platforms report false.
 */

namespace bmux::os {

    /// @brief Pin the calling thread to @p cpu. cpu < 0 is a no-op that succeeds.
    /// @return false if unsupported or the kernel refused (e.g. cpuset restrictions).
    bool pin_current_thread(int cpu);

    /// @brief Number of CPUs usable by this process (at least 1).
    unsigned usable_cpus();

    /// @brief Index of the @p n-th CPU (0-based) in this process's allowed set.
    /// @return -1 if the set has fewer CPUs or cannot be read.
    int nth_usable_cpu(unsigned n);

} // namespace bmux::os
