#include "bmux/os/affinity.hpp"

#include <thread>

#if defined(__linux__)
#include <pthread.h>
#include <sched.h>
#endif

namespace bmux::os {

#if defined(__linux__)

bool pin_current_thread(int cpu) {
    if (cpu < 0) return true; // nothing to do
    cpu_set_t mask; CPU_ZERO(&mask); CPU_SET(cpu, &mask);
    return pthread_setaffinity_np(pthread_self(), sizeof(mask), &mask) == 0;
}

unsigned usable_cpus() {
    cpu_set_t mask; CPU_ZERO(&mask);
    if (sched_getaffinity(0, sizeof(mask), &mask) == 0) {
        const int n = CPU_COUNT(&mask);
        if (n > 0) return static_cast<unsigned>(n);
    }
    const unsigned hc = std::thread::hardware_concurrency();
    return hc == 0 ? 1u : hc;
}

int nth_usable_cpu(unsigned n) {
    cpu_set_t mask; CPU_ZERO(&mask);
    if (sched_getaffinity(0, sizeof(mask), &mask) != 0) return -1;
    // The allowed set need not start at 0 (cpuset {4-7}).
    for (int cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
        if (!CPU_ISSET(cpu, &mask)) continue;
        if (n == 0) return cpu;
        --n;
    }
    return -1;
}

#else

bool pin_current_thread(int cpu) { return cpu < 0; }

int nth_usable_cpu(unsigned) { return -1; }

unsigned usable_cpus() {
    const unsigned hc = std::thread::hardware_concurrency();
    return hc == 0 ? 1u : hc;
}

#endif

} // namespace bmux::os
