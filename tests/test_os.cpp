/**
 * @file test_os.cpp
 * @brief Tests for CPU placement of reactor loops.
 *
 * Validates:
 *  - nth_usable_cpu() walks the process's allowed set, not 0..N-1
 *  - Pinning to each allowed CPU succeeds
 */

#include <gtest/gtest.h>
#include <thread>

#include <sched.h>

#include "bmux/os/affinity.hpp"

/**
 * @test Nth_Usable_Cpu_Follows_Allowed_Set
 * @brief Every returned index is in the affinity mask, in ascending order.
 */
TEST(Affinity, Nth_Usable_Cpu_Follows_Allowed_Set) {
  cpu_set_t mask;
  CPU_ZERO(&mask);
  ASSERT_EQ(sched_getaffinity(0, sizeof(mask), &mask), 0);

  const unsigned n = bmux::os::usable_cpus();
  int previous = -1;
  for (unsigned i = 0; i < n; ++i) {
    const int cpu = bmux::os::nth_usable_cpu(i);
    ASSERT_GE(cpu, 0) << "index " << i;
    EXPECT_TRUE(CPU_ISSET(cpu, &mask)) << "cpu " << cpu;
    EXPECT_GT(cpu, previous);
    previous = cpu;
  }
  EXPECT_EQ(bmux::os::nth_usable_cpu(n), -1);
}

/**
 * @test Pin_Each_Usable_Cpu
 * @brief A thread can be pinned to every CPU the process may use.
 */
TEST(Affinity, Pin_Each_Usable_Cpu) {
  const unsigned n = bmux::os::usable_cpus();
  for (unsigned i = 0; i < n; ++i) {
    bool pinned = false;
    std::thread t([&] { pinned = bmux::os::pin_current_thread(bmux::os::nth_usable_cpu(i)); });
    t.join();
    EXPECT_TRUE(pinned) << "loop index " << i;
  }
  EXPECT_TRUE(bmux::os::pin_current_thread(-1));
}
