#pragma once

// Taskflow core and algorithms
#include <taskflow/taskflow.hpp>                  // tf::Executor, tf::Taskflow, tf::Future
#include <taskflow/algorithm/for_each.hpp>        // tf::Taskflow::for_each_index

// STL
#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>

namespace orbis::jobs {

// -----------------------------------------------------------------------------
// JobSystem
//
// Process-wide Taskflow executor used for per-tile work (grid geometry,
// terrain levels, climate seasons). Each task writes only its own tile slot,
// so results are identical for any worker count.
// -----------------------------------------------------------------------------
class JobSystem {
public:
  static JobSystem& Instance();

  tf::Executor& executor() noexcept { return _executor; }
  const tf::Executor& executor() const noexcept { return _executor; }

  // Index-based parallel for_each_index over [first, last) with step.
  // Non-blocking: returns tf::Future<void> from executor.run(...)
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, tf::Future<void>>
  ParallelForIndexAsync(Index first, Index last, Index step, F&& fn) {
    tf::Taskflow taskflow;
    taskflow.for_each_index(first, last, step, std::forward<F>(fn));
    return _executor.run(std::move(taskflow));
  }

  // Blocking variant for external threads. Do NOT call from inside a task
  // running on this executor.
  // Small ranges run inline: a 12-tile grid is not worth a task graph.
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, void>
  ParallelForIndex(Index first, Index last, F&& fn) {
    if (last <= first)
      return;
    if (static_cast<std::size_t>(last - first) < kSerialCutoff) {
      for (Index i = first; i < last; ++i)
        fn(i);
      return;
    }
    ParallelForIndexAsync(first, last, Index{1}, std::forward<F>(fn)).wait();
  }

  // Wait for all outstanding work (safe from external threads).
  void WaitAll() { _executor.wait_for_all(); }

  static unsigned Concurrency() noexcept { return std::thread::hardware_concurrency(); }

  static constexpr std::size_t kSerialCutoff = 512;

private:
  JobSystem();
  ~JobSystem();
  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  tf::Executor _executor;
};

// Convenience wrapper used by the worldgen code.
template <typename Index, typename F>
inline void parallel_for_index(Index first, Index last, F&& fn) {
  JobSystem::Instance().ParallelForIndex(first, last, std::forward<F>(fn));
}

} // namespace orbis::jobs
