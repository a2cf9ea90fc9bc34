#ifndef QUNET_CORE_RUNTIME_HPP
#define QUNET_CORE_RUNTIME_HPP

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <range/v3/range/access.hpp>
#include <range/v3/range/primitives.hpp>

namespace qunet {

namespace detail {
int& nthreads_accessor();
}  // namespace detail

/// sets the number of threads to use for concurrent work
void set_num_threads(int nt);

/// @return the number of threads to use for concurrent work
/// @note by default this is the value of the QUNET_NUM_THREADS environment
/// variable, if set, otherwise std::thread::hardware_concurrency() (or 1)
/// @sa set_num_threads()
int num_threads();

/// Parallel version of std::for_each with at most @c nthreads instances
/// executing concurrently, where @c nthreads is the value returned by
/// num_threads() .
/// @param rng a sized random-access range
/// @param op the function object to execute on each element; @c op(t1) will
///        be commenced not after @c op(t2) if @c t1<t2 .
/// @note The load is balanced dynamically. Exceptions thrown by @p op are
/// rethrown (the first one) after all threads joined.
template <typename SizedRange, typename UnaryOp>
void for_each(SizedRange& rng, const UnaryOp& op) {
  std::atomic<std::size_t> work = 0;
  std::exception_ptr error;
  std::atomic_flag error_set = ATOMIC_FLAG_INIT;
  auto task = [&work, &op, &rng, &error, &error_set,
               ntasks = static_cast<std::size_t>(ranges::size(rng))]() {
    auto it = ranges::begin(rng);
    std::size_t prev_task_id = 0;
    std::size_t task_id = work.fetch_add(1);
    while (task_id < ntasks) {
      std::advance(it, task_id - prev_task_id);
      try {
        op(*it);
      } catch (...) {
        if (!error_set.test_and_set()) error = std::current_exception();
      }
      prev_task_id = task_id;
      task_id = work.fetch_add(1);
    }
  };

  const auto nthreads = num_threads();
  std::vector<std::thread> threads;
  for (int thread_id = 0; thread_id != nthreads; ++thread_id) {
    if (thread_id != nthreads - 1)
      threads.push_back(std::thread(task));
    else
      task();
  }  // threads_id
  for (auto& t : threads) t.join();
  if (error) std::rethrow_exception(error);
}

}  // namespace qunet

#endif  // QUNET_CORE_RUNTIME_HPP
