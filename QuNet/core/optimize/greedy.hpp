#ifndef QUNET_CORE_OPTIMIZE_GREEDY_HPP
#define QUNET_CORE_OPTIMIZE_GREEDY_HPP

#include <QuNet/core/optimize/path.hpp>
#include <QuNet/core/optimize/problem.hpp>
#include <QuNet/core/options.hpp>

namespace qunet::opt {

///
/// Repeatedly contracts the pair of connected tensors with the lowest cost
/// `size(result) - size(a) - size(b)`. Ties go to the pair holding fewer
/// indices in total, then to the pair with the lower ids. Once no two live
/// tensors share an index, the two smallest are multiplied.
///
/// \return a complete path for @p problem ; deterministic
///
ContractionPath greedy_path(const ContractionProblem& problem);

///
/// Greedy search where each step picks among the candidate pairs with
/// Boltzmann weights `exp(-(cost - min_cost) / (T * max(|min_cost|, 1)))`,
/// `T = opts.temperature`. Trial 0 is greedy_path(), trial `k` uses the seed
/// `opts.seed + k`; trials run concurrently (see qunet::num_threads()) and
/// the best path by flops, then width, then trial number is returned, so the
/// result does not depend on the number of threads.
///
/// \param opts uses max_repeats, seed, max_time and temperature
///
ContractionPath random_greedy_path(const ContractionProblem& problem,
                                   const ContractOptions& opts);

}  // namespace qunet::opt

#endif  // QUNET_CORE_OPTIMIZE_GREEDY_HPP
