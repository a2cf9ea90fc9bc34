#ifndef QUNET_CORE_OPTIMIZE_OPTIMAL_HPP
#define QUNET_CORE_OPTIMIZE_OPTIMAL_HPP

#include <QuNet/core/optimize/path.hpp>
#include <QuNet/core/optimize/problem.hpp>

#include <cstddef>

namespace qunet::opt {

/// the largest number of inputs optimal_path() accepts
inline constexpr std::size_t max_optimal_inputs = 16;

///
/// Dynamic programming over subsets of the inputs: the cheapest way to
/// produce each subset is the cheapest bipartition of it into two subsets
/// plus the cost of contracting them. Disconnected bipartitions (outer
/// products) are considered as well.
///
/// \return a path minimizing the total flops
/// \throw std::invalid_argument if @p problem has more than
///        max_optimal_inputs inputs
///
ContractionPath optimal_path(const ContractionProblem& problem);

}  // namespace qunet::opt

#endif  // QUNET_CORE_OPTIMIZE_OPTIMAL_HPP
