#ifndef QUNET_CORE_OPTIMIZE_HPP
#define QUNET_CORE_OPTIMIZE_HPP

#include <QuNet/core/optimize/greedy.hpp>
#include <QuNet/core/optimize/optimal.hpp>
#include <QuNet/core/optimize/path.hpp>
#include <QuNet/core/optimize/problem.hpp>
#include <QuNet/core/optimize/slicing.hpp>
#include <QuNet/core/options.hpp>

#include <cstddef>

namespace qunet::opt {

/// PathStrategy::Auto uses optimal_path() up to this many inputs
inline constexpr std::size_t auto_optimal_inputs = 8;
/// PathStrategy::AutoHQ uses optimal_path() up to this many inputs
inline constexpr std::size_t auto_hq_optimal_inputs = 12;

///
/// \param problem the contraction
/// \param opts selects the strategy and its parameters
/// \return a complete contraction path for @p problem
///
ContractionPath find_path(const ContractionProblem& problem,
                          const ContractOptions& opts);

}  // namespace qunet::opt

#endif  // QUNET_CORE_OPTIMIZE_HPP
