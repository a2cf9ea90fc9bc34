#include <QuNet/core/logger.hpp>
#include <QuNet/core/optimize.hpp>
#include <QuNet/core/utility/macros.hpp>

namespace qunet::opt {

ContractionPath find_path(const ContractionProblem& problem,
                          const ContractOptions& opts) {
  const auto n = problem.num_inputs();
  auto strategy = opts.strategy;
  switch (strategy) {
    case PathStrategy::Auto:
      strategy = n <= auto_optimal_inputs ? PathStrategy::Optimal
                                          : PathStrategy::Greedy;
      break;
    case PathStrategy::AutoHQ:
      strategy = n <= auto_hq_optimal_inputs ? PathStrategy::Optimal
                                             : PathStrategy::RandomGreedy;
      break;
    default:
      break;
  }

  auto& logger = Logger::instance();
  if (logger.path)
    write_log(logger, "path search: ", n, " inputs, strategy ",
              to_string(strategy), "\n");

  switch (strategy) {
    case PathStrategy::Greedy:
      return greedy_path(problem);
    case PathStrategy::RandomGreedy:
      return random_greedy_path(problem, opts);
    case PathStrategy::Optimal:
      return optimal_path(problem);
    default:
      QUNET_UNREACHABLE;
  }
}

}  // namespace qunet::opt
