#include <QuNet/core/logger.hpp>
#include <QuNet/core/optimize/slicing.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <range/v3/algorithm/find.hpp>

#include <optional>
#include <string>
#include <tuple>

namespace qunet::opt {

ContractionProblem sliced(const ContractionProblem& problem,
                          const container::svector<std::size_t>& ids) {
  ContractionProblem result = problem;
  for (auto i : ids) result.extents.at(i) = 1;
  return result;
}

Slicing find_slices(const ContractionProblem& problem,
                    const ContractionPath& path, double target_width) {
  Slicing result;
  result.info = evaluate(problem, path);
  auto& logger = Logger::instance();

  while (result.info.width > target_width) {
    std::optional<std::size_t> best;
    PathInfo best_info;
    double best_total = 0;
    for (std::size_t i = 0; i != problem.num_indices(); ++i) {
      if (problem.is_output(i) || problem.extents[i] == 1) continue;
      if (ranges::find(result.ids, i) != result.ids.end()) continue;
      auto ids = result.ids;
      ids.push_back(i);
      auto info = evaluate(sliced(problem, ids), path);
      const auto total = info.flops * static_cast<double>(result.num_slices *
                                                          problem.extents[i]);
      if (!best || std::tie(info.width, total) <
                       std::tie(best_info.width, best_total)) {
        best = i;
        best_info = std::move(info);
        best_total = total;
      }
    }
    if (!best)
      throw ResourceExhaustion(
          "contraction width " + std::to_string(result.info.width) +
              " cannot be sliced down to " + std::to_string(target_width),
          result.info.width, target_width);

    result.ids.push_back(*best);
    result.labels.push_back(problem.labels[*best]);
    result.num_slices *= problem.extents[*best];
    result.info = std::move(best_info);
    if (logger.slice)
      write_log(logger, "slicing ", problem.labels[*best], ": width ",
                result.info.width, ", ", result.num_slices, " slices\n");
  }
  return result;
}

}  // namespace qunet::opt
