#include <QuNet/core/logger.hpp>
#include <QuNet/core/optimize/optimal.hpp>

#include <bit>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>

namespace qunet::opt {

ContractionPath optimal_path(const ContractionProblem& problem) {
  const auto nt = problem.num_inputs();
  if (nt > max_optimal_inputs)
    throw std::invalid_argument("optimal_path: " + std::to_string(nt) +
                                " inputs exceed the limit of " +
                                std::to_string(max_optimal_inputs));
  if (nt < 2) return {};

  using Mask = std::uint32_t;
  const Mask full = (Mask{1} << nt) - 1;

  // inputs holding each index
  container::vector<Mask> holders(problem.num_indices(), 0);
  for (std::size_t t = 0; t != nt; ++t)
    for (auto i : problem.inputs[t]) holders[i] |= Mask{1} << t;

  auto size_of = [&problem](const IndexIdSet& indices) {
    double result = 1;
    for (auto i : indices) result *= static_cast<double>(problem.extents[i]);
    return result;
  };

  struct Subnet {
    /// indices of the tensor this subset contracts to
    IndexIdSet indices;
    /// cost of the cheapest way to produce it
    double flops;
    /// the left part of the cheapest bipartition
    Mask left = 0;
  };
  container::vector<Subnet> results(std::size_t{full} + 1);
  for (Mask s = 1; s <= full; ++s) {
    auto& r = results[s];
    for (std::size_t i = 0; i != holders.size(); ++i) {
      if ((holders[i] & s) == 0) continue;
      if (problem.is_output(i) || (holders[i] & ~s & full) != 0)
        r.indices.push_back(i);
    }
    r.flops = std::popcount(s) > 1 ? std::numeric_limits<double>::max() : 0;
  }

  // a proper subset of s is numerically smaller than s, so it is final by the
  // time s is visited
  for (Mask s = 1; s <= full; ++s) {
    if (std::popcount(s) < 2) continue;
    auto& r = results[s];
    const Mask lowest = s & (~s + 1);
    for (Mask lp = (s - 1) & s; lp != 0; lp = (lp - 1) & s) {
      // each bipartition once: the left part holds the lowest input
      if ((lp & lowest) == 0) continue;
      const Mask rp = s ^ lp;
      const auto cost =
          size_of(detail::set_union(results[lp].indices, results[rp].indices)) +
          results[lp].flops + results[rp].flops;
      if (cost < r.flops) {
        r.flops = cost;
        r.left = lp;
      }
    }
  }

  ContractionPath path;
  std::size_t next_id = nt;
  std::function<std::size_t(Mask)> emit = [&](Mask s) -> std::size_t {
    if (std::popcount(s) == 1)
      return static_cast<std::size_t>(std::countr_zero(s));
    const auto a = emit(results[s].left);
    const auto b = emit(s ^ results[s].left);
    path.steps.emplace_back(a, b);
    return next_id++;
  };
  emit(full);

  auto& logger = Logger::instance();
  if (logger.path)
    write_log(logger, "optimal: ", nt, " inputs, flops=", results[full].flops,
              "\n");
  return path;
}

}  // namespace qunet::opt
