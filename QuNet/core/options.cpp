#include <QuNet/core/options.hpp>

#include <stdexcept>

namespace qunet {

TruncationOptions TruncationOptions::exact() {
  TruncationOptions result;
  result.cutoff = 0;
  result.max_bond = std::nullopt;
  return result;
}

TruncationOptions TruncationOptions::with(Absorb a) const {
  auto result = *this;
  result.absorb = a;
  return result;
}

TruncationOptions TruncationOptions::with(SplitMethod m) const {
  auto result = *this;
  result.method = m;
  return result;
}

PathStrategy to_path_strategy(std::string_view name) {
  if (name == "greedy") return PathStrategy::Greedy;
  if (name == "random-greedy") return PathStrategy::RandomGreedy;
  if (name == "optimal") return PathStrategy::Optimal;
  if (name == "auto") return PathStrategy::Auto;
  if (name == "auto-hq") return PathStrategy::AutoHQ;
  throw std::invalid_argument("to_path_strategy: unknown strategy '" +
                              std::string(name) + "'");
}

std::string to_string(PathStrategy strategy) {
  switch (strategy) {
    case PathStrategy::Greedy:
      return "greedy";
    case PathStrategy::RandomGreedy:
      return "random-greedy";
    case PathStrategy::Optimal:
      return "optimal";
    case PathStrategy::Auto:
      return "auto";
    case PathStrategy::AutoHQ:
      return "auto-hq";
  }
  return "unknown";
}

}  // namespace qunet
