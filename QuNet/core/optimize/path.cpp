#include <QuNet/core/optimize/path.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>

namespace qunet::opt {

std::ostream& operator<<(std::ostream& os, const ContractionPath& path) {
  os << "[";
  for (std::size_t k = 0; k != path.steps.size(); ++k)
    os << (k ? ", " : "") << "(" << path.steps[k].first << ","
       << path.steps[k].second << ")";
  os << "]";
  return os;
}

namespace detail {

IndexIdSet set_union(const IndexIdSet& a, const IndexIdSet& b) {
  IndexIdSet result;
  std::set_union(a.begin(), a.end(), b.begin(), b.end(),
                 std::back_inserter(result));
  return result;
}

PathState::PathState(const ContractionProblem& problem)
    : problem_(&problem),
      sets_(problem.inputs.begin(), problem.inputs.end()),
      alive_(problem.num_inputs(), true),
      holders_(problem.num_indices()),
      num_alive_(problem.num_inputs()) {
  for (std::size_t t = 0; t != sets_.size(); ++t)
    for (auto i : sets_[t]) holders_[i].insert(t);
}

container::vector<std::size_t> PathState::live() const {
  container::vector<std::size_t> result;
  for (std::size_t t = 0; t != alive_.size(); ++t)
    if (alive_[t]) result.push_back(t);
  return result;
}

IndexIdSet PathState::result_indices(std::size_t a, std::size_t b) const {
  IndexIdSet result;
  for (auto i : set_union(sets_[a], sets_[b])) {
    const auto& h = holders_[i];
    const auto participants = h.count(a) + h.count(b);
    if (problem_->is_output(i) || h.size() > participants)
      result.push_back(i);
  }
  return result;
}

double PathState::flops(std::size_t a, std::size_t b) const {
  return size(set_union(sets_[a], sets_[b]));
}

double PathState::size(const IndexIdSet& indices) const {
  double result = 1;
  for (auto i : indices) result *= static_cast<double>(problem_->extents[i]);
  return result;
}

std::size_t PathState::contract(std::size_t a, std::size_t b) {
  if (a == b || !alive(a) || !alive(b))
    throw std::invalid_argument("contraction path: invalid step (" +
                                std::to_string(a) + "," + std::to_string(b) +
                                ")");
  auto result = result_indices(a, b);
  for (auto i : sets_[a]) holders_[i].erase(a);
  for (auto i : sets_[b]) holders_[i].erase(b);
  alive_[a] = false;
  alive_[b] = false;
  const auto id = sets_.size();
  for (auto i : result) holders_[i].insert(id);
  sets_.push_back(std::move(result));
  alive_.push_back(true);
  --num_alive_;
  return id;
}

}  // namespace detail

PathInfo evaluate(const ContractionProblem& problem,
                  const ContractionPath& path) {
  detail::PathState state(problem);
  PathInfo info;
  if (problem.num_inputs() == 1) info.max_size = state.size(0);
  for (auto [a, b] : path.steps) {
    info.flops += state.flops(a, b);
    const auto id = state.contract(a, b);
    const auto sz = state.size(id);
    info.sizes.push_back(sz);
    info.max_size = std::max(info.max_size, sz);
  }
  if (problem.num_inputs() > 0 && state.num_alive() != 1)
    throw std::invalid_argument(
        "contraction path leaves " + std::to_string(state.num_alive()) +
        " tensors uncontracted");
  info.width = std::log2(info.max_size);
  return info;
}

}  // namespace qunet::opt
