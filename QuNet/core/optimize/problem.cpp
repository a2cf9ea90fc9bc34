#include <QuNet/core/optimize/problem.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <stdexcept>

namespace qunet::opt {

bool ContractionProblem::is_output(std::size_t id) const {
  return ranges::find(output, id) != output.end();
}

std::size_t ContractionProblem::id_of(std::string_view label) const {
  auto it = ranges::find(labels, label);
  if (it == labels.end())
    throw std::out_of_range("ContractionProblem: no index " +
                            std::string(label));
  return static_cast<std::size_t>(it - labels.begin());
}

namespace {

/// label -> number of inputs holding it, and the order labels first appear
struct LabelCensus {
  container::map<std::string, std::size_t> count;
  LabelList order;

  explicit LabelCensus(const container::vector<Tensor>& tensors) {
    for (auto&& t : tensors) {
      for (auto&& idx : t.indices()) {
        auto [it, inserted] = count.try_emplace(idx.label(), 0);
        if (inserted) order.push_back(idx.label());
        ++it->second;
      }
    }
  }
};

}  // namespace

LabelList default_output(const container::vector<Tensor>& tensors) {
  const LabelCensus census(tensors);
  LabelList result;
  for (auto&& label : census.order) {
    const auto n = census.count.at(label);
    if (n > 2)
      throw AmbiguousContractionError(
          "contraction output is ambiguous: index " + label + " is held by " +
          std::to_string(n) + " tensors; pass the output indices explicitly");
    if (n == 1) result.push_back(label);
  }
  return result;
}

ContractionProblem make_problem(const container::vector<Tensor>& tensors,
                                const std::optional<LabelList>& output) {
  const LabelCensus census(tensors);
  const LabelList out = output ? *output : default_output(tensors);

  ContractionProblem result;
  container::map<std::string, std::size_t> ids;
  for (auto&& label : out) {
    if (census.count.count(label) == 0)
      throw std::invalid_argument("contraction output index " + label +
                                  " is not held by any tensor");
    if (ids.count(label) != 0)
      throw std::invalid_argument("contraction output index " + label +
                                  " is repeated");
    ids.emplace(label, ids.size());
  }

  // index ids: output first, then the rest in order of appearance
  for (auto&& label : census.order) {
    if (ids.count(label) != 0) continue;
    if (census.count.at(label) == 1) continue;  // summed before contraction
    ids.emplace(label, ids.size());
  }
  result.extents.resize(ids.size(), 0);
  result.labels.resize(ids.size());
  for (auto&& [label, id] : ids) result.labels[id] = label;
  for (std::size_t k = 0; k != out.size(); ++k) result.output.push_back(k);

  for (auto&& t : tensors) {
    IndexIdSet held;
    for (auto&& idx : t.indices()) {
      auto it = ids.find(idx.label());
      if (it == ids.end()) continue;
      auto& extent = result.extents[it->second];
      if (extent == 0)
        extent = idx.extent();
      else if (extent != idx.extent())
        throw ShapeError("contraction: index " + idx.label() +
                         " has extents " + std::to_string(extent) + " and " +
                         std::to_string(idx.extent()));
      held.push_back(it->second);
    }
    ranges::sort(held);
    result.inputs.push_back(std::move(held));
  }
  return result;
}

}  // namespace qunet::opt
