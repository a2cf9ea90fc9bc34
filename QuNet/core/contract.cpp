#include <QuNet/core/contract.hpp>
#include <QuNet/core/logger.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace qunet {

namespace {

/// sums over labels held by a single tensor that are not in @p output
void sum_unrequested(container::vector<Tensor>& tensors,
                     const LabelList& output) {
  container::map<std::string, std::size_t> count;
  for (auto&& t : tensors)
    for (auto&& idx : t.indices()) ++count[idx.label()];
  const LabelSet out(output.begin(), output.end());
  for (auto& t : tensors) {
    LabelList dangling;
    for (auto&& idx : t.indices())
      if (count[idx.label()] == 1 && out.count(idx.label()) == 0)
        dangling.push_back(idx.label());
    for (auto&& label : dangling) t = t.sum_over(label);
  }
}

}  // namespace

ContractionPlan plan_contraction(const container::vector<Tensor>& tensors,
                                 const std::optional<LabelList>& output,
                                 const ContractOptions& opts) {
  ContractionPlan plan;
  plan.output = output ? *output : opt::default_output(tensors);
  plan.problem = opt::make_problem(tensors, plan.output);
  plan.path = opt::find_path(plan.problem, opts);
  plan.info = opt::evaluate(plan.problem, plan.path);

  auto& logger = Logger::instance();
  if (logger.path)
    write_log(logger, "contraction plan: ", tensors.size(), " tensors, path ",
              plan.path, ", flops=", plan.info.flops,
              ", width=", plan.info.width, "\n");

  if (opts.max_width && plan.info.width > *opts.max_width) {
    if (!opts.slice)
      throw ResourceExhaustion("contraction width " +
                                   std::to_string(plan.info.width) +
                                   " exceeds the budget of " +
                                   std::to_string(*opts.max_width),
                               plan.info.width, *opts.max_width);
    auto slicing = opt::find_slices(plan.problem, plan.path, *opts.max_width);
    plan.sliced = std::move(slicing.labels);
    plan.num_slices = slicing.num_slices;
  }
  return plan;
}

Tensor execute_path(container::vector<Tensor> tensors,
                    const opt::ContractionPath& path, const LabelList& output) {
  const LabelSet out(output.begin(), output.end());
  container::map<std::string, std::size_t> holders;
  for (auto&& t : tensors)
    for (auto&& idx : t.indices()) ++holders[idx.label()];

  container::vector<std::optional<Tensor>> slots;
  slots.reserve(2 * tensors.size());
  for (auto& t : tensors) slots.emplace_back(std::move(t));

  auto take = [&slots](std::size_t id) {
    if (id >= slots.size() || !slots[id])
      throw std::invalid_argument("contraction path refers to tensor " +
                                  std::to_string(id) +
                                  " which is not available");
    Tensor t = std::move(*slots[id]);
    slots[id].reset();
    return t;
  };

  auto& logger = Logger::instance();
  for (auto [i, j] : path.steps) {
    const auto a = take(i);
    const auto b = take(j);
    LabelSet keep;
    for (auto&& idx : a.indices()) {
      const auto& label = idx.label();
      if (b.has_index(label) && (out.count(label) != 0 || holders[label] > 2))
        keep.insert(label);
    }
    auto r = contract(a, b, keep);
    for (auto&& idx : a.indices()) --holders[idx.label()];
    for (auto&& idx : b.indices()) --holders[idx.label()];
    for (auto&& idx : r.indices()) ++holders[idx.label()];
    if (logger.contract)
      write_log(logger, "contract ", i, " and ", j, " -> ", slots.size(), ": ",
                r, "\n");
    slots.emplace_back(std::move(r));
  }

  std::optional<Tensor> result;
  for (auto& s : slots) {
    if (!s) continue;
    if (result)
      throw std::invalid_argument(
          "contraction path leaves more than one tensor");
    result = std::move(*s);
    s.reset();
  }
  if (!result) return Tensor::scalar(1.);
  for (auto&& label : result->labels())
    if (out.count(label) == 0) result = result->sum_over(label);
  result->transpose(output);
  return std::move(*result);
}

Tensor contract_tensors(container::vector<Tensor> tensors,
                        const std::optional<LabelList>& output,
                        const ContractOptions& opts) {
  const auto plan = plan_contraction(tensors, output, opts);
  sum_unrequested(tensors, plan.output);
  if (plan.sliced.empty())
    return execute_path(std::move(tensors), plan.path, plan.output);

  const auto nsliced = plan.sliced.size();
  container::svector<std::size_t> extents;
  for (auto&& label : plan.sliced)
    extents.push_back(plan.problem.extents[plan.problem.id_of(label)]);

  auto& logger = Logger::instance();
  if (logger.slice)
    write_log(logger, "contracting ", plan.num_slices, " slices\n");

  container::svector<std::size_t> value(nsliced, 0);
  std::optional<Tensor> total;
  for (std::size_t s = 0; s != plan.num_slices; ++s) {
    container::vector<Tensor> part;
    part.reserve(tensors.size());
    for (auto&& t : tensors) {
      Tensor p = t;
      for (std::size_t k = 0; k != nsliced; ++k)
        if (p.has_index(plan.sliced[k])) p = p.isel(plan.sliced[k], value[k]);
      part.push_back(std::move(p));
    }
    auto r = execute_path(std::move(part), plan.path, plan.output);
    if (total)
      total->data() += r.data();
    else
      total = std::move(r);

    for (std::size_t k = nsliced; k-- > 0;) {
      if (++value[k] < extents[k]) break;
      value[k] = 0;
    }
  }
  return std::move(*total);
}

}  // namespace qunet
