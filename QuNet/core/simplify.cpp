#include <QuNet/core/logger.hpp>
#include <QuNet/core/simplify.hpp>
#include <QuNet/core/utility/macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

namespace qunet {

namespace {

container::vector<TensorId> ids_of(const TensorNetwork& tn) {
  container::vector<TensorId> result;
  for (auto&& [id, t] : tn.tensor_map()) result.push_back(id);
  return result;
}

/// keeps the diagonal of @p keep and @p drop : tensors holding both take
/// their diagonal, the others rename @p drop to @p keep
void merge_diagonal(TensorNetwork& tn, const std::string& keep,
                    const std::string& drop) {
  RenameMap rename;
  rename.emplace(drop, keep);
  for (auto h : tn.tensors_with_index(drop)) {
    tn.modify(h, [&](Tensor& t) {
      if (t.has_index(keep))
        t = t.diagonal(keep, drop);
      else
        t.reindex(rename);
    });
  }
}

void log_rewrite(std::string_view what, const TensorNetwork& tn) {
  auto& logger = Logger::instance();
  if (logger.simplify)
    write_log(logger, "simplify ", what, ": ", tn.num_tensors(), " tensors, ",
              tn.num_indices(), " indices\n");
}

}  // namespace

bool rank_simplify(TensorNetwork& tn, const LabelSet& output,
                   const SimplifyOptions& opts) {
  bool changed = false;

  LabelList unit;
  for (auto&& [label, ids] : tn.index_map())
    if (output.count(label) == 0 && tn.index_extent(label) == 1)
      unit.push_back(label);
  for (auto&& label : unit) {
    for (auto h : tn.tensors_with_index(label))
      tn.modify(h, [&label](Tensor& t) { t = t.isel(label, 0); });
    changed = true;
  }

  bool merged = true;
  while (merged) {
    merged = false;
    for (auto a : ids_of(tn)) {
      if (!tn.contains(a)) continue;
      for (auto b : tn.neighbors(a)) {
        const auto& ta = tn.tensor(a);
        const auto& tb = tn.tensor(b);
        LabelSet keep;
        std::size_t summed = 0;
        for (auto&& label : tn.shared_indices(a, b)) {
          if (output.count(label) != 0)
            keep.insert(label);
          else if (tn.index_map().at(label).size() == 2)
            ++summed;
        }
        const auto shared = tn.shared_indices(a, b).size();
        const auto rank = ta.rank() + tb.rank() - shared - summed;
        if (rank > std::max(ta.rank(), tb.rank())) continue;
        if (opts.max_rank && rank > *opts.max_rank) continue;
        tn.contract_between(a, b, keep);
        merged = changed = true;
        break;
      }
    }
  }
  if (changed) log_rewrite("R", tn);
  return changed;
}

bool diagonal_reduce(TensorNetwork& tn, const LabelSet& output,
                     const SimplifyOptions& opts) {
  bool changed = false;
  for (auto id : ids_of(tn)) {
    bool again = true;
    while (again && tn.contains(id)) {
      again = false;
      const auto& t = tn.tensor(id);
      for (std::size_t i = 0; !again && i < t.rank(); ++i) {
        for (std::size_t j = i + 1; j < t.rank(); ++j) {
          const auto& ii = t.indices()[i];
          const auto& ij = t.indices()[j];
          if (ii.extent() != ij.extent() || ii.extent() == 1) continue;
          const bool out_i = output.count(ii.label()) != 0;
          const bool out_j = output.count(ij.label()) != 0;
          if (out_i && out_j) continue;
          if (!t.data().is_diagonal(i, j, opts.atol)) continue;
          // never rename an output label away
          const auto keep = out_j ? ij.label() : ii.label();
          const auto drop = out_j ? ii.label() : ij.label();
          merge_diagonal(tn, keep, drop);
          changed = again = true;
          break;
        }
      }
    }
  }
  if (changed) log_rewrite("D", tn);
  return changed;
}

bool column_reduce(TensorNetwork& tn, const LabelSet& output,
                   const SimplifyOptions& opts) {
  bool changed = false;
  for (auto id : ids_of(tn)) {
    bool again = true;
    while (again && tn.contains(id)) {
      again = false;
      const auto& t = tn.tensor(id);
      for (std::size_t axis = 0; axis != t.rank(); ++axis) {
        const auto label = t.indices()[axis].label();
        if (output.count(label) != 0 || t.indices()[axis].extent() == 1)
          continue;
        const auto nonzero = t.data().nonzero_slices(axis, opts.atol);
        if (nonzero.size() > 1) continue;
        const auto value = nonzero.empty() ? 0 : nonzero.front();
        for (auto h : tn.tensors_with_index(label))
          tn.modify(h, [&](Tensor& x) { x = x.isel(label, value); });
        changed = again = true;
        break;
      }
    }
  }
  if (changed) log_rewrite("C", tn);
  return changed;
}

bool split_simplify(TensorNetwork& tn, const LabelSet& /* output */,
                    const SimplifyOptions& opts) {
  // bipartitions are enumerated exhaustively
  constexpr std::size_t max_split_rank = 6;
  const TruncationOptions truncation{.cutoff = opts.atol,
                                     .cutoff_mode = CutoffMode::Abs,
                                     .absorb = Absorb::Both};
  bool changed = false;
  for (auto id : ids_of(tn)) {
    const auto t = tn.tensor(id);
    const auto r = t.rank();
    if (r < 2 || r > max_split_rank) continue;
    const auto labels = t.labels();
    // the left part always holds axis 0, so each bipartition is seen once
    const std::size_t nmasks = std::size_t{1} << (r - 1);
    for (std::size_t mask = 0; mask + 1 < nmasks; ++mask) {
      LabelList left{labels[0]};
      std::size_t m = t.indices()[0].extent();
      for (std::size_t k = 1; k != r; ++k) {
        if ((mask >> (k - 1)) & 1) {
          left.push_back(labels[k]);
          m *= t.indices()[k].extent();
        }
      }
      const auto n = t.size() / m;
      auto parts = split(t, left, truncation);
      if (parts.bond.extent() >= std::min(m, n)) continue;
      tn.update(id, std::move(parts.left));
      tn.add(std::move(parts.right));
      changed = true;
      break;
    }
  }
  if (changed) log_rewrite("S", tn);
  return changed;
}

bool resolve_hyperindices(TensorNetwork& tn, const LabelSet& output) {
  LabelList hyper;
  for (auto&& [label, ids] : tn.index_map()) {
    const bool is_output = output.count(label) != 0;
    if (ids.size() > 2 || (is_output && ids.size() > 1)) hyper.push_back(label);
  }
  for (auto&& label : hyper) {
    const auto extent = tn.index_extent(label);
    IndexList legs;
    for (auto h : tn.tensors_with_index(label)) {
      legs.push_back(Index::make_unique(extent));
      RenameMap rename;
      rename.emplace(label, legs.back().label());
      tn.modify(h, [&rename](Tensor& t) { t.reindex(rename); });
    }
    if (output.count(label) != 0) legs.emplace_back(label, extent);
    const auto rank = legs.size();
    tn.add(Tensor(Array::delta(rank, extent), std::move(legs)));
  }
  if (!hyper.empty()) log_rewrite("H", tn);
  return !hyper.empty();
}

bool absorb_scalars(TensorNetwork& tn) {
  bool changed = false;
  for (auto id : ids_of(tn)) {
    if (tn.num_tensors() < 2) break;
    if (tn.tensor(id).rank() != 0) continue;
    const auto value = tn.tensor(id).value();
    tn.pop(id);
    // prefer a tensor that is not a scalar itself
    auto target = tn.tensor_map().begin()->first;
    for (auto&& [other, t] : tn.tensor_map()) {
      if (t.rank() != 0) {
        target = other;
        break;
      }
    }
    tn.modify(target, [value](Tensor& t) { t *= value; });
    changed = true;
  }
  return changed;
}

TensorNetwork& full_simplify(TensorNetwork& tn, const SimplifyOptions& opts) {
  for (char c : opts.sequence)
    if (std::string_view("RDCSH").find(c) == std::string_view::npos)
      throw std::invalid_argument(
          std::string("full_simplify: unknown rewrite '") + c + "'");

  LabelSet output;
  if (opts.output_inds)
    output.insert(opts.output_inds->begin(), opts.output_inds->end());
  else
    for (auto&& label : tn.outer_indices()) output.insert(label);

  for (std::size_t pass = 0; pass != opts.max_passes; ++pass) {
    bool changed = false;
    for (char c : opts.sequence) {
      bool applied = false;
      switch (c) {
        case 'R':
          applied = rank_simplify(tn, output, opts);
          break;
        case 'D':
          applied = diagonal_reduce(tn, output, opts);
          break;
        case 'C':
          applied = column_reduce(tn, output, opts);
          break;
        case 'H':
          applied = resolve_hyperindices(tn, output);
          break;
        case 'S': {
          TensorNetwork trial = tn;
          if (!split_simplify(trial, output, opts)) break;
          rank_simplify(trial, output, opts);
          absorb_scalars(trial);
          const bool fewer_tensors = trial.num_tensors() < tn.num_tensors();
          const bool fewer_indices = trial.num_indices() < tn.num_indices();
          if (trial.num_tensors() <= tn.num_tensors() &&
              trial.num_indices() <= tn.num_indices() &&
              (fewer_tensors || fewer_indices)) {
            tn = std::move(trial);
            applied = true;
          }
          break;
        }
        default:
          QUNET_UNREACHABLE;
      }
      if (absorb_scalars(tn)) applied = true;
      changed = changed || applied;
    }
    if (!changed) break;
  }

  if (opts.equalize_norms) tn.equalize_norms();
  return tn;
}

}  // namespace qunet
