#include <QuNet/core/context.hpp>
#include <QuNet/core/contract.hpp>
#include <QuNet/core/logger.hpp>
#include <QuNet/core/simplify.hpp>
#include <QuNet/core/tensor_network.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <range/v3/algorithm/find.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <ostream>
#include <stdexcept>

namespace qunet {

namespace {

const ContractOptions& or_default(const std::optional<ContractOptions>& opts) {
  return opts ? *opts : get_default_context().contraction();
}

/// labels of @p tn whose holder count satisfies @p pred , in order of first
/// appearance
template <typename Pred>
LabelList labels_by_count(const TensorNetwork& tn, Pred&& pred) {
  LabelList result;
  LabelSet seen;
  for (auto&& [id, t] : tn.tensor_map()) {
    for (auto&& idx : t.indices()) {
      if (!seen.insert(idx.label()).second) continue;
      if (pred(tn.index_map().at(idx.label()).size()))
        result.push_back(idx.label());
    }
  }
  return result;
}

}  // namespace

TensorNetwork::TensorNetwork(container::vector<Tensor> tensors) {
  for (auto& t : tensors) add(std::move(t));
}

void TensorNetwork::register_tensor(TensorId id, const Tensor& t) {
  for (auto&& idx : t.indices()) index_map_[idx.label()].insert(id);
  for (auto&& tag : t.tags()) tag_map_[tag].insert(id);
}

void TensorNetwork::unregister_tensor(TensorId id, const Tensor& t) {
  auto drop = [id](registry_type& registry, const std::string& key) {
    auto it = registry.find(key);
    if (it == registry.end()) return;
    it->second.erase(id);
    if (it->second.empty()) registry.erase(it);
  };
  for (auto&& idx : t.indices()) drop(index_map_, idx.label());
  for (auto&& tag : t.tags()) drop(tag_map_, tag);
}

void TensorNetwork::rebuild_registries() {
  index_map_.clear();
  tag_map_.clear();
  for (auto&& [id, t] : tensors_) register_tensor(id, t);
}

void TensorNetwork::check_extents(const Tensor& t,
                                  const TensorIdSet& ignore) const {
  for (auto&& idx : t.indices()) {
    auto it = index_map_.find(idx.label());
    if (it == index_map_.end()) continue;
    for (auto holder : it->second) {
      if (ignore.count(holder) != 0) continue;
      const auto extent = tensors_.at(holder).extent(idx.label());
      if (extent != idx.extent())
        throw ShapeError("TensorNetwork: index " + idx.label() +
                         " has extent " + std::to_string(extent) +
                         " in the network but " +
                         std::to_string(idx.extent()) + " in the new tensor");
      break;
    }
  }
}

TensorId TensorNetwork::emplace(TensorId id, Tensor t) {
  register_tensor(id, t);
  tensors_.emplace(id, std::move(t));
  next_id_ = std::max(next_id_, id + 1);
  return id;
}

TensorId TensorNetwork::add(Tensor t) {
  check_extents(t, {});
  const auto id = emplace(next_id_, std::move(t));
  auto& logger = Logger::instance();
  if (logger.tensor_network)
    write_log(logger, "TensorNetwork: added ", id, " ", tensors_.at(id), "\n");
  return id;
}

TensorNetwork& TensorNetwork::add(const TensorNetwork& other,
                                  bool check_collisions) {
  TensorNetwork incoming = other;
  if (check_collisions) {
    RenameMap mangle;
    for (auto&& label : other.inner_indices()) {
      auto it = index_map_.find(label);
      if (it != index_map_.end() && it->second.size() > 1)
        mangle.emplace(label, Index::make_unique_label());
    }
    if (!mangle.empty()) incoming.reindex(mangle);
  }
  for (auto&& [id, t] : incoming.tensors_) check_extents(t, {});
  for (auto&& [id, t] : incoming.tensors_) emplace(next_id_, t);
  return *this;
}

TensorNetwork& TensorNetwork::operator&=(const TensorNetwork& other) {
  return add(other, true);
}

TensorNetwork operator&(const TensorNetwork& a, const TensorNetwork& b) {
  TensorNetwork result = a;
  result.add(b, true);
  return result;
}

Tensor TensorNetwork::pop(TensorId id) {
  auto it = tensors_.find(id);
  if (it == tensors_.end())
    throw std::out_of_range("TensorNetwork: no tensor " + std::to_string(id));
  Tensor t = std::move(it->second);
  tensors_.erase(it);
  unregister_tensor(id, t);
  auto& logger = Logger::instance();
  if (logger.tensor_network)
    write_log(logger, "TensorNetwork: removed ", id, "\n");
  return t;
}

std::size_t TensorNetwork::remove(const TagList& tags, SelectMode mode) {
  const auto ids = select_ids(tags, mode);
  for (auto id : ids) pop(id);
  return ids.size();
}

void TensorNetwork::update(TensorId id, Tensor t) {
  auto it = tensors_.find(id);
  if (it == tensors_.end())
    throw std::out_of_range("TensorNetwork: no tensor " + std::to_string(id));
  check_extents(t, {id});
  unregister_tensor(id, it->second);
  it->second = std::move(t);
  register_tensor(id, it->second);
}

void TensorNetwork::update_pair(TensorId a, Tensor ta, TensorId b, Tensor tb) {
  const TensorIdSet ids{a, b};
  check_extents(ta, ids);
  check_extents(tb, ids);
  for (auto&& idx : ta.indices())
    if (tb.has_index(idx.label()) && tb.extent(idx.label()) != idx.extent())
      throw ShapeError("TensorNetwork: index " + idx.label() +
                       " has different extents in the replacements");
  unregister_tensor(a, tensor(a));
  unregister_tensor(b, tensor(b));
  tensors_.at(a) = std::move(ta);
  tensors_.at(b) = std::move(tb);
  register_tensor(a, tensors_.at(a));
  register_tensor(b, tensors_.at(b));
}

TensorId TensorNetwork::replace(const TensorIdSet& ids, Tensor t) {
  if (ids.empty()) return add(std::move(t));
  for (auto id : ids)
    if (!contains(id))
      throw std::out_of_range("TensorNetwork: no tensor " + std::to_string(id));
  check_extents(t, ids);
  for (auto id : ids) {
    auto it = tensors_.find(id);
    unregister_tensor(id, it->second);
    tensors_.erase(it);
  }
  return emplace(*ids.begin(), std::move(t));
}

TensorNetwork TensorNetwork::conj() const {
  TensorNetwork result = *this;
  for (auto& [id, t] : result.tensors_) t = t.conj();
  return result;
}

TensorIdSet TensorNetwork::select_ids(const TagList& tags,
                                      SelectMode mode) const {
  TensorIdSet result;
  if (tags.empty()) {
    if (mode == SelectMode::All)
      for (auto&& [id, t] : tensors_) result.insert(id);
    return result;
  }
  if (mode == SelectMode::Any) {
    for (auto&& tag : tags) {
      auto it = tag_map_.find(tag);
      if (it != tag_map_.end())
        result.insert(it->second.begin(), it->second.end());
    }
    return result;
  }
  auto first = tag_map_.find(tags.front());
  if (first == tag_map_.end()) return result;
  result = first->second;
  for (std::size_t k = 1; k < tags.size() && !result.empty(); ++k) {
    auto it = tag_map_.find(tags[k]);
    if (it == tag_map_.end()) return {};
    TensorIdSet both;
    std::set_intersection(result.begin(), result.end(), it->second.begin(),
                          it->second.end(), std::inserter(both, both.end()));
    result = std::move(both);
  }
  return result;
}

TensorNetwork TensorNetwork::select(const TagList& tags,
                                    SelectMode mode) const {
  return subnetwork(select_ids(tags, mode));
}

TensorNetwork TensorNetwork::subnetwork(const TensorIdSet& ids) const {
  TensorNetwork result;
  for (auto id : ids) result.emplace(id, tensor(id));
  return result;
}

TensorId TensorNetwork::id_of(std::string_view tag) const {
  auto it = tag_map_.find(std::string(tag));
  if (it == tag_map_.end())
    throw std::out_of_range("TensorNetwork: no tensor tagged " +
                            std::string(tag));
  if (it->second.size() != 1)
    throw std::logic_error("TensorNetwork: " +
                           std::to_string(it->second.size()) +
                           " tensors are tagged " + std::string(tag));
  return *it->second.begin();
}

const Tensor& TensorNetwork::operator[](std::string_view tag) const {
  return tensor(id_of(tag));
}

TensorIdSet TensorNetwork::select_neighbors(const TensorIdSet& ids) const {
  TensorIdSet result;
  for (auto id : ids)
    for (auto n : neighbors(id))
      if (ids.count(n) == 0) result.insert(n);
  return result;
}

const Tensor& TensorNetwork::tensor(TensorId id) const {
  auto it = tensors_.find(id);
  if (it == tensors_.end())
    throw std::out_of_range("TensorNetwork: no tensor " + std::to_string(id));
  return it->second;
}

TagSet TensorNetwork::tags() const {
  TagSet result;
  for (auto&& [tag, ids] : tag_map_) result.insert(tag);
  return result;
}

LabelList TensorNetwork::outer_indices() const {
  return labels_by_count(*this, [](std::size_t n) { return n == 1; });
}

LabelList TensorNetwork::inner_indices() const {
  return labels_by_count(*this, [](std::size_t n) { return n > 1; });
}

LabelList TensorNetwork::hyper_indices() const {
  return labels_by_count(*this, [](std::size_t n) { return n > 2; });
}

std::size_t TensorNetwork::index_extent(std::string_view label) const {
  auto it = index_map_.find(std::string(label));
  if (it == index_map_.end())
    throw std::out_of_range("TensorNetwork: no index " + std::string(label));
  return tensor(*it->second.begin()).extent(label);
}

TensorIdSet TensorNetwork::tensors_with_index(std::string_view label) const {
  auto it = index_map_.find(std::string(label));
  return it == index_map_.end() ? TensorIdSet{} : it->second;
}

TensorIdSet TensorNetwork::neighbors(TensorId id) const {
  TensorIdSet result;
  for (auto&& idx : tensor(id).indices())
    for (auto n : index_map_.at(idx.label()))
      if (n != id) result.insert(n);
  return result;
}

LabelList TensorNetwork::shared_indices(TensorId a, TensorId b) const {
  const auto& tb = tensor(b);
  LabelList result;
  for (auto&& idx : tensor(a).indices())
    if (tb.has_index(idx.label())) result.push_back(idx.label());
  return result;
}

std::size_t TensorNetwork::max_bond() const {
  std::size_t result = 1;
  for (auto&& [label, ids] : index_map_)
    if (ids.size() > 1)
      result = std::max(result, tensor(*ids.begin()).extent(label));
  return result;
}

std::size_t TensorNetwork::bond_size(std::string_view tag_a,
                                     std::string_view tag_b) const {
  const auto a = id_of(tag_a);
  const auto b = id_of(tag_b);
  const auto shared = shared_indices(a, b);
  if (shared.empty())
    throw std::invalid_argument("TensorNetwork: " + std::string(tag_a) +
                                " and " + std::string(tag_b) +
                                " share no index");
  std::size_t result = 1;
  for (auto&& label : shared) result *= tensor(a).extent(label);
  return result;
}

void TensorNetwork::check() const {
  for (auto&& [id, t] : tensors_) {
    for (auto&& idx : t.indices()) {
      auto it = index_map_.find(idx.label());
      if (it == index_map_.end() || it->second.count(id) == 0)
        throw Exception("TensorNetwork::check: index " + idx.label() +
                        " of tensor " + std::to_string(id) +
                        " is not registered");
    }
    for (auto&& tag : t.tags()) {
      auto it = tag_map_.find(tag);
      if (it == tag_map_.end() || it->second.count(id) == 0)
        throw Exception("TensorNetwork::check: tag " + tag + " of tensor " +
                        std::to_string(id) + " is not registered");
    }
  }
  for (auto&& [label, ids] : index_map_) {
    if (ids.empty())
      throw Exception("TensorNetwork::check: index " + label +
                      " has no tensors");
    std::optional<std::size_t> extent;
    for (auto id : ids) {
      auto it = tensors_.find(id);
      if (it == tensors_.end() || !it->second.has_index(label))
        throw Exception("TensorNetwork::check: index " + label +
                        " refers to tensor " + std::to_string(id) +
                        " which does not hold it");
      const auto e = it->second.extent(label);
      if (extent && *extent != e)
        throw Exception("TensorNetwork::check: index " + label +
                        " has inconsistent extents");
      extent = e;
    }
  }
  for (auto&& [tag, ids] : tag_map_) {
    for (auto id : ids) {
      auto it = tensors_.find(id);
      if (it == tensors_.end() || !it->second.has_tag(tag))
        throw Exception("TensorNetwork::check: tag " + tag +
                        " refers to tensor " + std::to_string(id) +
                        " which does not carry it");
    }
  }
}

TensorId TensorNetwork::contract_between(TensorId a, TensorId b,
                                         const LabelSet& keep) {
  if (a == b)
    throw std::invalid_argument("TensorNetwork::contract_between: a == b");
  const auto& ta = tensor(a);
  const auto& tb = tensor(b);
  LabelSet kept = keep;
  for (auto&& label : shared_indices(a, b))
    if (index_map_.at(label).size() > 2) kept.insert(label);
  auto r = qunet::contract(ta, tb, kept);
  auto& logger = Logger::instance();
  if (logger.contract)
    write_log(logger, "contract_between ", a, " and ", b, ": ", r, "\n");
  pop(b);
  update(a, std::move(r));
  return a;
}

LabelList TensorNetwork::boundary_indices(const TensorIdSet& ids) const {
  LabelList result;
  LabelSet seen;
  for (auto id : ids) {
    for (auto&& idx : tensor(id).indices()) {
      if (!seen.insert(idx.label()).second) continue;
      const auto& holders = index_map_.at(idx.label());
      const bool outside =
          std::any_of(holders.begin(), holders.end(),
                      [&ids](TensorId h) { return ids.count(h) == 0; });
      if (outside || holders.size() == 1) result.push_back(idx.label());
    }
  }
  return result;
}

TensorId TensorNetwork::contract_ids(
    const TensorIdSet& ids, const std::optional<ContractOptions>& opts) {
  if (ids.empty())
    throw std::invalid_argument("TensorNetwork::contract_ids: no tensors");
  if (ids.size() == 1) return *ids.begin();
  container::vector<Tensor> tensors;
  for (auto id : ids) tensors.push_back(tensor(id));
  auto r = contract_tensors(std::move(tensors), boundary_indices(ids),
                            or_default(opts));
  return replace(ids, std::move(r));
}

TensorId TensorNetwork::contract_tags(
    const TagList& tags, SelectMode mode,
    const std::optional<ContractOptions>& opts) {
  const auto ids = select_ids(tags, mode);
  if (ids.empty())
    throw std::out_of_range("TensorNetwork::contract_tags: nothing selected");
  return contract_ids(ids, opts);
}

TensorId TensorNetwork::contract_index(
    std::string_view label, const std::optional<ContractOptions>& opts) {
  const auto ids = tensors_with_index(label);
  if (ids.empty())
    throw std::out_of_range("TensorNetwork: no index " + std::string(label));
  return contract_ids(ids, opts);
}

Tensor TensorNetwork::contract(
    const std::optional<LabelList>& output_inds,
    const std::optional<ContractOptions>& opts) const {
  container::vector<Tensor> tensors;
  tensors.reserve(tensors_.size());
  for (auto&& [id, t] : tensors_) tensors.push_back(t);
  return contract_tensors(std::move(tensors), output_inds, or_default(opts));
}

double TensorNetwork::contract_scalar(
    const std::optional<ContractOptions>& opts) const {
  return contract(LabelList{}, opts).value();
}

opt::PathInfo TensorNetwork::contraction_info(
    const std::optional<LabelList>& output_inds,
    const std::optional<ContractOptions>& opts) const {
  container::vector<Tensor> tensors;
  for (auto&& [id, t] : tensors_) tensors.push_back(t);
  const auto problem = opt::make_problem(tensors, output_inds);
  return opt::evaluate(problem, opt::find_path(problem, or_default(opts)));
}

double TensorNetwork::contraction_width(
    const std::optional<LabelList>& output_inds,
    const std::optional<ContractOptions>& opts) const {
  return contraction_info(output_inds, opts).width;
}

double TensorNetwork::contraction_cost(
    const std::optional<LabelList>& output_inds,
    const std::optional<ContractOptions>& opts) const {
  return contraction_info(output_inds, opts).flops;
}

Array TensorNetwork::to_dense(
    const container::vector<LabelList>& groups,
    const std::optional<ContractOptions>& opts) const {
  LabelList output;
  Array::shape_type shape;
  for (auto&& group : groups) {
    std::size_t extent = 1;
    for (auto&& label : group) {
      output.push_back(label);
      extent *= index_extent(label);
    }
    shape.push_back(extent);
  }
  return contract(output, opts).data().reshape(shape);
}

namespace {

/// @return true if @p name is moved to another name by @p map
bool renamed_away(const RenameMap& map, const std::string& name) {
  const auto it = map.find(name);
  return it != map.end() && it->second != name;
}

}  // namespace

TensorNetwork& TensorNetwork::retag(const RenameMap& map, Merge merge) {
  if (merge == Merge::No) {
    TagSet targets;
    for (auto&& [from, to] : map) {
      if (tag_map_.count(from) == 0 || from == to) continue;
      if (!targets.insert(to).second)
        throw NameCollisionError("TensorNetwork::retag: two tags renamed to " +
                                 to);
      if (tag_map_.count(to) != 0 && !renamed_away(map, to))
        throw NameCollisionError("TensorNetwork::retag: tag " + to +
                                 " already exists");
    }
  }
  for (auto& [id, t] : tensors_) t.retag(map);
  rebuild_registries();
  return *this;
}

TensorNetwork& TensorNetwork::reindex(const RenameMap& map, Merge merge) {
  if (merge == Merge::No) {
    LabelSet targets;
    for (auto&& [from, to] : map) {
      if (index_map_.count(from) == 0 || from == to) continue;
      if (!targets.insert(to).second)
        throw NameCollisionError(
            "TensorNetwork::reindex: two indices renamed to " + to);
      if (index_map_.count(to) != 0 && !renamed_away(map, to))
        throw NameCollisionError("TensorNetwork::reindex: index " + to +
                                 " already exists");
    }
  }
  auto staged = tensors_;
  container::map<std::string, std::size_t> extents;
  for (auto& [id, t] : staged) {
    t.reindex(map);
    for (auto&& idx : t.indices()) {
      auto [it, inserted] = extents.emplace(idx.label(), idx.extent());
      if (!inserted && it->second != idx.extent())
        throw ShapeError("TensorNetwork::reindex: merged index " +
                         idx.label() + " has extents " +
                         std::to_string(it->second) + " and " +
                         std::to_string(idx.extent()));
    }
  }
  tensors_ = std::move(staged);
  rebuild_registries();
  return *this;
}

TensorNetwork& TensorNetwork::squeeze() {
  for (auto& [id, t] : tensors_) t.squeeze();
  rebuild_registries();
  return *this;
}

std::optional<std::string> TensorNetwork::fuse_between(TensorId a,
                                                       TensorId b) {
  LabelList bonds;
  for (auto&& label : shared_indices(a, b))
    if (index_map_.at(label).size() == 2) bonds.push_back(label);
  if (bonds.empty()) return std::nullopt;
  if (bonds.size() == 1) return bonds.front();
  Tensor ta = tensor(a);
  Tensor tb = tensor(b);
  const auto fused = bonds.front();
  ta.fuse(bonds, fused);
  tb.fuse(bonds, fused);
  update_pair(a, std::move(ta), b, std::move(tb));
  return fused;
}

TensorNetwork& TensorNetwork::fuse_multibonds() {
  container::vector<TensorId> ids;
  for (auto&& [id, t] : tensors_) ids.push_back(id);
  for (auto a : ids)
    for (auto b : neighbors(a))
      if (b > a) fuse_between(a, b);
  return *this;
}

TensorNetwork& TensorNetwork::flatten(
    const TagList& site_tags, const std::optional<ContractOptions>& opts) {
  for (auto&& tag : site_tags) {
    const auto ids = select_ids({tag});
    if (ids.size() > 1) contract_ids(ids, opts);
  }
  return fuse_multibonds();
}

namespace {

/// @return a copy of @p t with the tags of @p tags_from
Tensor with_tags(const Tensor& t, const Tensor& tags_from) {
  return Tensor(t.data(), t.indices(), tags_from.tags());
}

}  // namespace

void TensorNetwork::canonize_between(TensorId a, TensorId b) {
  const auto& ta = tensor(a);
  const auto& tb = tensor(b);
  LabelList bonds;
  for (auto&& label : shared_indices(a, b))
    if (index_map_.at(label).size() == 2) bonds.push_back(label);
  if (bonds.empty())
    throw std::invalid_argument("TensorNetwork::canonize_between: tensors " +
                                std::to_string(a) + " and " +
                                std::to_string(b) + " share no bond");
  LabelList left;
  for (auto&& label : ta.labels())
    if (ranges::find(bonds, label) == bonds.end()) left.push_back(label);

  const auto bond = Index::make_unique_label();
  auto qr = split(ta, left, TruncationOptions::exact().with(SplitMethod::QR),
                  bond);
  Tensor q = std::move(qr.left);
  Tensor nb = with_tags(qunet::contract(tb, qr.right), tb);
  if (bonds.size() == 1) {
    RenameMap restore;
    restore.emplace(bond, bonds.front());
    q.reindex(restore);
    nb.reindex(restore);
    q.transpose(ta.labels());
    nb.transpose(tb.labels());
  }
  update_pair(a, std::move(q), b, std::move(nb));
}

double TensorNetwork::compress_between(TensorId a, TensorId b,
                                       const TruncationOptions& opts) {
  if (opts.absorb == Absorb::None)
    throw std::invalid_argument(
        "TensorNetwork::compress_between: singular values must be absorbed");
  const auto& ta = tensor(a);
  const auto& tb = tensor(b);
  const auto shared = shared_indices(a, b);
  if (shared.empty())
    throw std::invalid_argument("TensorNetwork::compress_between: tensors " +
                                std::to_string(a) + " and " +
                                std::to_string(b) + " share no index");
  for (auto&& label : shared)
    if (index_map_.at(label).size() > 2)
      throw std::invalid_argument("TensorNetwork::compress_between: " + label +
                                  " is a hyperindex");
  LabelList left;
  for (auto&& label : ta.labels())
    if (ranges::find(shared, label) == shared.end()) left.push_back(label);

  const auto bond = Index::make_unique_label();
  auto parts = split(qunet::contract(ta, tb), left, opts, bond);
  Tensor na = with_tags(parts.left, ta);
  Tensor nb = with_tags(parts.right, tb);
  if (shared.size() == 1) {
    RenameMap restore;
    restore.emplace(bond, shared.front());
    na.reindex(restore);
    nb.reindex(restore);
    na.transpose(ta.labels());
    nb.transpose(tb.labels());
  }
  auto& logger = Logger::instance();
  if (logger.compress)
    write_log(logger, "compress_between ", a, " and ", b, ": bond ",
              parts.bond.extent(), ", discarded ", parts.discarded, "\n");
  update_pair(a, std::move(na), b, std::move(nb));
  return parts.discarded;
}

TensorNetwork& TensorNetwork::equalize_norms() {
  if (tensors_.empty()) return *this;
  double log_sum = 0;
  for (auto&& [id, t] : tensors_) {
    const auto n = t.norm();
    if (n == 0) return *this;
    log_sum += std::log(n);
  }
  const auto log_mean = log_sum / static_cast<double>(tensors_.size());
  for (auto& [id, t] : tensors_) t *= std::exp(log_mean - std::log(t.norm()));
  return *this;
}

TensorNetwork& TensorNetwork::full_simplify(
    const std::optional<SimplifyOptions>& opts) {
  return qunet::full_simplify(
      *this, opts ? *opts : get_default_context().simplification());
}

std::ostream& operator<<(std::ostream& os, const TensorNetwork& tn) {
  os << "TensorNetwork(tensors=" << tn.num_tensors()
     << ", indices=" << tn.num_indices() << ")";
  for (auto&& [id, t] : tn.tensor_map()) os << "\n  " << id << ": " << t;
  return os;
}

}  // namespace qunet
