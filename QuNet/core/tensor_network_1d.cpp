#include <QuNet/core/context.hpp>
#include <QuNet/core/logger.hpp>
#include <QuNet/core/tensor_network_1d.hpp>

#include <range/v3/algorithm/find.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace qunet {

namespace {

Tensor with_tags(const Tensor& t, const TagSet& tags) {
  return Tensor(t.data(), t.indices(), tags);
}

LabelList without(const LabelList& labels, const LabelList& removed) {
  LabelList result;
  for (auto&& label : labels)
    if (ranges::find(removed, label) == removed.end()) result.push_back(label);
  return result;
}

std::string bond_name(std::size_t i, std::size_t j) {
  return TensorNetwork1D::site_tag(i) + "-" + TensorNetwork1D::site_tag(j);
}

}  // namespace

TensorNetwork1D::TensorNetwork1D(TensorNetwork network, std::size_t L,
                                 bool cyclic)
    : network_(std::move(network)), L_(L), cyclic_(cyclic), right_iso_(L) {
  if (L_ == 0)
    throw std::invalid_argument("TensorNetwork1D: a chain needs a site");
  for (std::size_t i = 0; i != L_; ++i) {
    const auto ids = network_.select_ids({site_tag(i)});
    if (ids.size() != 1)
      throw std::invalid_argument("TensorNetwork1D: site " + site_tag(i) +
                                  " must be exactly one tensor, found " +
                                  std::to_string(ids.size()));
    if (!network_.tensor(*ids.begin()).has_index(site_ind(i)))
      throw std::invalid_argument("TensorNetwork1D: site " + site_tag(i) +
                                  " does not hold " + site_ind(i));
  }
}

std::string TensorNetwork1D::site_tag(std::size_t i) {
  return "I" + std::to_string(i);
}

std::string TensorNetwork1D::site_ind(std::size_t i) {
  return "k" + std::to_string(i);
}

TensorNetwork1D TensorNetwork1D::from_arrays(
    const container::vector<Array>& arrays, bool cyclic) {
  const auto L = arrays.size();
  if (L == 0)
    throw std::invalid_argument("TensorNetwork1D::from_arrays: no arrays");
  if (cyclic && L < 3)
    throw std::invalid_argument(
        "TensorNetwork1D::from_arrays: a cyclic chain needs three sites");

  const auto nbonds = cyclic ? L : L - 1;
  LabelList bonds;
  for (std::size_t b = 0; b != nbonds; ++b)
    bonds.push_back(Index::make_unique_label());

  TensorNetwork tn;
  for (std::size_t i = 0; i != L; ++i) {
    std::vector<std::string> labels;
    if (cyclic || i > 0) labels.push_back(bonds[(i + nbonds - 1) % nbonds]);
    if (cyclic || i + 1 < L) labels.push_back(bonds[i]);
    labels.push_back(site_ind(i));
    if (arrays[i].rank() != labels.size())
      throw std::invalid_argument(
          "TensorNetwork1D::from_arrays: site " + std::to_string(i) +
          " needs an array of rank " + std::to_string(labels.size()));
    tn.add(Tensor::from_labels(arrays[i], labels, TagSet{site_tag(i)}));
  }
  return TensorNetwork1D(std::move(tn), L, cyclic);
}

TensorNetwork1D TensorNetwork1D::product_state(
    const container::vector<container::vector<double>>& vectors) {
  const auto L = vectors.size();
  container::vector<Array> arrays;
  for (std::size_t i = 0; i != L; ++i) {
    Array::shape_type shape;
    if (i > 0) shape.push_back(1);
    if (i + 1 < L) shape.push_back(1);
    shape.push_back(vectors[i].size());
    arrays.emplace_back(std::move(shape), vectors[i]);
  }
  return from_arrays(arrays);
}

TensorNetwork1D TensorNetwork1D::computational_state(std::string_view bits) {
  container::vector<container::vector<double>> vectors;
  for (char c : bits) {
    if (c != '0' && c != '1')
      throw std::invalid_argument(
          std::string("TensorNetwork1D::computational_state: bad bit '") + c +
          "'");
    vectors.push_back(c == '0' ? container::vector<double>{1., 0.}
                               : container::vector<double>{0., 1.});
  }
  return product_state(vectors);
}

TensorNetwork1D TensorNetwork1D::random(std::size_t L, std::size_t bond_dim,
                                        std::size_t phys_dim,
                                        std::uint64_t seed, bool cyclic) {
  container::vector<Array> arrays;
  for (std::size_t i = 0; i != L; ++i) {
    Array::shape_type shape;
    if (cyclic || i > 0) shape.push_back(bond_dim);
    if (cyclic || i + 1 < L) shape.push_back(bond_dim);
    shape.push_back(phys_dim);
    arrays.push_back(Array::random(std::move(shape), seed + i));
  }
  return from_arrays(arrays, cyclic);
}

void TensorNetwork1D::check_site(std::size_t i) const {
  if (i >= L_)
    throw std::out_of_range("TensorNetwork1D: no site " + std::to_string(i) +
                            " in a chain of " + std::to_string(L_));
}

void TensorNetwork1D::check_open(std::string_view what) const {
  if (cyclic_)
    throw std::logic_error("TensorNetwork1D::" + std::string(what) +
                           ": not defined for a cyclic chain");
}

bool TensorNetwork1D::adjacent(std::size_t i, std::size_t j) const {
  if (i > j) std::swap(i, j);
  return j == i + 1 || (cyclic_ && i == 0 && j == L_ - 1);
}

void TensorNetwork1D::touched(std::size_t lo, std::size_t hi) {
  left_iso_ = std::min(left_iso_, lo);
  right_iso_ = std::max(right_iso_, hi + 1);
}

TensorId TensorNetwork1D::site_id(std::size_t i) const {
  check_site(i);
  return network_.id_of(site_tag(i));
}

const Tensor& TensorNetwork1D::operator[](std::size_t i) const {
  return network_.tensor(site_id(i));
}

std::string TensorNetwork1D::bond(std::size_t i, std::size_t j) const {
  const auto shared = network_.shared_indices(site_id(i), site_id(j));
  if (shared.size() != 1)
    throw std::invalid_argument("TensorNetwork1D::bond: sites " +
                                std::to_string(i) + " and " +
                                std::to_string(j) + " share " +
                                std::to_string(shared.size()) + " indices");
  return shared.front();
}

std::size_t TensorNetwork1D::bond_size(std::size_t i, std::size_t j) const {
  return network_.index_extent(bond(i, j));
}

container::vector<std::size_t> TensorNetwork1D::bond_sizes() const {
  container::vector<std::size_t> result;
  for (std::size_t i = 0; i + 1 < L_; ++i)
    result.push_back(bond_size(i, i + 1));
  if (cyclic_) result.push_back(bond_size(L_ - 1, 0));
  return result;
}

std::size_t TensorNetwork1D::phys_dim(std::size_t i) const {
  check_site(i);
  return network_.index_extent(site_ind(i));
}

std::optional<std::size_t> TensorNetwork1D::orthogonality_center() const {
  if (cyclic_ || right_iso_ != left_iso_ + 1) return std::nullopt;
  return left_iso_;
}

TensorNetwork1D& TensorNetwork1D::left_canonize(
    std::optional<std::size_t> stop) {
  check_open("left_canonize");
  const auto s = stop.value_or(L_ - 1);
  check_site(s);
  if (left_iso_ < s) {
    for (auto i = left_iso_; i != s; ++i)
      network_.canonize_between(site_id(i), site_id(i + 1));
    left_iso_ = s;
    right_iso_ = std::max(right_iso_, s + 1);
  }
  return *this;
}

TensorNetwork1D& TensorNetwork1D::right_canonize(std::size_t stop) {
  check_open("right_canonize");
  check_site(stop);
  if (right_iso_ > stop + 1) {
    for (auto i = right_iso_ - 1; i != stop; --i)
      network_.canonize_between(site_id(i), site_id(i - 1));
    right_iso_ = stop + 1;
    left_iso_ = std::min(left_iso_, stop);
  }
  return *this;
}

TensorNetwork1D& TensorNetwork1D::canonize(std::size_t where) {
  left_canonize(where);
  return right_canonize(where);
}

TruncationReport TensorNetwork1D::compress(
    const std::optional<TruncationOptions>& opts,
    std::optional<std::size_t> form) {
  check_open("compress");
  const auto truncation =
      (opts ? *opts : get_default_context().truncation()).with(Absorb::Right);
  TruncationReport report;
  if (L_ > 1) {
    left_canonize();
    for (auto i = L_ - 1; i != 0; --i) {
      const auto discarded =
          network_.compress_between(site_id(i), site_id(i - 1), truncation);
      report.add(bond_name(i - 1, i), discarded);
    }
    left_iso_ = 0;
    right_iso_ = 1;
  }
  auto& logger = Logger::instance();
  if (logger.compress)
    write_log(logger, "compress chain of ", L_, ": ", report, "\n");
  if (form) canonize(*form);
  return report;
}

TensorNetwork1D& TensorNetwork1D::gate(const Array& G, std::size_t i) {
  const auto id = site_id(i);
  const auto k = site_ind(i);
  const auto p = phys_dim(i);
  const auto out = Index::make_unique_label();
  const Tensor g(G, IndexList{Index(out, p), Index(k, p)});
  RenameMap restore;
  restore.emplace(out, k);
  network_.modify(id, [&](Tensor& t) {
    const auto order = t.labels();
    t = contract(t, g);
    t.reindex(restore);
    t.transpose(order);
  });
  touched(i, i);
  return *this;
}

std::string TensorNetwork1D::phys_label(std::size_t i) const {
  const auto& t = (*this)[i];
  LabelList outer;
  for (auto&& label : t.labels())
    if (network_.index_map().at(label).size() == 1) outer.push_back(label);
  if (outer.size() != 1)
    throw std::logic_error("TensorNetwork1D: site " + std::to_string(i) +
                           " has " + std::to_string(outer.size()) +
                           " outer indices");
  return outer.front();
}

double TensorNetwork1D::gate_neighbors(const Array& G, std::size_t i,
                                       std::size_t j, const std::string& li,
                                       const std::string& lj,
                                       GateContract mode,
                                       const TruncationOptions& opts) {
  const auto a = site_id(i);
  const auto b = site_id(j);
  const Tensor ta = network_.tensor(a);
  const Tensor tb = network_.tensor(b);
  const auto bonds = network_.shared_indices(a, b);
  if (bonds.empty())
    throw std::invalid_argument("TensorNetwork1D::gate_split: sites " +
                                std::to_string(i) + " and " +
                                std::to_string(j) + " share no bond");

  const auto oi = Index::make_unique_label();
  const auto oj = Index::make_unique_label();
  const auto pi = ta.extent(li);
  const auto pj = tb.extent(lj);
  const Tensor g(G, IndexList{Index(oi, pi), Index(oj, pj), Index(li, pi),
                              Index(lj, pj)});
  RenameMap restore;
  restore.emplace(oi, li);
  restore.emplace(oj, lj);

  std::optional<SplitResult> factors;
  if (mode != GateContract::Contract)
    factors = split(g, LabelList{oi, li}, TruncationOptions{});

  if (mode == GateContract::AutoSplitGate) {
    std::size_t bond = 1;
    for (auto&& label : bonds) bond *= ta.extent(label);
    auto contracted = std::min(ta.size() / bond, tb.size() / bond);
    if (opts.max_bond) contracted = std::min(contracted, *opts.max_bond);
    mode = factors->bond.extent() * bond <= contracted
               ? GateContract::SplitGate
               : GateContract::Contract;
  }

  double discarded = 0;
  if (mode == GateContract::SplitGate) {
    Tensor na = contract(ta, factors->left);
    Tensor nb = contract(tb, factors->right);
    na.reindex(restore);
    nb.reindex(restore);
    LabelList fused = bonds;
    fused.push_back(factors->bond.label());
    na.fuse(fused, bonds.front());
    nb.fuse(fused, bonds.front());
    if (bonds.size() == 1) {
      na.transpose(ta.labels());
      nb.transpose(tb.labels());
    }
    network_.update_pair(a, std::move(na), b, std::move(nb));
  } else {
    Tensor theta = contract(contract(ta, tb), g);
    theta.reindex(restore);
    const auto bond_label =
        bonds.size() == 1 ? bonds.front() : Index::make_unique_label();
    auto parts = split(theta, without(ta.labels(), bonds), opts, bond_label);
    Tensor na = with_tags(parts.left, ta.tags());
    Tensor nb = with_tags(parts.right, tb.tags());
    if (bonds.size() == 1) {
      na.transpose(ta.labels());
      nb.transpose(tb.labels());
    }
    network_.update_pair(a, std::move(na), b, std::move(nb));
    discarded = parts.discarded;
  }
  touched(std::min(i, j), std::max(i, j));
  return discarded;
}

double TensorNetwork1D::swap_sites(std::size_t i, std::size_t j,
                                   const TruncationOptions& opts) {
  const auto a = site_id(i);
  const auto b = site_id(j);
  const auto li = phys_label(i);
  const auto lj = phys_label(j);
  const Tensor ta = network_.tensor(a);
  const Tensor tb = network_.tensor(b);
  const auto bonds = network_.shared_indices(a, b);

  auto order_a = ta.labels();
  auto order_b = tb.labels();
  std::replace(order_a.begin(), order_a.end(), li, lj);
  std::replace(order_b.begin(), order_b.end(), lj, li);

  const auto bond_label =
      bonds.size() == 1 ? bonds.front() : Index::make_unique_label();
  auto parts =
      split(contract(ta, tb), without(order_a, bonds), opts, bond_label);
  Tensor na = with_tags(parts.left, ta.tags());
  Tensor nb = with_tags(parts.right, tb.tags());
  if (bonds.size() == 1) {
    na.transpose(order_a);
    nb.transpose(order_b);
  }
  network_.update_pair(a, std::move(na), b, std::move(nb));
  touched(std::min(i, j), std::max(i, j));
  return parts.discarded;
}

TruncationReport TensorNetwork1D::gate_split(const Array& G, std::size_t i,
                                             std::size_t j,
                                             const GateOptions& opts) {
  check_site(i);
  check_site(j);
  if (i == j)
    throw std::invalid_argument(
        "TensorNetwork1D::gate_split: the sites must differ");
  if (opts.truncation.absorb == Absorb::None)
    throw std::invalid_argument(
        "TensorNetwork1D::gate_split: singular values must be absorbed");

  Array g4 = G;
  if (G.rank() == 2) {
    const auto pi = phys_dim(i);
    const auto pj = phys_dim(j);
    g4 = G.reshape({pi, pj, pi, pj});
  }
  if (i > j) {
    const std::size_t perm[] = {1, 0, 3, 2};
    g4 = g4.permute(perm);
    std::swap(i, j);
  }

  const auto mode = opts.contract == GateContract::SwapSplitGate
                        ? GateContract::AutoSplitGate
                        : opts.contract;
  TruncationReport report;
  if (adjacent(i, j)) {
    report.add(bond_name(i, j),
               gate_neighbors(g4, i, j, site_ind(i), site_ind(j), mode,
                              opts.truncation));
    return report;
  }

  // carry the index of site j to site i + 1 and back
  for (auto s = j; s > i + 1; --s)
    report.add(bond_name(s - 1, s), swap_sites(s - 1, s, opts.truncation));
  report.add(bond_name(i, i + 1),
             gate_neighbors(g4, i, i + 1, site_ind(i), site_ind(j), mode,
                            opts.truncation));
  for (auto s = i + 1; s < j; ++s)
    report.add(bond_name(s, s + 1), swap_sites(s, s + 1, opts.truncation));
  return report;
}

Array TensorNetwork1D::to_dense(
    const std::optional<ContractOptions>& opts) const {
  container::vector<LabelList> groups;
  for (std::size_t i = 0; i != L_; ++i)
    groups.push_back(LabelList{site_ind(i)});
  return network_.to_dense(groups, opts);
}

double TensorNetwork1D::norm() const { return std::sqrt(overlap(*this)); }

double TensorNetwork1D::overlap(const TensorNetwork1D& other) const {
  if (other.L_ != L_)
    throw std::invalid_argument("TensorNetwork1D::overlap: lengths " +
                                std::to_string(L_) + " and " +
                                std::to_string(other.L_) + " differ");
  return (network_.conj() & other.network_).contract_scalar();
}

std::ostream& operator<<(std::ostream& os, const TensorNetwork1D& tn) {
  os << "TensorNetwork1D(L=" << tn.L() << ", cyclic=" << tn.cyclic()
     << ", max_bond=" << tn.max_bond() << ")";
  return os;
}

}  // namespace qunet
