#include <QuNet/core/logger.hpp>
#include <QuNet/core/tensor_network_2d.hpp>

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace qunet {

namespace {

using Boundary = container::vector<TensorId>;

TensorNetwork with_layer_tag(TensorNetwork tn, const std::string& tag) {
  container::vector<TensorId> ids;
  for (auto&& [id, t] : tn.tensor_map()) ids.push_back(id);
  for (auto id : ids) tn.modify(id, [&tag](Tensor& t) { t.add_tag(tag); });
  return tn;
}

/// absorbs the tensors of @p sites (those carrying @p layer , if set) into
/// @p boundary ; an empty boundary is started from them
void absorb_layer(TensorNetwork& tn, Boundary& boundary,
                  const container::vector<std::string>& sites,
                  const std::optional<std::string>& layer) {
  const bool start = boundary.empty();
  for (std::size_t p = 0; p != sites.size(); ++p) {
    TagList tags{sites[p]};
    if (layer) tags.push_back(*layer);
    bool found = false;
    for (auto id : tn.select_ids(tags)) {
      if (start && boundary.size() == p)
        boundary.push_back(id);
      else
        tn.contract_between(boundary[p], id);
      found = true;
    }
    if (!found || boundary.size() <= p)
      throw std::invalid_argument("boundary contraction: no tensor at " +
                                  sites[p]);
    // boundary tensors must not be selected as sites again
    tn.modify(boundary[p],
              [](Tensor& t) { t = Tensor(t.data(), t.indices()); });
  }
}

void compress_boundary(TensorNetwork& tn, const Boundary& boundary,
                       const TruncationOptions& opts, const std::string& where,
                       TruncationReport& report) {
  const auto n = boundary.size();
  for (std::size_t p = 0; p + 1 < n; ++p)
    tn.fuse_between(boundary[p], boundary[p + 1]);
  for (std::size_t p = 0; p + 1 < n; ++p)
    tn.canonize_between(boundary[p], boundary[p + 1]);
  const auto truncation = opts.with(Absorb::Right);
  for (auto p = n - 1; p > 0; --p) {
    const auto discarded =
        tn.compress_between(boundary[p], boundary[p - 1], truncation);
    report.add(where + ":" + std::to_string(p - 1) + "-" + std::to_string(p),
               discarded);
  }
}

void absorb_line(TensorNetwork& tn, Boundary& boundary,
                 const container::vector<std::string>& sites,
                 const BoundaryOptions& opts, const std::string& where,
                 TruncationReport& report) {
  if (opts.layer_tags.empty()) {
    absorb_layer(tn, boundary, sites, std::nullopt);
    compress_boundary(tn, boundary, opts.truncation, where, report);
  } else {
    for (auto&& layer : opts.layer_tags) {
      absorb_layer(tn, boundary, sites, layer);
      compress_boundary(tn, boundary, opts.truncation, where + " " + layer,
                        report);
    }
  }
  auto& logger = Logger::instance();
  if (logger.boundary) {
    std::size_t bond = 1;
    for (std::size_t p = 0; p + 1 < boundary.size(); ++p)
      for (auto&& label : tn.shared_indices(boundary[p], boundary[p + 1]))
        bond = std::max(bond, tn.index_extent(label));
    write_log(logger, "boundary ", where, ": max bond ", bond, "\n");
  }
}

TensorIdSet to_set(const Boundary& boundary) {
  return TensorIdSet(boundary.begin(), boundary.end());
}

}  // namespace

TensorNetwork2D::TensorNetwork2D(TensorNetwork network, std::size_t Lx,
                                 std::size_t Ly)
    : network_(std::move(network)), Lx_(Lx), Ly_(Ly) {
  if (Lx_ == 0 || Ly_ == 0)
    throw std::invalid_argument("TensorNetwork2D: the grid is empty");
  for (std::size_t i = 0; i != Lx_; ++i)
    for (std::size_t j = 0; j != Ly_; ++j)
      if (network_.select_ids({site_tag(i, j)}).empty())
        throw std::invalid_argument("TensorNetwork2D: no tensor at site " +
                                    site_tag(i, j));
}

std::string TensorNetwork2D::site_tag(std::size_t i, std::size_t j) {
  return "I" + std::to_string(i) + "," + std::to_string(j);
}

std::string TensorNetwork2D::row_tag(std::size_t i) {
  return "ROW" + std::to_string(i);
}

std::string TensorNetwork2D::col_tag(std::size_t j) {
  return "COL" + std::to_string(j);
}

std::string TensorNetwork2D::site_ind(std::size_t i, std::size_t j) {
  return "k" + std::to_string(i) + "," + std::to_string(j);
}

TensorNetwork2D TensorNetwork2D::from_arrays(
    const container::vector<container::vector<Array>>& arrays,
    const TagList& extra_tags) {
  const auto Lx = arrays.size();
  const auto Ly = Lx == 0 ? 0 : arrays.front().size();
  if (Lx == 0 || Ly == 0)
    throw std::invalid_argument("TensorNetwork2D::from_arrays: no arrays");
  for (auto&& row : arrays)
    if (row.size() != Ly)
      throw std::invalid_argument(
          "TensorNetwork2D::from_arrays: rows differ in length");

  // h[i][j] joins (i, j) and (i, j + 1), v[i][j] joins (i, j) and (i + 1, j)
  container::vector<container::vector<std::string>> h(Lx), v(Lx);
  for (std::size_t i = 0; i != Lx; ++i) {
    for (std::size_t j = 0; j != Ly; ++j) {
      h[i].push_back(Index::make_unique_label());
      v[i].push_back(Index::make_unique_label());
    }
  }

  TensorNetwork tn;
  for (std::size_t i = 0; i != Lx; ++i) {
    for (std::size_t j = 0; j != Ly; ++j) {
      std::vector<std::string> labels;
      if (i > 0) labels.push_back(v[i - 1][j]);
      if (j > 0) labels.push_back(h[i][j - 1]);
      if (i + 1 < Lx) labels.push_back(v[i][j]);
      if (j + 1 < Ly) labels.push_back(h[i][j]);
      labels.push_back(site_ind(i, j));
      if (arrays[i][j].rank() != labels.size())
        throw std::invalid_argument(
            "TensorNetwork2D::from_arrays: site " + site_tag(i, j) +
            " needs an array of rank " + std::to_string(labels.size()));
      TagSet tags{site_tag(i, j), row_tag(i), col_tag(j)};
      tags.insert(extra_tags.begin(), extra_tags.end());
      tn.add(Tensor::from_labels(arrays[i][j], labels, std::move(tags)));
    }
  }
  return TensorNetwork2D(std::move(tn), Lx, Ly);
}

TensorNetwork2D TensorNetwork2D::random(std::size_t Lx, std::size_t Ly,
                                        std::size_t bond_dim,
                                        std::size_t phys_dim,
                                        std::uint64_t seed,
                                        const TagList& extra_tags) {
  container::vector<container::vector<Array>> arrays(Lx);
  for (std::size_t i = 0; i != Lx; ++i) {
    for (std::size_t j = 0; j != Ly; ++j) {
      Array::shape_type shape;
      const std::size_t nbonds =
          (i > 0) + (j > 0) + (i + 1 < Lx) + (j + 1 < Ly);
      shape.assign(nbonds, bond_dim);
      shape.push_back(phys_dim);
      arrays[i].push_back(Array::random(std::move(shape), seed + i * Ly + j));
    }
  }
  return from_arrays(arrays, extra_tags);
}

const Tensor& TensorNetwork2D::operator()(std::size_t i, std::size_t j) const {
  return network_[site_tag(i, j)];
}

std::size_t TensorNetwork2D::bond_size(
    std::pair<std::size_t, std::size_t> a,
    std::pair<std::size_t, std::size_t> b) const {
  return network_.bond_size(site_tag(a.first, a.second),
                            site_tag(b.first, b.second));
}

std::size_t TensorNetwork2D::phys_dim(std::size_t i, std::size_t j) const {
  return network_.index_extent(site_ind(i, j));
}

TensorNetwork TensorNetwork2D::select_row(std::size_t i) const {
  return network_.select({row_tag(i)});
}

TensorNetwork TensorNetwork2D::select_col(std::size_t j) const {
  return network_.select({col_tag(j)});
}

TensorNetwork2D TensorNetwork2D::conj() const {
  return TensorNetwork2D(network_.conj(), Lx_, Ly_);
}

TensorNetwork2D& TensorNetwork2D::retag(const RenameMap& map) {
  network_.retag(map);
  return *this;
}

TensorNetwork2D TensorNetwork2D::combine(const TensorNetwork2D& other) const {
  if (other.Lx_ != Lx_ || other.Ly_ != Ly_)
    throw std::invalid_argument("TensorNetwork2D::combine: grids differ");
  return TensorNetwork2D(network_ & other.network_, Lx_, Ly_);
}

TensorNetwork2D TensorNetwork2D::norm_network(const TensorNetwork2D& other,
                                              const std::string& bra,
                                              const std::string& ket) const {
  const TensorNetwork2D b(with_layer_tag(network_.conj(), bra), Lx_, Ly_);
  const TensorNetwork2D k(with_layer_tag(other.network_, ket), other.Lx_,
                          other.Ly_);
  return b.combine(k);
}

TensorNetwork2D TensorNetwork2D::make_norm(const std::string& bra,
                                           const std::string& ket) const {
  return norm_network(*this, bra, ket);
}

TensorNetwork2D& TensorNetwork2D::flatten(
    const std::optional<ContractOptions>& opts) {
  TagList sites;
  for (std::size_t i = 0; i != Lx_; ++i)
    for (std::size_t j = 0; j != Ly_; ++j) sites.push_back(site_tag(i, j));
  network_.flatten(sites, opts);
  return *this;
}

container::vector<std::string> TensorNetwork2D::line_sites(
    bool rows, std::size_t k) const {
  container::vector<std::string> result;
  if (rows)
    for (std::size_t j = 0; j != Ly_; ++j) result.push_back(site_tag(k, j));
  else
    for (std::size_t i = 0; i != Lx_; ++i) result.push_back(site_tag(i, k));
  return result;
}

double TensorNetwork2D::contract_boundary(const BoundaryOptions& opts) const {
  TruncationReport report;
  return contract_boundary(opts, report);
}

double TensorNetwork2D::contract_boundary(const BoundaryOptions& opts,
                                          TruncationReport& report) const {
  bool rows = false, cols = false, from_start = false, from_end = false;
  for (char c : opts.sequence) {
    switch (c) {
      case 'b':
        rows = from_start = true;
        break;
      case 't':
        rows = from_end = true;
        break;
      case 'l':
        cols = from_start = true;
        break;
      case 'r':
        cols = from_end = true;
        break;
      default:
        throw std::invalid_argument(
            std::string("TensorNetwork2D::contract_boundary: bad side '") + c +
            "'");
    }
  }
  if (rows == cols)
    throw std::invalid_argument(
        "TensorNetwork2D::contract_boundary: sweep either rows or columns, "
        "got '" +
        opts.sequence + "'");

  const auto n = rows ? Lx_ : Ly_;
  // lines [0, stop) are absorbed from the start, [stop, n) from the end
  const std::size_t stop =
      from_start && from_end ? n / 2 : (from_start ? n - 1 : 1);
  const std::string lo = rows ? "below " : "left ";
  const std::string hi = rows ? "above " : "right ";

  TensorNetwork tn = network_;
  Boundary lower, upper;
  if (from_start)
    for (std::size_t k = 0; k < stop; ++k)
      absorb_line(tn, lower, line_sites(rows, k), opts, lo + std::to_string(k),
                  report);
  if (from_end)
    for (auto k = n; k-- > stop;)
      absorb_line(tn, upper, line_sites(rows, k), opts, hi + std::to_string(k),
                  report);
  return tn.contract_scalar(opts.contraction);
}

TensorNetwork2D::Environments TensorNetwork2D::compute_environments(
    bool rows, const BoundaryOptions& opts, TruncationReport& report) const {
  const auto n = rows ? Lx_ : Ly_;
  const std::string lo = rows ? "below" : "left";
  const std::string hi = rows ? "above" : "right";
  Environments envs;

  TensorNetwork tn = network_;
  Boundary boundary;
  envs.emplace(std::make_pair(lo, std::size_t{0}), TensorNetwork{});
  for (std::size_t k = 0; k + 1 < n; ++k) {
    absorb_line(tn, boundary, line_sites(rows, k), opts,
                lo + " " + std::to_string(k), report);
    envs.emplace(std::make_pair(lo, k + 1), tn.subnetwork(to_set(boundary)));
  }

  tn = network_;
  boundary.clear();
  envs.emplace(std::make_pair(hi, n - 1), TensorNetwork{});
  for (auto k = n - 1; k > 0; --k) {
    absorb_line(tn, boundary, line_sites(rows, k), opts,
                hi + " " + std::to_string(k), report);
    envs.emplace(std::make_pair(hi, k - 1), tn.subnetwork(to_set(boundary)));
  }
  return envs;
}

TensorNetwork2D::Environments TensorNetwork2D::compute_row_environments(
    const BoundaryOptions& opts) const {
  TruncationReport report;
  return compute_environments(true, opts, report);
}

TensorNetwork2D::Environments TensorNetwork2D::compute_row_environments(
    const BoundaryOptions& opts, TruncationReport& report) const {
  return compute_environments(true, opts, report);
}

TensorNetwork2D::Environments TensorNetwork2D::compute_col_environments(
    const BoundaryOptions& opts) const {
  TruncationReport report;
  return compute_environments(false, opts, report);
}

TensorNetwork2D::Environments TensorNetwork2D::compute_col_environments(
    const BoundaryOptions& opts, TruncationReport& report) const {
  return compute_environments(false, opts, report);
}

Array TensorNetwork2D::to_dense(
    const std::optional<ContractOptions>& opts) const {
  container::vector<LabelList> groups;
  for (std::size_t i = 0; i != Lx_; ++i)
    for (std::size_t j = 0; j != Ly_; ++j)
      groups.push_back(LabelList{site_ind(i, j)});
  return network_.to_dense(groups, opts);
}

std::ostream& operator<<(std::ostream& os, const TensorNetwork2D& tn) {
  os << "TensorNetwork2D(Lx=" << tn.Lx() << ", Ly=" << tn.Ly()
     << ", max_bond=" << tn.max_bond() << ")";
  return os;
}

}  // namespace qunet
