#include <QuNet/core/linalg.hpp>
#include <QuNet/core/logger.hpp>
#include <QuNet/core/tensor.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace qunet {

namespace {

std::size_t product_of_extents(const IndexList &indices) {
  std::size_t result = 1;
  for (auto &&idx : indices) result *= idx.extent();
  return result;
}

Array::shape_type extents_of(const IndexList &indices) {
  Array::shape_type result;
  for (auto &&idx : indices) result.push_back(idx.extent());
  return result;
}

}  // namespace

Tensor::Tensor(Array data, IndexList indices, TagSet tags)
    : data_(std::move(data)),
      indices_(std::move(indices)),
      tags_(std::move(tags)) {
  check_shape();
}

void Tensor::check_shape() const {
  if (data_.rank() != indices_.size())
    throw ShapeError("Tensor: array of rank " + std::to_string(data_.rank()) +
                     " given " + std::to_string(indices_.size()) + " indices");
  for (std::size_t k = 0; k != indices_.size(); ++k) {
    if (data_.extent(k) != indices_[k].extent())
      throw ShapeError("Tensor: index " + indices_[k].label() + " has extent " +
                       std::to_string(indices_[k].extent()) +
                       " but array axis " + std::to_string(k) + " has extent " +
                       std::to_string(data_.extent(k)));
    for (std::size_t l = 0; l != k; ++l)
      if (indices_[l].label() == indices_[k].label())
        throw ShapeError("Tensor: index " + indices_[k].label() +
                         " appears more than once");
  }
}

Tensor Tensor::from_labels(Array data, const std::vector<std::string> &labels,
                           TagSet tags) {
  if (labels.size() != data.rank())
    throw ShapeError("Tensor::from_labels: array of rank " +
                     std::to_string(data.rank()) + " given " +
                     std::to_string(labels.size()) + " labels");
  IndexList indices;
  for (std::size_t k = 0; k != labels.size(); ++k)
    indices.emplace_back(labels[k], data.extent(k));
  return Tensor(std::move(data), std::move(indices), std::move(tags));
}

Tensor Tensor::scalar(double value, TagSet tags) {
  return Tensor(Array::scalar(value), {}, std::move(tags));
}

LabelList Tensor::labels() const { return qunet::labels(indices_); }

bool Tensor::has_index(std::string_view label) const {
  return ranges::any_of(indices_,
                        [label](const Index &i) { return i.label() == label; });
}

bool Tensor::has_tag(std::string_view tag) const {
  return tags_.count(std::string(tag)) != 0;
}

std::size_t Tensor::axis_of(std::string_view label) const {
  auto it = ranges::find_if(
      indices_, [label](const Index &i) { return i.label() == label; });
  if (it == indices_.end())
    throw std::out_of_range("Tensor: no index " + std::string(label));
  return static_cast<std::size_t>(it - indices_.begin());
}

std::size_t Tensor::extent(std::string_view label) const {
  return indices_[axis_of(label)].extent();
}

const Index &Tensor::index(std::string_view label) const {
  return indices_[axis_of(label)];
}

double Tensor::value() const {
  if (rank() != 0)
    throw std::logic_error("Tensor::value: tensor has rank " +
                           std::to_string(rank()));
  return data_[0];
}

Tensor &Tensor::reindex(const RenameMap &map) {
  IndexList new_indices;
  for (auto &&idx : indices_) {
    auto it = map.find(idx.label());
    new_indices.push_back(it == map.end() ? idx : idx.relabeled(it->second));
  }
  for (std::size_t k = 0; k != new_indices.size(); ++k)
    for (std::size_t l = 0; l != k; ++l)
      if (new_indices[l].label() == new_indices[k].label())
        throw NameCollisionError("Tensor::reindex: renaming would merge into " +
                                 new_indices[k].label());
  indices_ = std::move(new_indices);
  return *this;
}

Tensor &Tensor::retag(const RenameMap &map) {
  TagSet new_tags;
  for (auto &&tag : tags_) {
    auto it = map.find(tag);
    new_tags.insert(it == map.end() ? tag : it->second);
  }
  tags_ = std::move(new_tags);
  return *this;
}

Tensor &Tensor::add_tag(std::string tag) {
  tags_.insert(std::move(tag));
  return *this;
}

Tensor &Tensor::remove_tag(std::string_view tag) {
  tags_.erase(std::string(tag));
  return *this;
}

Tensor &Tensor::transpose(const LabelList &order) {
  if (order.size() != rank())
    throw std::invalid_argument("Tensor::transpose: expected " +
                                std::to_string(rank()) + " labels");
  container::svector<std::size_t> perm;
  IndexList new_indices;
  for (auto &&label : order) {
    const auto axis = axis_of(label);
    if (ranges::find(perm, axis) != perm.end())
      throw std::invalid_argument("Tensor::transpose: label " + label +
                                  " repeated");
    perm.push_back(axis);
    new_indices.push_back(indices_[axis]);
  }
  data_ = data_.permute({perm.data(), perm.size()});
  indices_ = std::move(new_indices);
  return *this;
}

FuseRecord Tensor::fuse(const LabelList &labels, std::string new_label) {
  if (labels.empty())
    throw std::invalid_argument("Tensor::fuse: nothing to fuse");
  FuseRecord record{new_label, {}};
  for (auto &&label : labels) record.fused.push_back(index(label));
  const LabelSet fused_set(labels.begin(), labels.end());
  if (fused_set.size() != labels.size())
    throw std::invalid_argument("Tensor::fuse: label repeated");
  if (fused_set.count(new_label) == 0 && has_index(new_label))
    throw NameCollisionError("Tensor::fuse: index " + new_label +
                             " already exists");

  LabelList order;
  IndexList new_indices;
  bool placed = false;
  for (auto &&idx : indices_) {
    if (fused_set.count(idx.label()) != 0) {
      if (!placed) {
        order.insert(order.end(), labels.begin(), labels.end());
        new_indices.emplace_back(new_label, product_of_extents(record.fused));
        placed = true;
      }
    } else {
      order.push_back(idx.label());
      new_indices.push_back(idx);
    }
  }
  transpose(order);
  data_ = data_.reshape(extents_of(new_indices));
  indices_ = std::move(new_indices);
  return record;
}

Tensor &Tensor::unfuse(const FuseRecord &record) {
  const auto axis = axis_of(record.label);
  if (indices_[axis].extent() != product_of_extents(record.fused))
    throw ShapeError("Tensor::unfuse: extent of " + record.label +
                     " does not match the fused indices");
  IndexList new_indices;
  for (std::size_t k = 0; k != rank(); ++k) {
    if (k == axis)
      new_indices.insert(new_indices.end(), record.fused.begin(),
                         record.fused.end());
    else
      new_indices.push_back(indices_[k]);
  }
  Tensor result(data_.reshape(extents_of(new_indices)), std::move(new_indices),
                tags_);
  *this = std::move(result);
  return *this;
}

Tensor &Tensor::squeeze() {
  IndexList new_indices;
  for (auto &&idx : indices_)
    if (idx.extent() != 1) new_indices.push_back(idx);
  data_ = data_.reshape(extents_of(new_indices));
  indices_ = std::move(new_indices);
  return *this;
}

Tensor &Tensor::expand(std::string label) {
  if (has_index(label))
    throw NameCollisionError("Tensor::expand: index " + label +
                             " already exists");
  indices_.insert(indices_.begin(), Index(std::move(label), 1));
  data_ = data_.reshape(extents_of(indices_));
  return *this;
}

Tensor Tensor::conj() const {
  Tensor result = *this;
  result.data_ = data_.conj();
  return result;
}

Tensor &Tensor::operator*=(double factor) {
  data_.scale(factor);
  return *this;
}

Tensor Tensor::isel(std::string_view label, std::size_t value) const {
  const auto axis = axis_of(label);
  IndexList new_indices = indices_;
  new_indices.erase(new_indices.begin() + axis);
  return Tensor(data_.slice(axis, value), std::move(new_indices), tags_);
}

Tensor Tensor::sum_over(std::string_view label) const {
  const auto axis = axis_of(label);
  IndexList new_indices = indices_;
  new_indices.erase(new_indices.begin() + axis);
  return Tensor(data_.sum(axis), std::move(new_indices), tags_);
}

Tensor Tensor::trace(std::string_view label_a, std::string_view label_b) const {
  const auto a = axis_of(label_a);
  const auto b = axis_of(label_b);
  IndexList new_indices;
  for (std::size_t k = 0; k != rank(); ++k)
    if (k != a && k != b) new_indices.push_back(indices_[k]);
  return Tensor(data_.trace(a, b), std::move(new_indices), tags_);
}

Tensor Tensor::diagonal(std::string_view label_a,
                        std::string_view label_b) const {
  const auto a = axis_of(label_a);
  const auto b = axis_of(label_b);
  IndexList new_indices = indices_;
  new_indices.erase(new_indices.begin() + b);
  return Tensor(data_.diagonal(a, b), std::move(new_indices), tags_);
}

Array Tensor::to_matrix(const LabelList &left) const {
  container::svector<std::size_t> perm;
  std::size_t rows = 1;
  for (auto &&label : left) {
    perm.push_back(axis_of(label));
    rows *= indices_[perm.back()].extent();
  }
  std::size_t cols = 1;
  for (std::size_t k = 0; k != rank(); ++k) {
    if (ranges::find(perm, k) == perm.end()) {
      perm.push_back(k);
      cols *= indices_[k].extent();
    }
  }
  return data_.permute({perm.data(), perm.size()}).reshape({rows, cols});
}

bool Tensor::allclose(const Tensor &other, double rtol, double atol) const {
  if (rank() != other.rank()) return false;
  for (auto &&idx : indices_) {
    if (!other.has_index(idx.label()) ||
        other.extent(idx.label()) != idx.extent())
      return false;
  }
  Tensor aligned = other;
  aligned.transpose(labels());
  return data_.allclose(aligned.data_, rtol, atol);
}

Tensor contract(const Tensor &a, const Tensor &b) {
  return contract(a, b, LabelSet{});
}

Tensor contract(const Tensor &a, const Tensor &b, const LabelSet &keep) {
  const auto &ai = a.indices();
  const auto &bi = b.indices();

  // each label gets the axis number it has in a, or a.rank() + its axis in b
  Array::annot_type annot_a, annot_b, annot_c;
  IndexList result_indices;
  for (std::size_t i = 0; i != ai.size(); ++i) {
    const auto &label = ai[i].label();
    annot_a.push_back(static_cast<long>(i));
    if (b.has_index(label)) {
      const auto j = b.axis_of(label);
      if (bi[j].extent() != ai[i].extent())
        throw ShapeError("contract: index " + label + " has extent " +
                         std::to_string(ai[i].extent()) + " and " +
                         std::to_string(bi[j].extent()));
      if (keep.count(label) == 0) continue;
    }
    annot_c.push_back(static_cast<long>(i));
    result_indices.push_back(ai[i]);
  }
  for (std::size_t j = 0; j != bi.size(); ++j) {
    const auto &label = bi[j].label();
    if (a.has_index(label)) {
      annot_b.push_back(static_cast<long>(a.axis_of(label)));
    } else {
      annot_b.push_back(static_cast<long>(ai.size() + j));
      annot_c.push_back(annot_b.back());
      result_indices.push_back(bi[j]);
    }
  }

  Tensor result(qunet::contract(a.data(), annot_a, b.data(), annot_b, annot_c),
                std::move(result_indices), a.tags());
  for (auto &&tag : b.tags()) result.add_tag(tag);
  return result;
}

SplitResult split(const Tensor &t, const LabelList &left_labels,
                  const TruncationOptions &opts,
                  std::optional<std::string> bond_label) {
  IndexList left_inds, right_inds;
  for (auto &&label : left_labels) {
    if (!t.has_index(label))
      throw std::invalid_argument("split: tensor has no index " + label);
    left_inds.push_back(t.index(label));
  }
  for (auto &&idx : t.indices())
    if (ranges::find(left_labels, idx.label()) == left_labels.end())
      right_inds.push_back(idx);
  if (left_inds.size() + right_inds.size() != t.rank())
    throw std::invalid_argument("split: left labels repeat");
  if (left_inds.empty() || right_inds.empty())
    throw std::invalid_argument("split: both sides need at least one index");

  const auto m = product_of_extents(left_inds);
  const auto n = product_of_extents(right_inds);
  const auto mat = t.to_matrix(left_labels);
  const linalg::Matrix a = linalg::as_matrix(mat, m, n);

  SplitResult result;
  const std::string bond =
      bond_label ? *bond_label : Index::make_unique_label();
  linalg::Matrix lmat, rmat;
  std::optional<linalg::Vector> middle;

  auto absorb = [&](const linalg::Matrix &u, const linalg::Vector &s,
                    const linalg::Matrix &vh) {
    switch (opts.absorb) {
      case Absorb::Left:
        lmat = u * s.asDiagonal();
        rmat = vh;
        break;
      case Absorb::Right:
        lmat = u;
        rmat = s.asDiagonal() * vh;
        break;
      case Absorb::Both: {
        const linalg::Vector sq = s.cwiseSqrt();
        lmat = u * sq.asDiagonal();
        rmat = sq.asDiagonal() * vh;
        break;
      }
      case Absorb::None:
        lmat = u;
        rmat = vh;
        middle = s;
        break;
    }
  };

  switch (opts.method) {
    case SplitMethod::SVD: {
      auto dec = linalg::svd(a);
      const auto trunc = linalg::truncation_rank(dec.s, opts);
      const auto r = static_cast<Eigen::Index>(trunc.rank);
      result.discarded = trunc.discarded;
      result.singular_values.assign(dec.s.data(), dec.s.data() + dec.s.size());
      absorb(dec.U.leftCols(r), dec.s.head(r), dec.Vh.topRows(r));
      break;
    }
    case SplitMethod::Eigh: {
      if (m != n)
        throw ShapeError("split: Eigh needs a square matricization, got " +
                         std::to_string(m) + "x" + std::to_string(n));
      auto dec = linalg::eigh(a);
      const linalg::Vector mags = dec.w.cwiseAbs();
      const auto trunc = linalg::truncation_rank(mags, opts);
      const auto r = static_cast<Eigen::Index>(trunc.rank);
      result.discarded = trunc.discarded;
      result.singular_values.assign(dec.w.data(), dec.w.data() + dec.w.size());
      // signs of negative eigenvalues go to the right factor
      linalg::Matrix vh = dec.V.leftCols(r).transpose();
      for (Eigen::Index i = 0; i != r; ++i)
        if (dec.w[i] < 0) vh.row(i) *= -1;
      absorb(dec.V.leftCols(r), mags.head(r), vh);
      break;
    }
    case SplitMethod::QR: {
      auto dec = linalg::qr(a);
      lmat = std::move(dec.Q);
      rmat = std::move(dec.R);
      break;
    }
    case SplitMethod::LQ: {
      auto dec = linalg::lq(a);
      lmat = std::move(dec.L);
      rmat = std::move(dec.Q);
      break;
    }
  }

  const auto r = static_cast<std::size_t>(lmat.cols());
  result.bond = Index(bond, r);
  std::string right_bond = bond;
  if (middle) {
    right_bond = Index::make_unique_label();
    linalg::Matrix d = middle->asDiagonal();
    result.middle = Tensor(linalg::to_array(d),
                           {Index(bond, r), Index(right_bond, r)}, t.tags());
  }

  left_inds.push_back(Index(bond, r));
  right_inds.insert(right_inds.begin(), Index(right_bond, r));
  result.left = Tensor(linalg::to_array(lmat).reshape(extents_of(left_inds)),
                       left_inds, t.tags());
  result.right = Tensor(linalg::to_array(rmat).reshape(extents_of(right_inds)),
                        right_inds, t.tags());

  if (Logger::instance().compress && result.discarded > 0)
    write_log(Logger::instance(), "split: bond ", bond, " kept ", r, " of ",
              result.singular_values.size(), ", discarded weight ",
              result.discarded, "\n");
  return result;
}

std::ostream &operator<<(std::ostream &os, const Tensor &t) {
  os << "Tensor(indices=(";
  for (std::size_t k = 0; k != t.rank(); ++k)
    os << (k ? ", " : "") << t.indices()[k];
  os << "), tags={";
  bool first = true;
  for (auto &&tag : t.tags()) {
    os << (first ? "" : ", ") << tag;
    first = false;
  }
  os << "})";
  return os;
}

}  // namespace qunet
