#include <QuNet/core/array.hpp>
#include <QuNet/core/utility/exception.hpp>
#include <QuNet/core/utility/macros.hpp>

#include <range/v3/algorithm/find.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace qunet {

namespace {

std::string to_string(const Array::shape_type &shape) {
  std::string result = "(";
  for (std::size_t i = 0; i != shape.size(); ++i) {
    if (i) result += ",";
    result += std::to_string(shape[i]);
  }
  return result + ")";
}

/// rank-0 arrays are stored as a tensor of extent 1
btas::Range range_of(const Array::shape_type &shape) {
  std::vector<std::size_t> extents(shape.begin(), shape.end());
  if (extents.empty()) extents.push_back(1);
  return btas::Range{extents};
}

Array::tensor_type zeros(const Array::shape_type &shape) {
  Array::tensor_type result{range_of(shape)};
  result.fill(0.);
  return result;
}

bool contains(const Array::annot_type &annot, long label) {
  return ranges::find(annot, label) != annot.end();
}

}  // namespace

std::size_t volume(const Array::shape_type &shape) {
  return std::accumulate(shape.begin(), shape.end(), std::size_t{1},
                         std::multiplies<>{});
}

Array::Array() : data_(zeros({})) {}

Array::Array(shape_type shape)
    : shape_(std::move(shape)), data_(zeros(shape_)) {}

Array::Array(shape_type shape, std::vector<value_type> data)
    : shape_(std::move(shape)) {
  if (data.size() != volume(shape_))
    throw ShapeError("Array: " + std::to_string(data.size()) +
                     " elements do not fit shape " + to_string(shape_));
  data_ = tensor_type{range_of(shape_)};
  std::copy(data.begin(), data.end(), data_.begin());
}

Array::Array(shape_type shape, tensor_type tensor)
    : shape_(std::move(shape)), data_(std::move(tensor)) {
  if (data_.size() != volume(shape_))
    throw ShapeError("Array: " + std::to_string(data_.size()) +
                     " elements do not fit shape " + to_string(shape_));
}

Array Array::scalar(value_type value) {
  Array result;
  result[0] = value;
  return result;
}

Array Array::random(shape_type shape, std::uint64_t seed) {
  Array result(std::move(shape));
  std::mt19937_64 gen(seed);
  std::normal_distribution<double> dist(0., 1.);
  std::generate(result.data_.begin(), result.data_.end(),
                [&]() { return dist(gen); });
  return result;
}

Array Array::delta(std::size_t rank, std::size_t extent) {
  Array result(shape_type(rank, extent));
  const auto strides = result.strides();
  const auto diag_stride =
      std::accumulate(strides.begin(), strides.end(), std::size_t{0});
  for (std::size_t i = 0; i != extent; ++i) result[i * diag_stride] = 1;
  return result;
}

Array Array::identity(std::size_t n) { return delta(2, n); }

Array::shape_type Array::strides() const {
  shape_type result(shape_.size(), 1);
  for (std::size_t k = shape_.size(); k-- > 1;)
    result[k - 1] = result[k] * shape_[k];
  return result;
}

std::size_t Array::ordinal(std::span<const std::size_t> idx) const {
  if (idx.size() != rank())
    throw std::out_of_range("Array::ordinal: rank mismatch");
  std::size_t result = 0;
  for (std::size_t k = 0; k != idx.size(); ++k) {
    if (idx[k] >= shape_[k])
      throw std::out_of_range("Array::ordinal: index out of range");
    result = result * shape_[k] + idx[k];
  }
  return result;
}

Array::value_type &Array::operator()(std::initializer_list<std::size_t> idx) {
  return data()[ordinal(std::span<const std::size_t>(idx.begin(), idx.size()))];
}

Array::value_type Array::operator()(
    std::initializer_list<std::size_t> idx) const {
  return data()[ordinal(std::span<const std::size_t>(idx.begin(), idx.size()))];
}

Array Array::permute(std::span<const std::size_t> perm) const {
  QUNET_ASSERT(perm.size() == rank());
  if (std::is_sorted(perm.begin(), perm.end())) return *this;
  annot_type from(rank()), to;
  std::iota(from.begin(), from.end(), 0L);
  for (auto p : perm) to.push_back(static_cast<long>(p));
  return permute(from, to);
}

Array Array::permute(const annot_type &from, const annot_type &to) const {
  QUNET_ASSERT(from.size() == rank() && to.size() == rank());
  if (from == to) return *this;
  shape_type new_shape;
  for (auto label : to) {
    const auto it = ranges::find(from, label);
    QUNET_ASSERT(it != from.end(), "permute: unknown axis label");
    new_shape.push_back(shape_[it - from.begin()]);
  }
  tensor_type result;
  btas::permute(data_, from, result, to);
  return Array(std::move(new_shape), std::move(result));
}

Array Array::reshape(shape_type shape) const {
  if (volume(shape) != size())
    throw ShapeError("Array::reshape: cannot reshape " + to_string(shape_) +
                     " to " + to_string(shape));
  return Array(std::move(shape),
               std::vector<value_type>(data_.begin(), data_.end()));
}

Array Array::conj() const { return *this; }

Array::value_type Array::norm() const {
  return std::sqrt(btas::dot(data_, data_));
}

Array &Array::scale(value_type factor) {
  btas::scal(factor, data_);
  return *this;
}

Array Array::with_axes_first(std::initializer_list<std::size_t> axes) const {
  shape_type perm(axes.begin(), axes.end());
  for (std::size_t k = 0; k != rank(); ++k)
    if (ranges::find(perm, k) == perm.end()) perm.push_back(k);
  return permute({perm.data(), perm.size()});
}

std::size_t Array::block_size(std::size_t nleading) const {
  return std::accumulate(shape_.begin() + nleading, shape_.end(),
                         std::size_t{1}, std::multiplies<>{});
}

Array Array::slice(std::size_t axis, std::size_t value) const {
  if (axis >= rank() || value >= shape_[axis])
    throw std::out_of_range("Array::slice: axis or value out of range");
  const auto front = with_axes_first({axis});
  const auto n = front.block_size(1);
  const auto *first = front.data() + value * n;
  return Array(shape_type(front.shape_.begin() + 1, front.shape_.end()),
               std::vector<value_type>(first, first + n));
}

Array Array::diagonal(std::size_t a, std::size_t b) const {
  QUNET_ASSERT(a != b && a < rank() && b < rank());
  if (shape_[a] != shape_[b])
    throw ShapeError("Array::diagonal: axes have different extents");
  const auto front = with_axes_first({a, b});
  const auto d = shape_[a];
  const auto n = front.block_size(2);

  // laid out as (a, others...); axis a returns to its place, b is dropped
  shape_type diag_shape{d};
  annot_type from{static_cast<long>(a)}, to;
  for (std::size_t k = 0; k != rank(); ++k) {
    if (k != a && k != b) {
      diag_shape.push_back(shape_[k]);
      from.push_back(static_cast<long>(k));
    }
    if (k != b) to.push_back(static_cast<long>(k));
  }
  Array diag(std::move(diag_shape));
  for (std::size_t t = 0; t != d; ++t)
    std::copy_n(front.data() + t * (d + 1) * n, n, diag.data() + t * n);
  return diag.permute(from, to);
}

Array Array::trace(std::size_t a, std::size_t b) const {
  QUNET_ASSERT(a != b && a < rank() && b < rank());
  if (shape_[a] != shape_[b])
    throw ShapeError("Array::trace: axes have different extents");
  const auto front = with_axes_first({a, b});
  const auto d = shape_[a];
  const auto n = front.block_size(2);
  Array result(shape_type(front.shape_.begin() + 2, front.shape_.end()));
  for (std::size_t t = 0; t != d; ++t) {
    const auto *block = front.data() + t * (d + 1) * n;
    for (std::size_t i = 0; i != n; ++i) result[i] += block[i];
  }
  return result;
}

bool Array::is_diagonal(std::size_t a, std::size_t b, double atol) const {
  QUNET_ASSERT(a != b && a < rank() && b < rank());
  if (shape_[a] != shape_[b]) return false;
  const auto front = with_axes_first({a, b});
  const auto d = shape_[a];
  const auto n = front.block_size(2);
  for (std::size_t i = 0; i != d; ++i) {
    for (std::size_t j = 0; j != d; ++j) {
      if (i == j) continue;
      const auto *block = front.data() + (i * d + j) * n;
      if (std::any_of(block, block + n,
                      [atol](double x) { return std::abs(x) > atol; }))
        return false;
    }
  }
  return true;
}

std::vector<std::size_t> Array::nonzero_slices(std::size_t axis,
                                               double atol) const {
  QUNET_ASSERT(axis < rank());
  const auto front = with_axes_first({axis});
  const auto n = front.block_size(1);
  std::vector<std::size_t> result;
  for (std::size_t v = 0; v != shape_[axis]; ++v) {
    const auto *block = front.data() + v * n;
    if (std::any_of(block, block + n,
                    [atol](double x) { return std::abs(x) > atol; }))
      result.push_back(v);
  }
  return result;
}

Array Array::sum(std::size_t axis) const {
  QUNET_ASSERT(axis < rank());
  const auto front = with_axes_first({axis});
  const auto n = front.block_size(1);
  Array result(shape_type(front.shape_.begin() + 1, front.shape_.end()));
  for (std::size_t v = 0; v != shape_[axis]; ++v) {
    const auto *block = front.data() + v * n;
    for (std::size_t i = 0; i != n; ++i) result[i] += block[i];
  }
  return result;
}

Array &Array::operator+=(const Array &other) {
  if (shape_ != other.shape_)
    throw ShapeError("Array::operator+=: shapes " + to_string(shape_) +
                     " and " + to_string(other.shape_) + " differ");
  data_ += other.data_;
  return *this;
}

bool Array::allclose(const Array &other, double rtol, double atol) const {
  if (shape_ != other.shape_) return false;
  for (std::size_t i = 0; i != size(); ++i) {
    if (std::abs((*this)[i] - other[i]) > atol + rtol * std::abs(other[i]))
      return false;
  }
  return true;
}

Array contract(const Array &a, const Array::annot_type &annot_a,
               const Array &b, const Array::annot_type &annot_b,
               const Array::annot_type &annot_c) {
  using annot_type = Array::annot_type;
  QUNET_ASSERT(annot_a.size() == a.rank() && annot_b.size() == b.rank());

  auto extent_of = [&](long label) {
    if (const auto it = ranges::find(annot_a, label); it != annot_a.end())
      return a.extent(it - annot_a.begin());
    const auto it = ranges::find(annot_b, label);
    QUNET_ASSERT(it != annot_b.end(), "contract: output label not in input");
    return b.extent(it - annot_b.begin());
  };
  for (std::size_t i = 0; i != annot_a.size(); ++i) {
    const auto it = ranges::find(annot_b, annot_a[i]);
    if (it != annot_b.end() && b.extent(it - annot_b.begin()) != a.extent(i))
      throw ShapeError("contract: axis label " + std::to_string(annot_a[i]) +
                       " has extents " + std::to_string(a.extent(i)) +
                       " and " +
                       std::to_string(b.extent(it - annot_b.begin())));
  }
  Array::shape_type shape_c;
  for (auto label : annot_c) shape_c.push_back(extent_of(label));

  // scalar operand: scale the other
  if (a.rank() == 0 || b.rank() == 0) {
    const bool a_scalar = a.rank() == 0;
    auto result = a_scalar ? b.permute(annot_b, annot_c)
                           : a.permute(annot_a, annot_c);
    result *= a_scalar ? a[0] : b[0];
    return result;
  }

  annot_type batch;
  for (auto label : annot_c)
    if (contains(annot_a, label) && contains(annot_b, label))
      batch.push_back(label);

  if (batch.empty()) {
    if (annot_c.empty()) {
      Array::tensor_type aligned;
      btas::permute(b.tensor(), annot_b, aligned, annot_a);
      return Array::scalar(btas::dot(a.tensor(), aligned));
    }
    Array::tensor_type result;
    btas::contract(1., a.tensor(), annot_a, b.tensor(), annot_b, 0., result,
                   annot_c);
    return Array(std::move(shape_c), std::move(result));
  }

  // batch labels lead, so each batch value is a contiguous block
  auto split_off = [&batch](const annot_type &annot) {
    annot_type rest;
    for (auto label : annot)
      if (!contains(batch, label)) rest.push_back(label);
    return rest;
  };
  auto leading = [&batch](const annot_type &rest) {
    annot_type result = batch;
    result.insert(result.end(), rest.begin(), rest.end());
    return result;
  };
  auto shape_of = [&extent_of](const annot_type &annot) {
    Array::shape_type result;
    for (auto label : annot) result.push_back(extent_of(label));
    return result;
  };
  const auto rest_a = split_off(annot_a);
  const auto rest_b = split_off(annot_b);
  const auto rest_c = split_off(annot_c);
  const auto pa = a.permute(annot_a, leading(rest_a));
  const auto pb = b.permute(annot_b, leading(rest_b));
  Array pc(shape_of(leading(rest_c)));

  std::size_t nbatch = 1;
  for (auto label : batch) nbatch *= extent_of(label);
  Array block_a(shape_of(rest_a)), block_b(shape_of(rest_b));
  const auto na = block_a.size(), nb = block_b.size();
  const auto nc = volume(shape_of(rest_c));
  for (std::size_t t = 0; t != nbatch; ++t) {
    std::copy_n(pa.data() + t * na, na, block_a.data());
    std::copy_n(pb.data() + t * nb, nb, block_b.data());
    const auto block_c = contract(block_a, rest_a, block_b, rest_b, rest_c);
    std::copy_n(block_c.data(), nc, pc.data() + t * nc);
  }
  return pc.permute(leading(rest_c), annot_c);
}

std::ostream &operator<<(std::ostream &os, const Array &arr) {
  os << "Array" << to_string(arr.shape()) << "{";
  const auto n = std::min<std::size_t>(arr.size(), 16);
  for (std::size_t i = 0; i != n; ++i) os << (i ? ", " : "") << arr[i];
  if (n < arr.size()) os << ", ...";
  os << "}";
  return os;
}

}  // namespace qunet
