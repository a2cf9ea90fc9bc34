#ifndef QUNET_CORE_ARRAY_HPP
#define QUNET_CORE_ARRAY_HPP

#include <QuNet/core/container.hpp>

#include <btas/btas.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <span>
#include <vector>

namespace qunet {

/// @brief dense row-major multidimensional array of doubles
///
/// A btas::Tensor together with its shape; it knows nothing about index
/// labels. A rank-0 Array holds one element, stored as a tensor of extent 1.
class Array {
 public:
  using value_type = double;
  using shape_type = container::svector<std::size_t, 6>;
  using tensor_type = btas::Tensor<value_type>;
  /// axis labels of btas::permute and btas::contract
  using annot_type = container::svector<long>;

  /// rank-0 array holding 0
  Array();
  /// zero-filled array of shape @p shape
  explicit Array(shape_type shape);
  /// @throw ShapeError if data.size() disagrees with @p shape
  Array(shape_type shape, std::vector<value_type> data);
  /// @throw ShapeError if the volume of @p tensor disagrees with @p shape
  Array(shape_type shape, tensor_type tensor);

  /// rank-0 array holding @p value
  static Array scalar(value_type value);
  /// array with i.i.d. standard normal elements
  static Array random(shape_type shape, std::uint64_t seed);
  /// COPY tensor: 1 where all indices are equal, 0 elsewhere
  static Array delta(std::size_t rank, std::size_t extent);
  /// @p n x @p n identity matrix
  static Array identity(std::size_t n);

  std::size_t rank() const noexcept { return shape_.size(); }
  std::size_t size() const noexcept { return data_.size(); }
  const tensor_type &tensor() const noexcept { return data_; }
  const shape_type &shape() const noexcept { return shape_; }
  std::size_t extent(std::size_t axis) const { return shape_.at(axis); }
  shape_type strides() const;

  value_type *data() noexcept { return data_.data(); }
  const value_type *data() const noexcept { return data_.data(); }

  value_type &operator[](std::size_t ord) { return data()[ord]; }
  value_type operator[](std::size_t ord) const { return data()[ord]; }
  /// element access by multi-index
  value_type &operator()(std::initializer_list<std::size_t> idx);
  value_type operator()(std::initializer_list<std::size_t> idx) const;
  std::size_t ordinal(std::span<const std::size_t> idx) const;

  /// @return array with axis k of the result equal to axis perm[k] of this
  Array permute(std::span<const std::size_t> perm) const;
  /// @return array whose axes, labeled by @p from here, are ordered as @p to
  Array permute(const annot_type &from, const annot_type &to) const;
  /// @throw ShapeError if the element count changes
  Array reshape(shape_type shape) const;
  Array conj() const;
  value_type norm() const;
  Array &scale(value_type factor);
  /// fixes axis @p axis at @p value, dropping the axis
  Array slice(std::size_t axis, std::size_t value) const;
  /// keeps the diagonal of equal-extent axes @p a and @p b as axis @p a ;
  /// axis @p b is dropped
  Array diagonal(std::size_t a, std::size_t b) const;
  /// sums the diagonal of axes @p a and @p b, dropping both
  Array trace(std::size_t a, std::size_t b) const;
  /// @return true if elements off the diagonal of axes @p a and @p b are
  /// at most @p atol in magnitude
  bool is_diagonal(std::size_t a, std::size_t b, double atol) const;
  /// @return positions along @p axis whose slices have an element exceeding
  /// @p atol in magnitude
  std::vector<std::size_t> nonzero_slices(std::size_t axis, double atol) const;
  /// sums over axis @p axis, dropping it
  Array sum(std::size_t axis) const;

  /// @throw ShapeError if shapes differ
  Array &operator+=(const Array &other);
  Array &operator*=(value_type factor) { return scale(factor); }

  /// @return true if shapes agree and |a - b| <= atol + rtol * |b|
  /// elementwise
  bool allclose(const Array &other, double rtol = 1e-10,
                double atol = 1e-12) const;

 private:
  shape_type shape_;
  tensor_type data_;

  /// @return this with @p axes moved to the front, the rest in order
  Array with_axes_first(std::initializer_list<std::size_t> axes) const;
  /// @return the number of elements per position of the leading axes
  std::size_t block_size(std::size_t nleading) const;
};

/// @brief C(annot_c) = sum of A(annot_a) * B(annot_b) over the labels
/// missing from @p annot_c
///
/// A label in all three annotations is a batch label: the product is taken
/// separately for each of its values. Every label held by only one operand
/// must appear in @p annot_c .
/// @throw ShapeError if a shared label has different extents
Array contract(const Array &a, const Array::annot_type &annot_a,
               const Array &b, const Array::annot_type &annot_b,
               const Array::annot_type &annot_c);

/// @return the number of elements of @p shape
std::size_t volume(const Array::shape_type &shape);

std::ostream &operator<<(std::ostream &os, const Array &arr);

}  // namespace qunet

#endif  // QUNET_CORE_ARRAY_HPP
