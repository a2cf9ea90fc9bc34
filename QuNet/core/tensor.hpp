#ifndef QUNET_CORE_TENSOR_HPP
#define QUNET_CORE_TENSOR_HPP

#include <QuNet/core/array.hpp>
#include <QuNet/core/container.hpp>
#include <QuNet/core/index.hpp>
#include <QuNet/core/options.hpp>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qunet {

using TagSet = container::set<std::string>;
using LabelSet = container::set<std::string>;
/// old label -> new label
using RenameMap = container::map<std::string, std::string>;

/// records a fuse() so that unfuse() can restore the original indices
struct FuseRecord {
  /// label of the fused index
  std::string label;
  /// the indices that were fused, in fused (row-major) order
  IndexList fused;
};

/// @brief a tagged dense array whose axes are labeled by Index objects
///
/// Index labels are distinct within a tensor. Tags are an unordered set of
/// strings used to group and select tensors in a TensorNetwork.
class Tensor {
 public:
  /// rank-0 tensor holding 0
  Tensor() = default;

  /// @param data the array; its shape must match the extents of @p indices
  /// @param indices the index of each axis of @p data
  /// @param tags tags of the tensor
  /// @throw ShapeError if the shape disagrees or labels repeat
  Tensor(Array data, IndexList indices, TagSet tags = {});

  /// same as the constructor, the extents are taken from @p data
  static Tensor from_labels(Array data, const std::vector<std::string> &labels,
                            TagSet tags = {});

  /// rank-0 tensor holding @p value
  static Tensor scalar(double value, TagSet tags = {});

  const IndexList &indices() const noexcept { return indices_; }
  LabelList labels() const;
  const TagSet &tags() const noexcept { return tags_; }
  const Array &data() const noexcept { return data_; }
  Array &data() noexcept { return data_; }

  std::size_t rank() const noexcept { return indices_.size(); }
  std::size_t size() const noexcept { return data_.size(); }
  Array::shape_type shape() const { return data_.shape(); }

  bool has_index(std::string_view label) const;
  bool has_tag(std::string_view tag) const;
  /// @throw std::out_of_range if @p label is not an index of this
  std::size_t axis_of(std::string_view label) const;
  /// @throw std::out_of_range if @p label is not an index of this
  std::size_t extent(std::string_view label) const;
  /// @throw std::out_of_range if @p label is not an index of this
  const Index &index(std::string_view label) const;

  /// @return the value of a rank-0 tensor
  /// @throw std::logic_error if rank() != 0
  double value() const;

  /// @name label/tag edits (value semantics; inside a TensorNetwork use
  /// TensorNetwork::modify() so the registries stay consistent)
  /// @{
  /// renames indices; labels not in @p map are kept
  /// @throw NameCollisionError if the result would repeat a label
  Tensor &reindex(const RenameMap &map);
  Tensor &retag(const RenameMap &map);
  Tensor &add_tag(std::string tag);
  Tensor &remove_tag(std::string_view tag);
  /// @}

  /// @name layout operations
  /// @{
  /// reorders axes to @p order , which must be a permutation of labels()
  Tensor &transpose(const LabelList &order);
  /// merges @p labels into one index called @p new_label placed at the
  /// position of the first of them
  FuseRecord fuse(const LabelList &labels, std::string new_label);
  /// splits the index fused by @p record back into its constituents
  Tensor &unfuse(const FuseRecord &record);
  /// drops all extent-1 indices
  Tensor &squeeze();
  /// inserts an extent-1 index at the front
  Tensor &expand(std::string label);
  /// @}

  /// @name algebra
  /// @{
  double norm() const { return data_.norm(); }
  Tensor conj() const;
  Tensor &operator*=(double factor);
  /// fixes index @p label at @p value , removing the index
  Tensor isel(std::string_view label, std::size_t value) const;
  /// sums over index @p label , removing the index
  Tensor sum_over(std::string_view label) const;
  /// sums the diagonal of two equal-extent indices, removing both
  Tensor trace(std::string_view label_a, std::string_view label_b) const;
  /// keeps the diagonal of two equal-extent indices, @p label_b is removed
  Tensor diagonal(std::string_view label_a, std::string_view label_b) const;
  /// @}

  /// @return the elements as a matrix whose rows are the combined
  /// @p left labels (in the given order) and columns the remaining labels
  /// (in tensor order)
  Array to_matrix(const LabelList &left) const;

  /// @return true if @p other has the same indices (in any order) and the
  /// elements agree within tolerance
  bool allclose(const Tensor &other, double rtol = 1e-10,
                double atol = 1e-12) const;

 private:
  Array data_;
  IndexList indices_;
  TagSet tags_;

  void check_shape() const;
};

/// @brief contracts @p a and @p b over all shared indices
///
/// The result's indices are those of @p a that are not shared, in order,
/// followed by those of @p b that are not shared. Tags are the union.
/// @throw ShapeError if a shared index has different extents
Tensor contract(const Tensor &a, const Tensor &b);

/// @brief same as contract(a, b), but shared labels in @p keep are not
/// summed: they are kept as batch (elementwise) indices, positioned as in @p a
/// @note this is how hyperindices are contracted pairwise
Tensor contract(const Tensor &a, const Tensor &b, const LabelSet &keep);

/// outcome of split()
struct SplitResult {
  Tensor left;
  Tensor right;
  /// the singular values as a diagonal matrix tensor between left and right;
  /// only when absorb is Absorb::None
  std::optional<Tensor> middle;
  /// the new bond, as seen by left
  Index bond;
  /// square root of the sum of squares of discarded singular values
  double discarded = 0;
  /// all singular values (or eigenvalues) before truncation
  std::vector<double> singular_values;
};

/// @brief factorizes @p t into two tensors joined by a new bond
/// @param left_labels labels of the left factor; the rest go right
/// @param opts truncation options, see TruncationOptions
/// @param bond_label label of the new bond; a unique label if unset
/// @throw std::invalid_argument if @p left_labels are not labels of @p t
SplitResult split(const Tensor &t, const LabelList &left_labels,
                  const TruncationOptions &opts,
                  std::optional<std::string> bond_label = std::nullopt);

std::ostream &operator<<(std::ostream &os, const Tensor &t);

}  // namespace qunet

#endif  // QUNET_CORE_TENSOR_HPP
