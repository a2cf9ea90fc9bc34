#ifndef QUNET_CORE_TENSOR_NETWORK_HPP
#define QUNET_CORE_TENSOR_NETWORK_HPP

#include <QuNet/core/array.hpp>
#include <QuNet/core/container.hpp>
#include <QuNet/core/index.hpp>
#include <QuNet/core/optimize/path.hpp>
#include <QuNet/core/options.hpp>
#include <QuNet/core/tensor.hpp>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace qunet {

/// stable identifier of a tensor within a TensorNetwork
using TensorId = std::size_t;
using TensorIdSet = container::set<TensorId>;
using TagList = container::svector<std::string>;

///
/// @brief a graph of tensors connected by shared index labels
///
/// Tensors live in an arena keyed by TensorId; ids are never reused within a
/// network. Two registries are maintained alongside: label -> ids of the
/// tensors holding it, and tag -> ids of the tensors carrying it. An index
/// held by one tensor is outer, by two a bond, by three or more a
/// hyperindex. All tensors holding a label agree on its extent.
///
/// Operations that can fail compute the new state first and commit it only
/// once every check has passed, so a thrown exception leaves the network
/// unchanged.
///
class TensorNetwork {
 public:
  using tensor_map_type = container::map<TensorId, Tensor>;
  using registry_type = container::map<std::string, TensorIdSet>;

  TensorNetwork() = default;
  /// adds @p tensors in order
  /// @throw ShapeError if the tensors disagree on the extent of an index
  explicit TensorNetwork(container::vector<Tensor> tensors);

  /// @name mutation
  /// @{

  /// @return the id of the added tensor
  /// @throw ShapeError if @p t disagrees with the network on an extent
  TensorId add(Tensor t);

  /// adds copies of the tensors of @p other
  /// @param check_collisions if true, labels that are inner in both networks
  ///        are renamed in the copies so that they do not connect
  TensorNetwork& add(const TensorNetwork& other, bool check_collisions = true);

  /// removes the tensor @p id and returns it
  /// @throw std::out_of_range if there is no such tensor
  Tensor pop(TensorId id);

  /// removes the tensors selected by select_ids(tags, mode)
  /// @return the number of removed tensors
  std::size_t remove(const TagList& tags, SelectMode mode = SelectMode::All);

  /// replaces tensor @p id by @p t , keeping the id
  /// @throw ShapeError if @p t disagrees with the rest of the network
  void update(TensorId id, Tensor t);

  /// replaces tensors @p a and @p b at once; for edits that change the
  /// extent of an index they share
  /// @throw ShapeError if the replacements disagree with the rest of the
  ///        network or with each other
  void update_pair(TensorId a, Tensor ta, TensorId b, Tensor tb);

  /// applies @p fn to a copy of tensor @p id and commits the result with
  /// update()
  template <typename F>
  TensorNetwork& modify(TensorId id, F&& fn) {
    Tensor t = tensor(id);
    std::forward<F>(fn)(t);
    update(id, std::move(t));
    return *this;
  }

  /// replaces the tensors @p ids by @p t , which takes the smallest of
  /// @p ids
  /// @return the id of @p t
  TensorId replace(const TensorIdSet& ids, Tensor t);

  /// @}

  /// @return copy of this with every tensor conjugated
  TensorNetwork conj() const;

  /// same as add(other, true)
  TensorNetwork& operator&=(const TensorNetwork& other);

  /// @name selection
  /// @{

  /// @return ids of the tensors carrying all (SelectMode::All) or any
  /// (SelectMode::Any) of @p tags
  TensorIdSet select_ids(const TagList& tags,
                         SelectMode mode = SelectMode::All) const;

  /// @return network of copies of the selected tensors, with the same ids
  TensorNetwork select(const TagList& tags,
                       SelectMode mode = SelectMode::All) const;

  /// @return network of copies of the tensors @p ids , with the same ids
  TensorNetwork subnetwork(const TensorIdSet& ids) const;

  /// @return the unique tensor carrying @p tag
  /// @throw std::out_of_range if no tensor carries @p tag
  /// @throw std::logic_error if several tensors carry @p tag
  const Tensor& operator[](std::string_view tag) const;

  /// @return id of the unique tensor carrying @p tag
  /// @throw see operator[]
  TensorId id_of(std::string_view tag) const;

  /// @return ids of the tensors that share an index with one of @p ids ,
  /// excluding @p ids themselves
  TensorIdSet select_neighbors(const TensorIdSet& ids) const;

  /// @}

  /// @name queries
  /// @{
  const Tensor& tensor(TensorId id) const;
  bool contains(TensorId id) const { return tensors_.count(id) != 0; }
  const tensor_map_type& tensor_map() const noexcept { return tensors_; }
  const registry_type& index_map() const noexcept { return index_map_; }
  const registry_type& tag_map() const noexcept { return tag_map_; }
  std::size_t num_tensors() const noexcept { return tensors_.size(); }
  std::size_t num_indices() const noexcept { return index_map_.size(); }
  bool empty() const noexcept { return tensors_.empty(); }
  TagSet tags() const;

  /// labels held by exactly one tensor, in order of first appearance
  /// (tensors by id, then axes)
  LabelList outer_indices() const;
  /// labels held by two or more tensors, in order of first appearance
  LabelList inner_indices() const;
  /// labels held by three or more tensors, in order of first appearance
  LabelList hyper_indices() const;

  /// @throw std::out_of_range if no tensor holds @p label
  std::size_t index_extent(std::string_view label) const;
  /// @return ids of the tensors holding @p label (empty if none)
  TensorIdSet tensors_with_index(std::string_view label) const;
  /// @return ids of the tensors sharing an index with tensor @p id
  TensorIdSet neighbors(TensorId id) const;
  /// @return labels shared by tensors @p a and @p b , in the order of @p a
  LabelList shared_indices(TensorId a, TensorId b) const;

  /// @return the largest extent of an inner index; 1 if there is none
  std::size_t max_bond() const;
  /// @return product of the extents of the indices shared by the tensors
  /// carrying @p tag_a and @p tag_b
  /// @throw std::invalid_argument if they share no index
  std::size_t bond_size(std::string_view tag_a, std::string_view tag_b) const;

  /// validates the registries and extents
  /// @throw Exception describing the first inconsistency found
  void check() const;
  /// @}

  /// @name local contraction
  /// @{

  /// contracts tensors @p a and @p b ; shared indices held by other tensors
  /// or listed in @p keep are kept. The result takes the id @p a.
  TensorId contract_between(TensorId a, TensorId b, const LabelSet& keep = {});

  /// contracts the tensors @p ids into one; indices held outside @p ids or
  /// outer in this network are kept
  /// @return the id of the result (the smallest of @p ids)
  TensorId contract_ids(const TensorIdSet& ids,
                        const std::optional<ContractOptions>& opts = {});

  /// contract_ids(select_ids(tags, mode))
  /// @throw std::out_of_range if no tensor is selected
  TensorId contract_tags(const TagList& tags, SelectMode mode = SelectMode::All,
                         const std::optional<ContractOptions>& opts = {});

  /// contracts all tensors holding @p label
  TensorId contract_index(std::string_view label,
                          const std::optional<ContractOptions>& opts = {});

  /// @}

  /// @name global contraction
  /// @{

  /// @brief contracts the whole network
  /// @param output_inds labels of the result, in order; by default the outer
  ///        indices. Required when hyperindices are present.
  /// @param opts path strategy and width budget; the default context's
  ///        contraction options if unset
  /// @return the result; rank 0 if @p output_inds is empty
  /// @throw AmbiguousContractionError if @p output_inds is unset and the
  ///        network holds hyperindices
  /// @throw ResourceExhaustion if the width budget of @p opts is exceeded
  Tensor contract(const std::optional<LabelList>& output_inds = {},
                  const std::optional<ContractOptions>& opts = {}) const;

  /// @return the value of the network contracted to a scalar
  double contract_scalar(const std::optional<ContractOptions>& opts = {}) const;

  /// @return cost of the path the optimizer picks for contract()
  opt::PathInfo contraction_info(
      const std::optional<LabelList>& output_inds = {},
      const std::optional<ContractOptions>& opts = {}) const;

  /// @return log2 of the largest intermediate of contract()
  double contraction_width(
      const std::optional<LabelList>& output_inds = {},
      const std::optional<ContractOptions>& opts = {}) const;

  /// @return total multiply-adds of contract()
  double contraction_cost(
      const std::optional<LabelList>& output_inds = {},
      const std::optional<ContractOptions>& opts = {}) const;

  /// @return the elements of the network contracted to the concatenation of
  /// @p groups , reshaped so that each group is one axis
  Array to_dense(const container::vector<LabelList>& groups,
                 const std::optional<ContractOptions>& opts = {}) const;

  /// @}

  /// @name rewriting
  /// @{

  /// renames tags
  /// @throw NameCollisionError if a new tag equals a tag that is not
  ///        renamed, or two tags get the same name, unless @p merge is
  ///        Merge::Yes
  TensorNetwork& retag(const RenameMap& map, Merge merge = Merge::No);

  /// renames indices
  /// @throw NameCollisionError if a new label equals a label that is not
  ///        renamed, or two labels get the same name, unless @p merge is
  ///        Merge::Yes; also if a tensor would hold a label twice
  /// @throw ShapeError if merged labels disagree on extent
  TensorNetwork& reindex(const RenameMap& map, Merge merge = Merge::No);

  /// drops every extent-1 index
  TensorNetwork& squeeze();

  /// merges the bonds that tensors @p a and @p b share exclusively into one
  /// @return the label of the merged bond, unset if they share none
  std::optional<std::string> fuse_between(TensorId a, TensorId b);

  /// fuse_between() for every pair of tensors
  TensorNetwork& fuse_multibonds();

  /// contracts the tensors carrying each of @p site_tags into one, then
  /// fuses parallel bonds
  TensorNetwork& flatten(const TagList& site_tags,
                         const std::optional<ContractOptions>& opts = {});

  /// moves the non-isometric part of tensor @p a into tensor @p b with a QR
  /// decomposition; @p a becomes an isometry from its other indices to the
  /// bond
  void canonize_between(TensorId a, TensorId b);

  /// contracts @p a and @p b and splits the result back with truncation
  /// @return the discarded weight
  /// @throw std::invalid_argument if @p a and @p b share a hyperindex
  double compress_between(TensorId a, TensorId b,
                          const TruncationOptions& opts);

  /// rescales every tensor to the geometric mean of their norms; the value of
  /// the network does not change
  TensorNetwork& equalize_norms();

  /// simplifies the network in place, see qunet::full_simplify()
  TensorNetwork& full_simplify(const std::optional<SimplifyOptions>& opts = {});

  /// @}

 private:
  tensor_map_type tensors_;
  registry_type index_map_;
  registry_type tag_map_;
  TensorId next_id_ = 0;

  void register_tensor(TensorId id, const Tensor& t);
  void unregister_tensor(TensorId id, const Tensor& t);
  /// throws ShapeError if @p t disagrees on an extent with a tensor not in
  /// @p ignore
  void check_extents(const Tensor& t, const TensorIdSet& ignore) const;
  TensorId emplace(TensorId id, Tensor t);
  void rebuild_registries();
  /// labels held by the tensors @p ids that are needed outside them
  LabelList boundary_indices(const TensorIdSet& ids) const;
};

/// @return a network holding copies of the tensors of @p a and @p b ;
/// labels inner in both are renamed in the copies of @p b
TensorNetwork operator&(const TensorNetwork& a, const TensorNetwork& b);

std::ostream& operator<<(std::ostream& os, const TensorNetwork& tn);

}  // namespace qunet

#endif  // QUNET_CORE_TENSOR_NETWORK_HPP
