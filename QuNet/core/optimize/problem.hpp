#ifndef QUNET_CORE_OPTIMIZE_PROBLEM_HPP
#define QUNET_CORE_OPTIMIZE_PROBLEM_HPP

#include <QuNet/core/container.hpp>
#include <QuNet/core/index.hpp>
#include <QuNet/core/tensor.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace qunet::opt {

/// sorted list of index ids
using IndexIdSet = container::svector<std::size_t>;

///
/// The hypergraph of a contraction: which indices each input holds, the
/// extent of each index, and which indices survive in the result. Indices
/// are referred to by dense integer ids.
///
struct ContractionProblem {
  /// index ids held by each input, sorted
  container::vector<IndexIdSet> inputs;
  /// extent of each index id
  container::vector<std::size_t> extents;
  /// label of each index id
  container::vector<std::string> labels;
  /// index ids of the result, in result order
  container::svector<std::size_t> output;

  std::size_t num_inputs() const noexcept { return inputs.size(); }
  std::size_t num_indices() const noexcept { return extents.size(); }
  bool is_output(std::size_t id) const;

  /// @return the id of @p label
  /// @throw std::out_of_range if @p label is not part of the problem
  std::size_t id_of(std::string_view label) const;
};

///
/// \param tensors the inputs
/// \return labels held by exactly one of @p tensors , in order of first
///         appearance
/// \throw AmbiguousContractionError if a label is held by three or more
///        tensors
///
LabelList default_output(const container::vector<Tensor>& tensors);

///
/// \param tensors the inputs
/// \param output labels of the result; default_output(tensors) if unset
/// \return the problem of contracting @p tensors to @p output
/// \note labels held by a single input and absent from @p output are summed
///       over before contraction; they do not appear in the problem
/// \throw AmbiguousContractionError see default_output()
/// \throw std::invalid_argument if an output label is repeated or held by
///        no input
/// \throw ShapeError if the inputs disagree on the extent of an index
///
ContractionProblem make_problem(const container::vector<Tensor>& tensors,
                                const std::optional<LabelList>& output);

}  // namespace qunet::opt

#endif  // QUNET_CORE_OPTIMIZE_PROBLEM_HPP
