#ifndef QUNET_CORE_CONTRACT_HPP
#define QUNET_CORE_CONTRACT_HPP

#include <QuNet/core/container.hpp>
#include <QuNet/core/index.hpp>
#include <QuNet/core/optimize.hpp>
#include <QuNet/core/options.hpp>
#include <QuNet/core/tensor.hpp>

#include <cstddef>
#include <optional>

namespace qunet {

/// how a set of tensors will be contracted
struct ContractionPlan {
  /// labels of the result, in order
  LabelList output;
  opt::ContractionProblem problem;
  opt::ContractionPath path;
  /// cost of the path without slicing
  opt::PathInfo info;
  /// sliced labels; empty unless slicing was needed
  LabelList sliced;
  std::size_t num_slices = 1;
};

///
/// Finds the contraction path of @p tensors and checks it against the width
/// budget of @p opts .
///
/// \param tensors the inputs
/// \param output labels of the result; by default the labels held by exactly
///        one input
/// \param opts path strategy and width budget
/// \throw AmbiguousContractionError if @p output is unset and hyperindices
///        are present
/// \throw ResourceExhaustion if the width exceeds `opts.max_width` and
///        `opts.slice` is false, or slicing cannot meet the budget
///
ContractionPlan plan_contraction(const container::vector<Tensor>& tensors,
                                 const std::optional<LabelList>& output,
                                 const ContractOptions& opts);

///
/// Contracts @p tensors pairwise along @p path . A label shared by the two
/// operands of a step is summed unless it is in @p output or still held by
/// another live tensor, in which case it is kept as a batch index.
///
/// \param tensors the inputs; labels held by one input and absent from
///        @p output must have been summed already
/// \param output labels of the result, in order
/// \return the result, transposed to @p output
///
Tensor execute_path(container::vector<Tensor> tensors,
                    const opt::ContractionPath& path, const LabelList& output);

///
/// Contracts @p tensors into one tensor: plans the contraction, sums labels
/// held by a single input that are not requested, then executes the path,
/// slice by slice if the plan requires it. No tensor of @p tensors is
/// modified until the plan has been accepted.
///
/// \return the result with indices @p output (in that order); an empty set of
///         tensors contracts to the scalar 1
/// \sa plan_contraction() for the exceptions
///
Tensor contract_tensors(container::vector<Tensor> tensors,
                        const std::optional<LabelList>& output,
                        const ContractOptions& opts);

}  // namespace qunet

#endif  // QUNET_CORE_CONTRACT_HPP
