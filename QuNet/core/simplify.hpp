#ifndef QUNET_CORE_SIMPLIFY_HPP
#define QUNET_CORE_SIMPLIFY_HPP

#include <QuNet/core/options.hpp>
#include <QuNet/core/tensor.hpp>
#include <QuNet/core/tensor_network.hpp>

namespace qunet {

/// @name value-preserving rewrites
/// Each rewrite returns true if it changed @p tn . None of them sums over or
/// removes a label in @p output ; the contraction of @p tn to @p output is
/// unchanged up to rounding.
/// @{

///
/// Rank simplification ('R'): fixes extent-1 inner indices at 0, then
/// contracts neighboring pairs whose result has no more indices than the
/// larger of the two (and at most `opts.max_rank`, if set). Dangling vectors
/// and matrices are absorbed this way.
///
bool rank_simplify(TensorNetwork& tn, const LabelSet& output,
                   const SimplifyOptions& opts);

///
/// Diagonal reduction ('D'): a tensor that is diagonal in two equal-extent
/// indices `i`, `j` (off-diagonal elements at most `opts.atol`) keeps only
/// the diagonal, and `j` is renamed to `i` in every other tensor holding it.
/// This may create hyperindices. Two output labels are never merged.
///
bool diagonal_reduce(TensorNetwork& tn, const LabelSet& output,
                     const SimplifyOptions& opts);

///
/// Column reduction ('C'): if a tensor has only one slice along an inner
/// index that exceeds `opts.atol`, every tensor holding that index is fixed
/// at that slice and the index disappears.
///
bool column_reduce(TensorNetwork& tn, const LabelSet& output,
                   const SimplifyOptions& opts);

///
/// Split simplification ('S'): a tensor whose matricization across some
/// bipartition of its indices has numerical rank below both sides' sizes is
/// replaced by the two factors of a truncated SVD.
///
bool split_simplify(TensorNetwork& tn, const LabelSet& output,
                    const SimplifyOptions& opts);

///
/// Hyperindex resolution ('H'): each index held by three or more tensors (or
/// by two or more when it is an output label) is replaced by fresh bonds
/// joining the holders to a COPY tensor; afterwards every inner index is a
/// plain bond.
///
bool resolve_hyperindices(TensorNetwork& tn, const LabelSet& output);

///
/// Multiplies each rank-0 tensor into a neighbor-free other tensor, if the
/// network has one, and removes it.
///
bool absorb_scalars(TensorNetwork& tn);

/// @}

///
/// Runs the rewrites named by `opts.sequence` in order, with absorb_scalars()
/// after each, until a whole pass changes nothing or `opts.max_passes`
/// passes were made. 'S' is only kept if, together with the rank
/// simplification that follows it, it lowers the tensor or index count.
/// Without 'H' the number of tensors and of indices never grows.
///
/// \param opts `opts.output_inds` defaults to the outer indices of @p tn
/// \throw std::invalid_argument for an unknown letter in `opts.sequence`
///
TensorNetwork& full_simplify(TensorNetwork& tn, const SimplifyOptions& opts);

}  // namespace qunet

#endif  // QUNET_CORE_SIMPLIFY_HPP
