#ifndef QUNET_CORE_OPTIMIZE_SLICING_HPP
#define QUNET_CORE_OPTIMIZE_SLICING_HPP

#include <QuNet/core/index.hpp>
#include <QuNet/core/optimize/path.hpp>
#include <QuNet/core/optimize/problem.hpp>

#include <cstddef>

namespace qunet::opt {

/// indices chosen for slicing and the cost of one slice
struct Slicing {
  /// sliced index ids, in the order they were chosen
  container::svector<std::size_t> ids;
  /// labels of the sliced indices
  LabelList labels;
  /// product of the extents of the sliced indices
  std::size_t num_slices = 1;
  /// cost of contracting one slice along the path
  PathInfo info;
};

///
/// \return @p problem with the extents of @p ids set to 1
///
ContractionProblem sliced(const ContractionProblem& problem,
                          const container::svector<std::size_t>& ids);

///
/// Chooses indices to slice, one at a time, until the width of @p path is at
/// most @p target_width . Each time the index lowering the width most is
/// taken (it may leave the width unchanged when several intermediates share
/// the maximum); ties go to the lowest total flops over all slices, then to the
/// lowest id. Output indices are never sliced.
///
/// \throw ResourceExhaustion if slicing every candidate index does not reach
///        @p target_width
///
Slicing find_slices(const ContractionProblem& problem,
                    const ContractionPath& path, double target_width);

}  // namespace qunet::opt

#endif  // QUNET_CORE_OPTIMIZE_SLICING_HPP
