#ifndef QUNET_CORE_OPTIONS_HPP
#define QUNET_CORE_OPTIONS_HPP

#include <QuNet/core/index.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qunet {

/// how tensors are matched by a set of tags
enum class SelectMode {
  /// tensor carries every requested tag
  All,
  /// tensor carries at least one requested tag
  Any
};

/// whether a rename may merge distinct indices/tags
enum class Merge : bool { No = false, Yes = true };

/// factorization used by split()
enum class SplitMethod {
  /// singular value decomposition, supports truncation
  SVD,
  /// QR: left factor is an isometry, no truncation
  QR,
  /// LQ: right factor is an isometry, no truncation
  LQ,
  /// eigendecomposition of a Hermitian positive semidefinite matrix,
  /// supports truncation
  Eigh
};

/// where the singular values go after a split
enum class Absorb {
  /// into the left factor, the right factor is an isometry
  Left,
  /// into the right factor, the left factor is an isometry
  Right,
  /// square root into each factor
  Both,
  /// into neither; returned as a separate diagonal tensor
  None
};

/// how TruncationOptions::cutoff is interpreted
enum class CutoffMode {
  /// discard singular values below cutoff
  Abs,
  /// discard singular values below cutoff * s_max
  Rel,
  /// discard the largest tail whose sum of squares is below cutoff
  SumSquares,
  /// same as SumSquares, relative to the total sum of squares
  RelSumSquares
};

/// library-wide default cutoff, used by Context::Defaults
inline constexpr double default_cutoff = 1e-10;

/// @brief controls truncating factorizations
struct TruncationOptions {
  /// threshold for discarding singular values; 0 disables
  double cutoff = default_cutoff;
  /// interpretation of cutoff
  CutoffMode cutoff_mode = CutoffMode::Rel;
  /// hard cap on the new bond dimension; unset means no cap
  std::optional<std::size_t> max_bond = std::nullopt;
  /// where the singular values are absorbed
  Absorb absorb = Absorb::Both;
  /// factorization method
  SplitMethod method = SplitMethod::SVD;

  /// @return options that never truncate (cutoff 0, no max_bond)
  static TruncationOptions exact();
  /// @return copy of this with absorb set to @p a
  TruncationOptions with(Absorb a) const;
  /// @return copy of this with method set to @p m
  TruncationOptions with(SplitMethod m) const;
};

/// contraction path search strategies
enum class PathStrategy {
  /// cheapest pair first, deterministic
  Greedy,
  /// greedy with Boltzmann-sampled choices, best of several trials
  RandomGreedy,
  /// exhaustive search over subsets
  Optimal,
  /// Optimal for few tensors, Greedy otherwise
  Auto,
  /// Optimal for a dozen tensors, RandomGreedy otherwise
  AutoHQ
};

/// @param name one of "greedy", "random-greedy", "optimal", "auto",
/// "auto-hq"
/// @throw std::invalid_argument for an unknown name
PathStrategy to_path_strategy(std::string_view name);
std::string to_string(PathStrategy strategy);

/// @brief controls contraction of networks
struct ContractOptions {
  PathStrategy strategy = PathStrategy::Auto;
  /// number of trials of PathStrategy::RandomGreedy
  std::size_t max_repeats = 64;
  /// seed of PathStrategy::RandomGreedy; trial k uses seed + k
  std::uint64_t seed = 42;
  /// wall-time budget of PathStrategy::RandomGreedy, in seconds; 0 disables
  double max_time = 0;
  /// budget on log2 of the largest intermediate; unset means unlimited
  std::optional<double> max_width = std::nullopt;
  /// if max_width is exceeded, slice indices to meet it instead of throwing
  /// ResourceExhaustion
  bool slice = false;
  /// Boltzmann temperature of PathStrategy::RandomGreedy
  double temperature = 0.3;
};

/// @brief controls full_simplify()
struct SimplifyOptions {
  /// rewrites to run each pass, in order:
  /// 'D' diagonal reduction, 'C' column reduction, 'R' rank simplification,
  /// 'S' split simplification, 'H' hyperindex resolution
  std::string sequence = "DCRS";
  /// maximum number of passes over sequence
  std::size_t max_passes = 100;
  /// values below this are treated as zero by 'D', 'C' and 'S'
  double atol = 1e-12;
  /// rank cap for tensors produced by 'R'; unset means no cap beyond the
  /// ranks of the merged tensors
  std::optional<std::size_t> max_rank = std::nullopt;
  /// indices that must survive; unset means the outer indices of the input
  std::optional<std::vector<std::string>> output_inds = std::nullopt;
  /// rescale the tensors to a common norm at the end, see
  /// TensorNetwork::equalize_norms()
  bool equalize_norms = false;
};

}  // namespace qunet

#endif  // QUNET_CORE_OPTIONS_HPP
