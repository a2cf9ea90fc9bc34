#ifndef QUNET_CORE_TENSOR_NETWORK_2D_HPP
#define QUNET_CORE_TENSOR_NETWORK_2D_HPP

#include <QuNet/core/array.hpp>
#include <QuNet/core/container.hpp>
#include <QuNet/core/options.hpp>
#include <QuNet/core/tensor.hpp>
#include <QuNet/core/tensor_network.hpp>
#include <QuNet/core/truncation_report.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

namespace qunet {

/// @brief controls boundary contraction of a TensorNetwork2D
struct BoundaryOptions {
  /// compression of the boundary after each absorbed row (or column)
  TruncationOptions truncation = {};
  /// if not empty, the tensors of a row carrying each of these tags are
  /// absorbed and compressed one layer at a time, in this order; otherwise
  /// all tensors of a site are absorbed together
  container::vector<std::string> layer_tags = {};
  /// sides swept before the remainder is contracted exactly: 'b' from row 0,
  /// 't' from row Lx-1, 'l' from column 0, 'r' from column Ly-1. Sweeping
  /// from two opposite sides meets in the middle.
  std::string sequence = "bt";
  /// options of the final exact contraction; the default context's if unset
  std::optional<ContractOptions> contraction = std::nullopt;
};

///
/// @brief a rectangular grid of Lx rows and Ly columns
///
/// Every tensor of site (i, j) carries the tags site_tag(i, j)
/// ("I{i},{j}"), row_tag(i) ("ROW{i}") and col_tag(j) ("COL{j}"); bonds only
/// join neighboring sites. A site may hold several tensors, e.g. the ket and
/// bra layers of a norm network, and holds the outer index site_ind(i, j)
/// ("k{i},{j}") unless it was contracted away.
///
class TensorNetwork2D {
 public:
  /// boundary networks keyed by ("below" | "above", row) or
  /// ("left" | "right", column)
  using Environments =
      container::map<std::pair<std::string, std::size_t>, TensorNetwork>;

  /// @throw std::invalid_argument if some site has no tensor
  TensorNetwork2D(TensorNetwork network, std::size_t Lx, std::size_t Ly);

  /// @param arrays `arrays[i][j]` has axes (below, left, above, right,
  ///        physical), without the bonds that would leave the grid
  /// @param extra_tags added to every tensor
  /// @throw std::invalid_argument if the grid is not rectangular or an array
  ///        has the wrong rank
  /// @throw ShapeError if neighboring bond extents disagree
  static TensorNetwork2D from_arrays(
      const container::vector<container::vector<Array>>& arrays,
      const TagList& extra_tags = {});

  /// @return a grid of normally distributed tensors; site (i, j) is drawn
  /// with seed `seed + i * Ly + j`
  static TensorNetwork2D random(std::size_t Lx, std::size_t Ly,
                                std::size_t bond_dim, std::size_t phys_dim = 2,
                                std::uint64_t seed = 42,
                                const TagList& extra_tags = {});

  static std::string site_tag(std::size_t i, std::size_t j);
  static std::string row_tag(std::size_t i);
  static std::string col_tag(std::size_t j);
  static std::string site_ind(std::size_t i, std::size_t j);

  std::size_t Lx() const noexcept { return Lx_; }
  std::size_t Ly() const noexcept { return Ly_; }
  const TensorNetwork& network() const noexcept { return network_; }

  /// @name queries
  /// @{
  /// @return the tensor of site (i, j)
  /// @throw std::logic_error if the site holds several tensors
  const Tensor& operator()(std::size_t i, std::size_t j) const;
  std::size_t bond_size(std::pair<std::size_t, std::size_t> a,
                        std::pair<std::size_t, std::size_t> b) const;
  std::size_t phys_dim(std::size_t i, std::size_t j) const;
  std::size_t max_bond() const { return network_.max_bond(); }
  TensorNetwork select_row(std::size_t i) const;
  TensorNetwork select_col(std::size_t j) const;
  /// @}

  /// @name building norm networks
  /// @{
  TensorNetwork2D conj() const;
  TensorNetwork2D& retag(const RenameMap& map);
  /// @return a grid holding the tensors of this and @p other ; inner
  /// indices of both are renamed in the copies of @p other
  /// @throw std::invalid_argument if the grids differ in size
  TensorNetwork2D combine(const TensorNetwork2D& other) const;
  /// @return `conj(this) & other` with the layers tagged @p bra and @p ket
  TensorNetwork2D norm_network(const TensorNetwork2D& other,
                               const std::string& bra = "BRA",
                               const std::string& ket = "KET") const;
  /// @return norm_network(*this, bra, ket)
  TensorNetwork2D make_norm(const std::string& bra = "BRA",
                            const std::string& ket = "KET") const;
  /// @}

  /// contracts the tensors of each site into one and fuses parallel bonds
  TensorNetwork2D& flatten(const std::optional<ContractOptions>& opts = {});

  /// @name boundary contraction
  /// @{

  /// @brief approximate contraction to a scalar
  ///
  /// Rows (or columns) are absorbed one at a time into a boundary of one
  /// tensor per column; after each absorption parallel bonds are fused and
  /// the boundary is compressed with `opts.truncation`. The boundaries left
  /// by the sweeps of `opts.sequence` are then contracted exactly.
  /// @throw std::invalid_argument for a bad `opts.sequence`
  double contract_boundary(const BoundaryOptions& opts = {}) const;
  /// same, recording every truncated bond in @p report
  double contract_boundary(const BoundaryOptions& opts,
                           TruncationReport& report) const;

  /// @return for each row `i`, the boundary of rows `0..i-1` ("below", i) and
  /// of rows `i+1..Lx-1` ("above", i); edge environments are empty networks.
  /// `env("below", i) & select_row(i) & env("above", i)` approximates the
  /// whole network.
  Environments compute_row_environments(const BoundaryOptions& opts = {}) const;
  Environments compute_row_environments(const BoundaryOptions& opts,
                                        TruncationReport& report) const;
  /// same as compute_row_environments() for columns, keyed by ("left", j)
  /// and ("right", j)
  Environments compute_col_environments(const BoundaryOptions& opts = {}) const;
  Environments compute_col_environments(const BoundaryOptions& opts,
                                        TruncationReport& report) const;
  /// @}

  /// @return the contracted grid with one axis per site, row-major
  Array to_dense(const std::optional<ContractOptions>& opts = {}) const;

 private:
  TensorNetwork network_;
  std::size_t Lx_;
  std::size_t Ly_;

  /// site tags of row @p k (if @p rows ) or column @p k
  container::vector<std::string> line_sites(bool rows, std::size_t k) const;
  Environments compute_environments(bool rows, const BoundaryOptions& opts,
                                    TruncationReport& report) const;
};

std::ostream& operator<<(std::ostream& os, const TensorNetwork2D& tn);

}  // namespace qunet

#endif  // QUNET_CORE_TENSOR_NETWORK_2D_HPP
