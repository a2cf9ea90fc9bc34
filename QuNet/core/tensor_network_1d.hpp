#ifndef QUNET_CORE_TENSOR_NETWORK_1D_HPP
#define QUNET_CORE_TENSOR_NETWORK_1D_HPP

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
#include <string_view>

namespace qunet {

/// how gate_split() applies a two-site gate
enum class GateContract {
  /// contract the gate with both sites, then split with truncation
  Contract,
  /// factor the gate by SVD and absorb one half into each site; the bond
  /// grows by the rank of the gate
  SplitGate,
  /// SplitGate if its bond is not larger than that of Contract, Contract
  /// otherwise
  AutoSplitGate,
  /// for sites that are not neighbors: swap one site next to the other,
  /// apply with AutoSplitGate, swap back; each swap is truncated
  SwapSplitGate
};

/// @brief controls gate_split()
struct GateOptions {
  GateContract contract = GateContract::AutoSplitGate;
  /// truncation of the split (Contract) and of each swap (SwapSplitGate)
  TruncationOptions truncation = {};
};

///
/// @brief a chain of L tensors
///
/// Site `i` is the unique tensor tagged site_tag(i) ("I{i}") and holds the
/// outer index site_ind(i) ("k{i}"). Bonds join sites `i` and `i+1`, and
/// site `L-1` with site 0 if the chain is cyclic.
///
/// The chain tracks which sites are isometries after canonization, so that
/// repeated canonize() calls only move the orthogonality center.
///
class TensorNetwork1D {
 public:
  /// @throw std::invalid_argument if some site has no unique tensor or lacks
  ///        its site index
  TensorNetwork1D(TensorNetwork network, std::size_t L, bool cyclic = false);

  /// @name builders
  /// @{

  /// @param arrays one per site, with axes (left bond, right bond,
  ///        physical); the first site of an open chain has no left bond and
  ///        the last no right bond
  /// @throw std::invalid_argument if an array has the wrong rank
  /// @throw ShapeError if neighboring bond extents disagree
  static TensorNetwork1D from_arrays(const container::vector<Array>& arrays,
                                     bool cyclic = false);

  /// @return a chain with bonds of extent 1 holding @p vectors
  static TensorNetwork1D product_state(
      const container::vector<container::vector<double>>& vectors);

  /// @param bits a string of '0' and '1'
  /// @throw std::invalid_argument for any other character
  static TensorNetwork1D computational_state(std::string_view bits);

  /// @return a chain of normally distributed tensors; site `i` is drawn with
  /// seed `seed + i`
  static TensorNetwork1D random(std::size_t L, std::size_t bond_dim,
                                std::size_t phys_dim = 2,
                                std::uint64_t seed = 42, bool cyclic = false);
  /// @}

  static std::string site_tag(std::size_t i);
  static std::string site_ind(std::size_t i);

  std::size_t L() const noexcept { return L_; }
  bool cyclic() const noexcept { return cyclic_; }
  const TensorNetwork& network() const noexcept { return network_; }

  /// @name queries
  /// @{
  TensorId site_id(std::size_t i) const;
  const Tensor& operator[](std::size_t i) const;
  /// @return the label of the bond between sites @p i and @p j
  /// @throw std::invalid_argument if the sites share no single bond
  std::string bond(std::size_t i, std::size_t j) const;
  std::size_t bond_size(std::size_t i, std::size_t j) const;
  std::size_t max_bond() const { return network_.max_bond(); }
  /// @return extents of the bonds (0,1), (1,2), ..., and (L-1,0) if cyclic
  container::vector<std::size_t> bond_sizes() const;
  std::size_t phys_dim(std::size_t i) const;
  /// @return the site whose neighbors are all isometries pointing to it, if
  /// known
  std::optional<std::size_t> orthogonality_center() const;
  /// @}

  /// @name canonical form (open chains only)
  /// QR sweeps, nothing is truncated.
  /// @throw std::logic_error for a cyclic chain
  /// @{

  /// makes sites `0..stop-1` left isometries
  TensorNetwork1D& left_canonize(std::optional<std::size_t> stop = {});
  /// makes sites `stop+1..L-1` right isometries
  TensorNetwork1D& right_canonize(std::size_t stop = 0);
  /// moves the orthogonality center to @p where
  TensorNetwork1D& canonize(std::size_t where);
  /// @}

  /// @brief truncates every bond
  ///
  /// Left-canonizes, then sweeps right to left truncating each bond with
  /// @p opts (the default context's if unset) while the orthogonality center
  /// sits next to it; the center ends at site 0, or at @p form if given.
  /// @return the discarded weight of each bond
  /// @throw std::logic_error for a cyclic chain
  TruncationReport compress(const std::optional<TruncationOptions>& opts = {},
                            std::optional<std::size_t> form = {});

  /// @name gates
  /// A gate is an Array with axes (outputs..., inputs...) acting on the
  /// site indices.
  /// @{

  /// applies the @p p x @p p gate @p G to site @p i
  /// @throw ShapeError if @p G does not match the site index
  TensorNetwork1D& gate(const Array& G, std::size_t i);

  /// applies the two-site gate @p G to sites @p i and @p j ; @p G has axes
  /// (out_i, out_j, in_i, in_j) or is the corresponding square matrix.
  /// Sites that are not neighbors are always handled as
  /// GateContract::SwapSplitGate.
  /// @return the discarded weight of every truncated bond
  /// @throw std::invalid_argument if `i == j`
  /// @throw ShapeError if @p G does not match the site indices
  TruncationReport gate_split(const Array& G, std::size_t i, std::size_t j,
                              const GateOptions& opts = {});
  /// @}

  /// @return the contracted chain with one axis per site
  Array to_dense(const std::optional<ContractOptions>& opts = {}) const;
  double norm() const;
  /// @return <this|other>, contracting the site indices
  /// @throw std::invalid_argument if the lengths differ
  double overlap(const TensorNetwork1D& other) const;

 private:
  TensorNetwork network_;
  std::size_t L_;
  bool cyclic_;
  /// sites [0, left_iso_) are left isometries
  std::size_t left_iso_ = 0;
  /// sites [right_iso_, L) are right isometries
  std::size_t right_iso_;

  void check_open(std::string_view what) const;
  void check_site(std::size_t i) const;
  bool adjacent(std::size_t i, std::size_t j) const;
  /// forgets isometries of sites [lo, hi]
  void touched(std::size_t lo, std::size_t hi);
  /// the outer index currently held by site @p i
  std::string phys_label(std::size_t i) const;
  /// applies @p G to the outer indices @p li of site @p i and @p lj of the
  /// neighboring site @p j
  double gate_neighbors(const Array& G, std::size_t i, std::size_t j,
                        const std::string& li, const std::string& lj,
                        GateContract mode, const TruncationOptions& opts);
  /// exchanges the outer indices of neighboring sites @p i and @p j
  double swap_sites(std::size_t i, std::size_t j,
                    const TruncationOptions& opts);
};

std::ostream& operator<<(std::ostream& os, const TensorNetwork1D& tn);

}  // namespace qunet

#endif  // QUNET_CORE_TENSOR_NETWORK_1D_HPP
