#ifndef QUNET_CORE_OPTIMIZE_PATH_HPP
#define QUNET_CORE_OPTIMIZE_PATH_HPP

#include <QuNet/core/container.hpp>
#include <QuNet/core/optimize/problem.hpp>

#include <cstddef>
#include <iosfwd>
#include <utility>

namespace qunet::opt {

///
/// A contraction order in static single assignment form: the inputs have ids
/// `0 .. n-1`, and step `k` contracts the two tensors with the ids in
/// `steps[k]`, producing the tensor with id `n + k`. A complete path for `n`
/// inputs has `n - 1` steps.
///
struct ContractionPath {
  container::vector<std::pair<std::size_t, std::size_t>> steps;

  std::size_t size() const noexcept { return steps.size(); }
  bool empty() const noexcept { return steps.empty(); }
};

std::ostream& operator<<(std::ostream& os, const ContractionPath& path);

/// cost of a contraction path
struct PathInfo {
  /// total number of multiply-adds
  double flops = 0;
  /// log2 of max_size
  double width = 0;
  /// element count of the largest intermediate
  double max_size = 1;
  /// element count of the result of each step
  container::vector<double> sizes;
};

///
/// \return the cost of contracting @p problem along @p path
/// \throw std::invalid_argument if @p path is not a complete path of
///        @p problem
///
PathInfo evaluate(const ContractionProblem& problem,
                  const ContractionPath& path);

namespace detail {

///
/// The tensors alive while a path is being built, with the indices each one
/// holds. An index is kept by the result of a step if it is an output index
/// or is still held by a tensor that does not take part in the step.
///
class PathState {
 public:
  explicit PathState(const ContractionProblem& problem);

  const ContractionProblem& problem() const noexcept { return *problem_; }

  bool alive(std::size_t id) const { return id < alive_.size() && alive_[id]; }
  const IndexIdSet& indices(std::size_t id) const { return sets_.at(id); }
  /// ids of the live tensors, ascending
  container::vector<std::size_t> live() const;
  std::size_t num_alive() const noexcept { return num_alive_; }
  /// ids of the live tensors holding index @p index
  const container::set<std::size_t>& holders(std::size_t index) const {
    return holders_.at(index);
  }

  /// \return the indices of the result of contracting @p a and @p b
  IndexIdSet result_indices(std::size_t a, std::size_t b) const;
  /// \return number of multiply-adds of contracting @p a and @p b
  double flops(std::size_t a, std::size_t b) const;
  /// \return element count of a tensor holding @p indices
  double size(const IndexIdSet& indices) const;
  double size(std::size_t id) const { return size(indices(id)); }

  /// contracts @p a and @p b
  /// \return the id of the result
  std::size_t contract(std::size_t a, std::size_t b);

 private:
  const ContractionProblem* problem_;
  container::vector<IndexIdSet> sets_;
  container::vector<bool> alive_;
  container::vector<container::set<std::size_t>> holders_;
  std::size_t num_alive_ = 0;
};

/// \return the sorted union of @p a and @p b
IndexIdSet set_union(const IndexIdSet& a, const IndexIdSet& b);

}  // namespace detail

}  // namespace qunet::opt

#endif  // QUNET_CORE_OPTIMIZE_PATH_HPP
