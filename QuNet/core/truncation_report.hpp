#ifndef QUNET_CORE_TRUNCATION_REPORT_HPP
#define QUNET_CORE_TRUNCATION_REPORT_HPP

#include <QuNet/core/container.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>

namespace qunet {

///
/// @brief collects the weight discarded by truncating splits
///
/// Compression routines record the discarded weight of every bond they
/// touch; exceeding() picks the records above a tolerance.
///
class TruncationReport {
 public:
  struct Record {
    /// the bond or step, e.g. "I3-I4"
    std::string where;
    /// square root of the sum of squares of the discarded singular values
    double discarded;
  };

  void add(std::string where, double discarded);
  /// appends the records of @p other
  TruncationReport& merge(const TruncationReport& other);

  const container::vector<Record>& records() const noexcept {
    return records_;
  }
  std::size_t size() const noexcept { return records_.size(); }
  bool empty() const noexcept { return records_.empty(); }

  /// @return the sum of the discarded weights, a bound on the accumulated
  /// error of a sweep of isometric truncations
  double total() const;
  /// @return the largest discarded weight; 0 if empty
  double max() const;
  /// @return the records whose discarded weight exceeds @p tol
  container::vector<Record> exceeding(double tol) const;

 private:
  container::vector<Record> records_;
};

std::ostream& operator<<(std::ostream& os, const TruncationReport& report);

}  // namespace qunet

#endif  // QUNET_CORE_TRUNCATION_REPORT_HPP
