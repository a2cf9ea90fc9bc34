#include <QuNet/core/truncation_report.hpp>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <utility>

namespace qunet {

void TruncationReport::add(std::string where, double discarded) {
  records_.push_back(Record{std::move(where), discarded});
}

TruncationReport& TruncationReport::merge(const TruncationReport& other) {
  records_.insert(records_.end(), other.records_.begin(),
                  other.records_.end());
  return *this;
}

double TruncationReport::total() const {
  double result = 0;
  for (auto&& r : records_) result += r.discarded;
  return result;
}

double TruncationReport::max() const {
  double result = 0;
  for (auto&& r : records_) result = std::max(result, r.discarded);
  return result;
}

container::vector<TruncationReport::Record> TruncationReport::exceeding(
    double tol) const {
  container::vector<Record> result;
  std::copy_if(records_.begin(), records_.end(), std::back_inserter(result),
               [tol](const Record& r) { return r.discarded > tol; });
  return result;
}

std::ostream& operator<<(std::ostream& os, const TruncationReport& report) {
  os << "TruncationReport(bonds=" << report.size()
     << ", total=" << report.total() << ", max=" << report.max() << ")";
  return os;
}

}  // namespace qunet
