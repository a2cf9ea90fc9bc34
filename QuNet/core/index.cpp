#include <QuNet/core/index.hpp>

#include <ostream>
#include <stdexcept>

namespace qunet {

Index::Index(std::string label, std::size_t extent)
    : label_(std::move(label)), extent_(extent) {
  if (extent_ == 0)
    throw std::invalid_argument("Index(" + label_ + "): extent must be > 0");
  if (label_.empty())
    throw std::invalid_argument("Index: label must be non-empty");
}

Index Index::relabeled(std::string label) const {
  return Index(std::move(label), extent_);
}

std::atomic<std::size_t> &Index::unique_counter() {
  static std::atomic<std::size_t> counter{0};
  return counter;
}

std::string Index::make_unique_label(std::string_view prefix) {
  return std::string(prefix) + std::to_string(unique_counter().fetch_add(1));
}

Index Index::make_unique(std::size_t extent, std::string_view prefix) {
  return Index(make_unique_label(prefix), extent);
}

void Index::reset_unique_counter() noexcept { unique_counter() = 0; }

std::ostream &operator<<(std::ostream &os, const Index &idx) {
  os << idx.label() << "[" << idx.extent() << "]";
  return os;
}

LabelList labels(const IndexList &indices) {
  LabelList result;
  result.reserve(indices.size());
  for (auto &&idx : indices) result.push_back(idx.label());
  return result;
}

}  // namespace qunet
