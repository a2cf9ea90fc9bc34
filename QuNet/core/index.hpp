#ifndef QUNET_CORE_INDEX_HPP
#define QUNET_CORE_INDEX_HPP

#include <QuNet/core/container.hpp>

#include <boost/container_hash/hash.hpp>

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

namespace qunet {

/// @brief a named dimension shared by the tensors that reference it

/// Two Index objects are the same edge of a tensor network iff their labels
/// are equal; the extent must then agree, which is checked by the Tensor
/// and TensorNetwork operations that bring them together.
class Index {
 public:
  Index() = default;

  /// @param label the label of the index
  /// @param extent the dimension, must be positive
  /// @throw std::invalid_argument if @p extent is zero or @p label is empty
  Index(std::string label, std::size_t extent);

  const std::string &label() const noexcept { return label_; }
  std::size_t extent() const noexcept { return extent_; }

  /// @return copy of this with a new label
  Index relabeled(std::string label) const;

  /// @brief makes an index with a label unique within this process
  /// @param extent the dimension
  /// @param prefix prefix of the generated label
  static Index make_unique(std::size_t extent, std::string_view prefix = "_");
  /// @return a label unique within this process
  static std::string make_unique_label(std::string_view prefix = "_");
  /// resets the counter used by make_unique(); for reproducible tests only
  static void reset_unique_counter() noexcept;

  /// compares labels only
  struct LabelCompare {
    using is_transparent = void;
    bool operator()(const Index &a, const Index &b) const {
      return a.label() < b.label();
    }
    bool operator()(const Index &a, std::string_view b) const {
      return a.label() < b;
    }
    bool operator()(std::string_view a, const Index &b) const {
      return a < b.label();
    }
  };

  friend bool operator==(const Index &a, const Index &b) noexcept {
    return a.label_ == b.label_ && a.extent_ == b.extent_;
  }
  friend bool operator!=(const Index &a, const Index &b) noexcept {
    return !(a == b);
  }
  friend bool operator<(const Index &a, const Index &b) noexcept {
    return a.label_ < b.label_ ||
           (a.label_ == b.label_ && a.extent_ < b.extent_);
  }

  std::size_t hash_value() const {
    std::size_t seed = std::hash<std::string>{}(label_);
    boost::hash_combine(seed, extent_);
    return seed;
  }

 private:
  std::string label_;
  std::size_t extent_ = 1;

  static std::atomic<std::size_t> &unique_counter();
};

inline std::size_t hash_value(const Index &idx) { return idx.hash_value(); }

std::ostream &operator<<(std::ostream &os, const Index &idx);

using IndexList = container::svector<Index>;
using LabelList = container::svector<std::string>;

/// @return labels of @p indices, in order
LabelList labels(const IndexList &indices);

}  // namespace qunet

#endif  // QUNET_CORE_INDEX_HPP
