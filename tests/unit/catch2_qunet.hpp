#ifndef QUNET_TESTS_CATCH2_QUNET_H
#define QUNET_TESTS_CATCH2_QUNET_H

#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_templated.hpp>

#include <QuNet/core/array.hpp>
#include <QuNet/core/index.hpp>
#include <QuNet/core/tensor.hpp>
#include <QuNet/core/tensor_network.hpp>

#include <cmath>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace Catch {

// Make sure Catch uses proper string representation for QuNet types

template <>
struct StringMaker<qunet::Index> {
  static std::string convert(const qunet::Index& idx) {
    std::ostringstream oss;
    oss << idx;
    return oss.str();
  }
};

template <>
struct StringMaker<qunet::Tensor> {
  static std::string convert(const qunet::Tensor& t) {
    std::ostringstream oss;
    oss << t;
    return oss.str();
  }
};

template <>
struct StringMaker<qunet::TensorNetwork> {
  static std::string convert(const qunet::TensorNetwork& tn) {
    std::ostringstream oss;
    oss << tn;
    return oss.str();
  }
};

}  // namespace Catch

namespace qunet::test {

/// @return a tensor with normally distributed elements
inline Tensor random_tensor(const std::vector<std::string>& labels,
                            const std::vector<std::size_t>& extents,
                            std::uint64_t seed, TagSet tags = {}) {
  Array::shape_type shape(extents.begin(), extents.end());
  return Tensor::from_labels(Array::random(std::move(shape), seed), labels,
                             std::move(tags));
}

inline double relative_error(double approx, double exact) {
  return std::abs(approx - exact) / std::abs(exact);
}

/// matches tensors with the same indices (in any order) and elements
/// agreeing within tolerance
struct TensorCloseMatcher : Catch::Matchers::MatcherGenericBase {
  TensorCloseMatcher(Tensor expected, double rtol, double atol)
      : expected_(std::move(expected)), rtol_(rtol), atol_(atol) {}

  bool match(const Tensor& t) const {
    return t.allclose(expected_, rtol_, atol_);
  }

  std::string describe() const override {
    return "is close to " + Catch::StringMaker<Tensor>::convert(expected_);
  }

 private:
  Tensor expected_;
  double rtol_;
  double atol_;
};

inline TensorCloseMatcher IsCloseTo(Tensor expected, double rtol = 1e-10,
                                    double atol = 1e-10) {
  return TensorCloseMatcher(std::move(expected), rtol, atol);
}

}  // namespace qunet::test

#endif  // QUNET_TESTS_CATCH2_QUNET_H
