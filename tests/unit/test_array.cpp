#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "catch2_qunet.hpp"

#include <QuNet/core/array.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <cmath>
#include <vector>

TEST_CASE("array", "[array]") {
  using namespace qunet;
  using Catch::Approx;

  const Array a({2, 3}, {1, 2, 3, 4, 5, 6});

  SECTION("constructors") {
    REQUIRE_NOTHROW(Array{});
    CHECK(Array{}.rank() == 0);
    CHECK(Array{}.size() == 1);
    CHECK(Array::scalar(2.5)[0] == 2.5);
    CHECK(a.rank() == 2);
    CHECK(a.size() == 6);
    CHECK(a.extent(1) == 3);
    REQUIRE_THROWS_AS(Array({2, 2}, {1, 2, 3}), ShapeError);
    CHECK(Array(Array::shape_type{2, 2}).norm() == 0);
  }

  SECTION("element access") {
    CHECK(a({0, 0}) == 1);
    CHECK(a({1, 2}) == 6);
    CHECK(a({0, 2}) == 3);
    CHECK(a.strides() == Array::shape_type{3, 1});
  }

  SECTION("layout") {
    const std::size_t perm[] = {1, 0};
    const auto t = a.permute(perm);
    CHECK(t.shape() == Array::shape_type{3, 2});
    CHECK(t({2, 1}) == 6);
    CHECK(t({0, 1}) == 4);
    CHECK(t({1, 0}) == 2);

    CHECK(a.reshape({3, 2})({2, 1}) == 6);
    CHECK(a.reshape({6})[4] == 5);
    REQUIRE_THROWS_AS(a.reshape({4}), ShapeError);
  }

  SECTION("slices and reductions") {
    const auto row = a.slice(0, 1);
    CHECK(row.shape() == Array::shape_type{3});
    CHECK(row[2] == 6);
    const auto col = a.slice(1, 0);
    CHECK(col[0] == 1);
    CHECK(col[1] == 4);

    const auto s0 = a.sum(0);
    CHECK(s0.allclose(Array({3}, {5, 7, 9})));
    const auto s1 = a.sum(1);
    CHECK(s1.allclose(Array({2}, {6, 15})));
  }

  SECTION("diagonals") {
    const Array m({2, 2}, {1, 0, 0, 2});
    CHECK(m.is_diagonal(0, 1, 0));
    CHECK(m.diagonal(0, 1).allclose(Array({2}, {1, 2})));
    CHECK(m.trace(0, 1)[0] == 3);

    const Array almost({2, 2}, {1, 1e-3, 0, 2});
    CHECK(almost.is_diagonal(0, 1, 1e-2));
    CHECK_FALSE(almost.is_diagonal(0, 1, 1e-4));

    // diagonal of the first and last axis of a rank-3 array
    const Array t({2, 3, 2}, {1, 0, 2, 0, 3, 0, 0, 4, 0, 5, 0, 6});
    CHECK(t.is_diagonal(0, 2, 0));
    const auto d = t.diagonal(0, 2);
    CHECK(d.shape() == Array::shape_type{2, 3});
    CHECK(d.allclose(Array({2, 3}, {1, 2, 3, 4, 5, 6})));
  }

  SECTION("nonzero slices") {
    const Array m({3, 2}, {0, 0, 1, 0, 0, 0});
    CHECK(m.nonzero_slices(0, 1e-12) == std::vector<std::size_t>{1});
    CHECK(m.nonzero_slices(1, 1e-12) == std::vector<std::size_t>{0});
    CHECK(Array({2}, {0, 0}).nonzero_slices(0, 1e-12).empty());
  }

  SECTION("special arrays") {
    const auto delta = Array::delta(3, 2);
    CHECK(delta.size() == 8);
    CHECK(delta({0, 0, 0}) == 1);
    CHECK(delta({1, 1, 1}) == 1);
    CHECK(delta({0, 1, 1}) == 0);
    CHECK(delta.norm() == Approx(std::sqrt(2.)));
    CHECK(Array::identity(2).allclose(Array({2, 2}, {1, 0, 0, 1})));

    CHECK(Array::random({3, 3}, 7).allclose(Array::random({3, 3}, 7)));
    CHECK_FALSE(Array::random({3, 3}, 7).allclose(Array::random({3, 3}, 8)));
  }

  SECTION("algebra") {
    CHECK(Array({2}, {3, 4}).norm() == Approx(5));
    Array b = a;
    b += a;
    CHECK(b({1, 2}) == 12);
    b *= 0.5;
    CHECK(b.allclose(a));
    REQUIRE_THROWS_AS(b += Array({3}, {1, 2, 3}), ShapeError);
  }

  SECTION("annotated permute") {
    const auto t = Array::random({2, 3, 4}, 3);
    const auto p = t.permute({0, 1, 2}, {2, 0, 1});
    CHECK(p.shape() == Array::shape_type{4, 2, 3});
    for (std::size_t i = 0; i != 2; ++i)
      for (std::size_t j = 0; j != 3; ++j)
        for (std::size_t k = 0; k != 4; ++k)
          CHECK(p({k, i, j}) == t({i, j, k}));
    CHECK(t.permute({5, 6, 7}, {5, 6, 7}).allclose(t));
  }

  SECTION("annotated contraction") {
    const auto x = Array::random({2, 3, 4}, 4);
    const auto y = Array::random({4, 3, 5}, 5);

    // matrix product over k, j: C(i,l) = sum_jk X(i,j,k) Y(k,j,l)
    const auto c = contract(x, {0, 1, 2}, y, {2, 1, 3}, {3, 0});
    REQUIRE(c.shape() == Array::shape_type{5, 2});
    for (std::size_t i = 0; i != 2; ++i)
      for (std::size_t l = 0; l != 5; ++l) {
        double expected = 0;
        for (std::size_t j = 0; j != 3; ++j)
          for (std::size_t k = 0; k != 4; ++k)
            expected += x({i, j, k}) * y({k, j, l});
        CHECK(c({l, i}) == Approx(expected));
      }

    // j is kept by both operands and the result
    const auto h = contract(x, {0, 1, 2}, y, {2, 1, 3}, {3, 1, 0});
    REQUIRE(h.shape() == Array::shape_type{5, 3, 2});
    for (std::size_t i = 0; i != 2; ++i)
      for (std::size_t j = 0; j != 3; ++j)
        for (std::size_t l = 0; l != 5; ++l) {
          double expected = 0;
          for (std::size_t k = 0; k != 4; ++k)
            expected += x({i, j, k}) * y({k, j, l});
          CHECK(h({l, j, i}) == Approx(expected));
        }

    // full contraction with the operands in different axis orders
    const auto yt = x.permute({0, 1, 2}, {1, 2, 0});
    const auto s = contract(x, {0, 1, 2}, yt, {1, 2, 0}, {});
    CHECK(s.rank() == 0);
    CHECK(s[0] == Approx(x.norm() * x.norm()));

    // a rank-0 operand scales the other
    const auto scaled = contract(Array::scalar(2), {}, x, {0, 1, 2}, {2, 0, 1});
    CHECK(scaled.allclose(x.permute({0, 1, 2}, {2, 0, 1}).scale(2)));

    REQUIRE_THROWS_AS(contract(x, {0, 1, 2}, y, {1, 2, 3}, {0, 3}), ShapeError);
  }
}
