#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "catch2_qunet.hpp"

#include <QuNet/core/array.hpp>
#include <QuNet/core/linalg.hpp>

#include <cmath>

TEST_CASE("linalg", "[linalg]") {
  using namespace qunet;
  using namespace qunet::linalg;
  using Catch::Approx;

  const Matrix m = as_matrix(Array::random({5, 3}, 11), 5, 3);

  SECTION("views") {
    const Array a({2, 2}, {1, 2, 3, 4});
    const auto v = as_matrix(a, 2, 2);
    CHECK(v(0, 1) == 2);
    CHECK(v(1, 0) == 3);
    CHECK(to_array(v).allclose(a));
  }

  SECTION("svd") {
    const auto [U, s, Vh] = svd(m);
    CHECK(U.cols() == 3);
    CHECK(Vh.rows() == 3);
    CHECK((U * s.asDiagonal() * Vh - m).norm() < 1e-12);
    CHECK(s(0) >= s(1));
    CHECK(s(1) >= s(2));
    CHECK((U.transpose() * U - Matrix::Identity(3, 3)).norm() < 1e-12);
  }

  SECTION("qr and lq") {
    const auto [Q, R] = qr(m);
    CHECK((Q * R - m).norm() < 1e-12);
    CHECK((Q.transpose() * Q - Matrix::Identity(3, 3)).norm() < 1e-12);

    const Matrix w = m.transpose();
    const auto [L, Q2] = lq(w);
    CHECK((L * Q2 - w).norm() < 1e-12);
    CHECK((Q2 * Q2.transpose() - Matrix::Identity(3, 3)).norm() < 1e-12);
  }

  SECTION("eigh") {
    const Matrix sym = m.transpose() * m;
    const auto [w, V] = eigh(sym);
    CHECK((V * w.asDiagonal() * V.transpose() - sym).norm() < 1e-10);
    CHECK(std::abs(w(0)) >= std::abs(w(1)));
    CHECK(std::abs(w(1)) >= std::abs(w(2)));
  }

  SECTION("truncation") {
    Vector s(4);
    s << 1, 0.1, 1e-3, 1e-12;

    auto rel = truncation_rank(s, {.cutoff = 1e-2});
    CHECK(rel.rank == 2);
    CHECK(rel.discarded == Approx(1e-3));

    CHECK(truncation_rank(s, {.cutoff = 0.05, .cutoff_mode = CutoffMode::Abs})
              .rank == 2);
    CHECK(truncation_rank(s, TruncationOptions::exact()).rank == 4);
    CHECK(truncation_rank(s, {.cutoff = 1e-5,
                              .cutoff_mode = CutoffMode::SumSquares})
              .rank == 2);
    CHECK(truncation_rank(s, {.cutoff = 1e-2,
                              .cutoff_mode = CutoffMode::RelSumSquares})
              .rank == 1);

    const auto capped = truncation_rank(s, {.cutoff = 0, .max_bond = 1});
    CHECK(capped.rank == 1);
    CHECK(capped.discarded ==
          Approx(std::sqrt(0.01 + 1e-6 + 1e-24)));

    // at least one value survives
    Vector zeros = Vector::Zero(3);
    CHECK(truncation_rank(zeros, {}).rank == 1);
  }
}
