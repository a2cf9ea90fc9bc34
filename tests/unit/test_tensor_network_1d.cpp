#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "catch2_qunet.hpp"

#include <QuNet/core/linalg.hpp>
#include <QuNet/core/tensor_network_1d.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace qunet;

/// @return true if site @p i contracted with its conjugate over every index
/// but the bond to site @p toward is the identity
bool is_isometry(const TensorNetwork1D& tn, std::size_t i,
                 std::size_t toward) {
  const auto& t = tn[i];
  const auto bond = tn.bond(i, toward);
  LabelList rest;
  for (auto&& label : t.labels())
    if (label != bond) rest.push_back(label);
  const auto cols = t.extent(bond);
  const auto rows = t.size() / cols;
  const auto mat = t.to_matrix(rest);
  const auto m = linalg::as_matrix(mat, rows, cols);
  const linalg::Matrix id = linalg::Matrix::Identity(cols, cols);
  return (m.transpose() * m - id).norm() < 1e-10;
}

double relative_distance(const Array& a, const Array& b) {
  Array diff = b;
  diff *= -1;
  diff += a;
  return diff.norm() / a.norm();
}

const Array pauli_x({2, 2}, {0, 1, 1, 0});
const Array cnot({4, 4}, {1, 0, 0, 0,  //
                          0, 1, 0, 0,  //
                          0, 0, 0, 1,  //
                          0, 0, 1, 0});

}  // namespace

TEST_CASE("TensorNetwork1D", "[tensor_network_1d]") {
  using namespace qunet;
  using Catch::Approx;

  SECTION("builders") {
    const auto psi = TensorNetwork1D::computational_state("0101");
    CHECK(psi.L() == 4);
    CHECK_FALSE(psi.cyclic());
    CHECK(psi.network().num_tensors() == 4);
    CHECK(psi.bond_sizes() == container::vector<std::size_t>{1, 1, 1});
    CHECK(psi.phys_dim(2) == 2);
    CHECK(psi[1].has_tag("I1"));
    CHECK(psi[1].has_index("k1"));
    const auto dense = psi.to_dense();
    CHECK(dense.shape() == Array::shape_type{2, 2, 2, 2});
    CHECK(dense[5] == 1);
    CHECK(dense.norm() == Approx(1));
    CHECK(psi.norm() == Approx(1));

    REQUIRE_THROWS_AS(TensorNetwork1D::computational_state("012"),
                      std::invalid_argument);

    const auto r = TensorNetwork1D::random(5, 3, 2, 7);
    CHECK(r.bond_sizes() == container::vector<std::size_t>{3, 3, 3, 3});
    CHECK(r.max_bond() == 3);
    CHECK(r.bond_size(2, 3) == 3);
    const auto again = TensorNetwork1D::random(5, 3, 2, 7);
    CHECK(r.to_dense().allclose(again.to_dense()));
    CHECK(r.norm() == Approx(r.to_dense().norm()));
    REQUIRE_THROWS_AS(r.bond(0, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(r[5], std::out_of_range);

    CHECK(TensorNetwork1D::site_tag(3) == "I3");
    CHECK(TensorNetwork1D::site_ind(3) == "k3");
  }

  SECTION("validation") {
    // the middle array lacks a bond
    const container::vector<Array> bad_rank{
        Array::random({2, 2}, 1), Array::random({2, 2}, 2),
        Array::random({2, 2}, 3)};
    REQUIRE_THROWS_AS(TensorNetwork1D::from_arrays(bad_rank),
                      std::invalid_argument);

    const container::vector<Array> bad_bond{Array::random({3, 2}, 1),
                                            Array::random({2, 2}, 2)};
    REQUIRE_THROWS_AS(TensorNetwork1D::from_arrays(bad_bond), ShapeError);

    const container::vector<Array> two{Array::random({2, 2, 2}, 1),
                                       Array::random({2, 2, 2}, 2)};
    REQUIRE_THROWS_AS(TensorNetwork1D::from_arrays(two, true),
                      std::invalid_argument);

    auto tn = TensorNetwork1D::random(3, 2).network();
    tn.remove({"I1"});
    REQUIRE_THROWS_AS(TensorNetwork1D(tn, 3), std::invalid_argument);
  }

  SECTION("canonical form") {
    auto psi = TensorNetwork1D::random(6, 4, 2, 11);
    const auto dense = psi.to_dense();
    CHECK_FALSE(psi.orthogonality_center());

    psi.canonize(2);
    REQUIRE(psi.orthogonality_center());
    CHECK(*psi.orthogonality_center() == 2);
    CHECK(is_isometry(psi, 0, 1));
    CHECK(is_isometry(psi, 1, 2));
    CHECK(is_isometry(psi, 3, 2));
    CHECK(is_isometry(psi, 5, 4));
    CHECK(relative_distance(dense, psi.to_dense()) < 1e-10);

    psi.canonize(4);
    CHECK(*psi.orthogonality_center() == 4);
    CHECK(is_isometry(psi, 3, 4));
    CHECK(is_isometry(psi, 5, 4));
    psi.canonize(0);
    CHECK(*psi.orthogonality_center() == 0);
    CHECK(is_isometry(psi, 1, 0));
    CHECK(relative_distance(dense, psi.to_dense()) < 1e-10);

    // the norm sits on the center
    CHECK(psi[0].norm() == Approx(psi.norm()));

    // gates forget the canonical form around them
    psi.gate(pauli_x, 3);
    CHECK_FALSE(psi.orthogonality_center());
  }

  SECTION("compression") {
    // exact bond ranks are 2, 4, 8, 4, 2
    auto psi = TensorNetwork1D::random(6, 8, 2, 13);
    const auto dense = psi.to_dense();
    const auto report = psi.compress(TruncationOptions{.cutoff = 1e-12}, 3);
    CHECK(psi.bond_sizes() ==
          container::vector<std::size_t>{2, 4, 8, 4, 2});
    CHECK(report.size() == 5);
    CHECK(report.records().front().where == "I4-I5");
    CHECK(report.max() < 1e-8 * dense.norm());
    CHECK(*psi.orthogonality_center() == 3);
    CHECK(relative_distance(dense, psi.to_dense()) < 1e-8);

    auto capped = TensorNetwork1D::random(8, 6, 2, 17);
    const auto exact = capped.to_dense();
    const auto lossy = capped.compress(TruncationOptions{.max_bond = 2});
    CHECK(capped.max_bond() == 2);
    CHECK(lossy.max() > 0);
    CHECK(!lossy.exceeding(0).empty());
    CHECK(*capped.orthogonality_center() == 0);
    // the truncated state is no closer to the exact one than the discarded
    // weight allows
    CHECK(relative_distance(exact, capped.to_dense()) <=
          lossy.total() / exact.norm() + 1e-10);
  }

  SECTION("single-site gates") {
    auto psi = TensorNetwork1D::computational_state("0000");
    psi.gate(pauli_x, 1);
    CHECK(psi.to_dense()[4] == 1);
    CHECK(psi[1].labels() ==
          TensorNetwork1D::computational_state("0000")[1].labels());
    REQUIRE_THROWS_AS(psi.gate(Array::identity(3), 0), ShapeError);
  }

  SECTION("two-site gates") {
    for (auto mode : {GateContract::Contract, GateContract::SplitGate,
                      GateContract::AutoSplitGate,
                      GateContract::SwapSplitGate}) {
      auto psi = TensorNetwork1D::computational_state("1000");
      psi.gate_split(cnot, 0, 1, {.contract = mode});
      CHECK(psi.to_dense()[12] == Approx(1));
      CHECK(psi.to_dense().norm() == Approx(1));

      // control on the higher site
      auto phi = TensorNetwork1D::computational_state("0100");
      phi.gate_split(cnot, 1, 0, {.contract = mode});
      CHECK(phi.to_dense()[12] == Approx(1));
    }

    // a rank-4 gate is accepted as well
    auto psi = TensorNetwork1D::computational_state("10");
    psi.gate_split(cnot.reshape({2, 2, 2, 2}), 0, 1);
    CHECK(psi.to_dense()[3] == Approx(1));

    REQUIRE_THROWS_AS(psi.gate_split(cnot, 0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(
        psi.gate_split(cnot, 0, 1,
                       {.truncation = TruncationOptions{}.with(Absorb::None)}),
        std::invalid_argument);
    REQUIRE_THROWS_AS(psi.gate_split(cnot, 0, 2), std::out_of_range);
  }

  SECTION("gate modes") {
    const auto psi = TensorNetwork1D::random(4, 2, 2, 19);
    const auto G = Array::random({4, 4}, 23);
    const GateOptions exact{.contract = GateContract::Contract,
                            .truncation = TruncationOptions::exact()};

    auto contracted = psi;
    contracted.gate_split(G, 1, 2, exact);
    CHECK(contracted.bond_size(1, 2) <= 4);

    auto split = psi;
    split.gate_split(G, 1, 2, {.contract = GateContract::SplitGate});
    CHECK(split.bond_size(1, 2) == 8);
    CHECK(relative_distance(contracted.to_dense(), split.to_dense()) < 1e-10);

    // the split gate would double the bond, so the gate is contracted
    auto automatic = psi;
    automatic.gate_split(G, 1, 2);
    CHECK(automatic.bond_size(1, 2) <= 4);

    // a product gate has rank 1 and is split
    std::vector<double> xx(16, 0.);
    for (std::size_t a = 0; a != 4; ++a) xx[a * 4 + (3 - a)] = 1;
    auto product = psi;
    product.gate_split(Array({4, 4}, xx), 1, 2);
    CHECK(product.bond_size(1, 2) == 2);
  }

  SECTION("distant gates") {
    auto psi = TensorNetwork1D::computational_state("10000");
    const auto report = psi.gate_split(cnot, 0, 3);
    CHECK(psi.to_dense()[16 + 2] == Approx(1));
    CHECK(psi.bond_size(2, 3) == 1);
    CHECK(psi.bond_size(3, 4) == 1);
    // two swaps to bring site 3 next to site 0, the gate, two swaps back
    CHECK(report.size() == 5);
    for (std::size_t i = 0; i != 5; ++i)
      CHECK(psi[i].has_index(TensorNetwork1D::site_ind(i)));

    // entangle distant sites of a random state and compare with the dense
    // application
    auto phi = TensorNetwork1D::random(5, 2, 2, 29);
    const auto before = phi.to_dense();
    phi.gate_split(cnot, 1, 4,
                   {.truncation = TruncationOptions::exact()});
    Array expected(before.shape());
    for (std::size_t ord = 0; ord != before.size(); ++ord) {
      // bits of sites 0..4, most significant first
      std::size_t target = ord;
      if ((ord >> 3) & 1) target ^= 1;
      expected[target] = before[ord];
    }
    CHECK(relative_distance(expected, phi.to_dense()) < 1e-10);
  }

  SECTION("circuit with a bond cap") {
    auto psi = TensorNetwork1D::computational_state(std::string(18, '0'));
    const GateOptions opts{.contract = GateContract::Contract,
                           .truncation = {.max_bond = 2}};
    TruncationReport report;
    std::uint64_t seed = 31;
    for (std::size_t layer = 0; layer != 4; ++layer)
      for (std::size_t i = layer % 2; i + 1 < 18; i += 2)
        report.merge(
            psi.gate_split(Array::random({4, 4}, seed++), i, i + 1, opts));
    CHECK(psi.max_bond() == 2);
    CHECK(psi.network().num_tensors() == 18);
    CHECK(report.max() > 0);
    CHECK(std::isfinite(psi.norm()));
  }

  SECTION("overlaps") {
    const auto a = TensorNetwork1D::computational_state("0101");
    CHECK(a.overlap(TensorNetwork1D::computational_state("0101")) == 1);
    CHECK(a.overlap(TensorNetwork1D::computational_state("0111")) == 0);
    REQUIRE_THROWS_AS(a.overlap(TensorNetwork1D::computational_state("01")),
                      std::invalid_argument);

    const auto r = TensorNetwork1D::random(4, 2, 2, 37);
    const auto s = TensorNetwork1D::random(4, 3, 2, 41);
    const auto dr = r.to_dense();
    const auto ds = s.to_dense();
    double expected = 0;
    for (std::size_t k = 0; k != dr.size(); ++k) expected += dr[k] * ds[k];
    CHECK(r.overlap(s) == Approx(expected));
  }

  SECTION("cyclic chains") {
    auto ring = TensorNetwork1D::random(4, 2, 2, 43, true);
    CHECK(ring.cyclic());
    CHECK(ring.bond_sizes().size() == 4);
    CHECK(ring.bond_size(3, 0) == 2);
    REQUIRE_THROWS_AS(ring.canonize(1), std::logic_error);
    REQUIRE_THROWS_AS(ring.compress(), std::logic_error);

    const auto before = ring.to_dense();
    ring.gate_split(cnot, 3, 0, {.truncation = TruncationOptions::exact()});
    Array expected(before.shape());
    for (std::size_t ord = 0; ord != before.size(); ++ord) {
      // control on site 3 (least significant), target on site 0
      std::size_t target = ord;
      if (ord & 1) target ^= 8;
      expected[target] = before[ord];
    }
    CHECK(relative_distance(expected, ring.to_dense()) < 1e-10);
  }
}
