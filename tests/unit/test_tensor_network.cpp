#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "catch2_qunet.hpp"

#include <QuNet/core/linalg.hpp>
#include <QuNet/core/tensor_network.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <cmath>
#include <stdexcept>

namespace {

using namespace qunet;
using qunet::test::random_tensor;

/// x -A- i -B- j -C- y
TensorNetwork make_chain() {
  return TensorNetwork({random_tensor({"x", "i"}, {2, 3}, 1, {"A", "ODD"}),
                        random_tensor({"i", "j"}, {3, 4}, 2, {"B"}),
                        random_tensor({"j", "y"}, {4, 2}, 3, {"C", "ODD"})});
}

/// the dense contraction of make_chain(), as a (x, y) matrix
Tensor chain_value() {
  auto tn = make_chain();
  return contract(contract(tn["A"], tn["B"]), tn["C"]);
}

}  // namespace

TEST_CASE("TensorNetwork", "[elements][tensor_network]") {
  using namespace qunet;
  using qunet::test::IsCloseTo;
  using qunet::test::random_tensor;
  using Catch::Approx;

  SECTION("registries") {
    const auto tn = make_chain();
    REQUIRE_NOTHROW(tn.check());
    CHECK(tn.num_tensors() == 3);
    CHECK(tn.num_indices() == 4);
    CHECK(tn.outer_indices() == LabelList{"x", "y"});
    CHECK(tn.inner_indices() == LabelList{"i", "j"});
    CHECK(tn.hyper_indices().empty());
    CHECK(tn.index_extent("j") == 4);
    REQUIRE_THROWS_AS(tn.index_extent("z"), std::out_of_range);
    CHECK(tn.max_bond() == 4);
    CHECK(tn.bond_size("A", "B") == 3);
    REQUIRE_THROWS_AS(tn.bond_size("A", "C"), std::invalid_argument);

    const auto b = tn.id_of("B");
    CHECK(tn.neighbors(b).size() == 2);
    CHECK(tn.shared_indices(b, tn.id_of("C")) == LabelList{"j"});
    CHECK(tn.tensors_with_index("i").size() == 2);
    CHECK(tn.tags().count("ODD") == 1);
  }

  SECTION("selection") {
    const auto tn = make_chain();
    CHECK(tn.select_ids({"ODD"}).size() == 2);
    CHECK(tn.select_ids({"ODD", "A"}).size() == 1);
    CHECK(tn.select_ids({"A", "B"}, SelectMode::Any).size() == 2);
    CHECK(tn.select_ids({"A", "NONE"}).empty());
    CHECK(tn.select_ids({}).size() == 3);

    const auto odd = tn.select({"ODD"});
    CHECK(odd.num_tensors() == 2);
    CHECK(odd.outer_indices().size() == 4);

    CHECK(tn.select_neighbors({tn.id_of("A")}) ==
          TensorIdSet{tn.id_of("B")});

    REQUIRE_THROWS_AS(tn["ODD"], std::logic_error);
    REQUIRE_THROWS_AS(tn["NONE"], std::out_of_range);
    CHECK(tn["B"].labels() == LabelList{"i", "j"});
  }

  SECTION("add and remove") {
    auto tn = make_chain();
    REQUIRE_THROWS_AS(tn.add(random_tensor({"i"}, {5}, 4)), ShapeError);
    CHECK(tn.num_tensors() == 3);

    const auto id = tn.add(random_tensor({"y", "z"}, {2, 2}, 5, {"D"}));
    CHECK(tn.outer_indices() == LabelList{"x", "z"});
    const auto t = tn.pop(id);
    CHECK(t.has_tag("D"));
    CHECK(tn.outer_indices() == LabelList{"x", "y"});
    REQUIRE_THROWS_AS(tn.pop(id), std::out_of_range);

    CHECK(tn.remove({"ODD"}) == 2);
    CHECK(tn.num_tensors() == 1);
    REQUIRE_NOTHROW(tn.check());
  }

  SECTION("combining networks") {
    // a closed ring
    TensorNetwork ring({random_tensor({"a", "b"}, {2, 3}, 6),
                        random_tensor({"b", "c"}, {3, 2}, 7),
                        random_tensor({"c", "a"}, {2, 2}, 8)});
    const auto v = ring.contract_scalar();
    const auto both = ring & ring;
    CHECK(both.num_tensors() == 6);
    CHECK(both.hyper_indices().empty());
    CHECK(both.contract_scalar() == Approx(v * v));

    // outer indices are shared, so they become bonds
    const auto chain = make_chain();
    const auto norm2 = (chain.conj() & chain).contract_scalar();
    CHECK(norm2 == Approx(std::pow(chain_value().norm(), 2)));
  }

  SECTION("renaming") {
    auto tn = make_chain();
    RenameMap collide;
    collide.emplace("x", "y");
    REQUIRE_THROWS_AS(tn.reindex(collide), NameCollisionError);
    CHECK(tn.outer_indices() == LabelList{"x", "y"});

    // an identity entry does not move its name out of the way
    collide.emplace("y", "y");
    REQUIRE_THROWS_AS(tn.reindex(collide), NameCollisionError);
    CHECK(tn.tensors_with_index("y").size() == 1);
    RenameMap swap;
    swap.emplace("x", "y");
    swap.emplace("y", "x");
    auto swapped = tn;
    REQUIRE_NOTHROW(swapped.reindex(swap));
    CHECK(swapped["A"].labels() == LabelList{"y", "i"});
    collide.erase("y");

    // merging makes a trace over x == y
    auto traced = tn;
    traced.reindex(collide, Merge::Yes);
    CHECK(traced.outer_indices().empty());
    CHECK(traced.contract_scalar() ==
          Approx(chain_value().trace("x", "y").value()));

    RenameMap bad_extent;
    bad_extent.emplace("x", "j");
    REQUIRE_THROWS_AS(tn.reindex(bad_extent, Merge::Yes), ShapeError);

    RenameMap retag;
    retag.emplace("A", "B");
    REQUIRE_THROWS_AS(tn.retag(retag), NameCollisionError);
    retag.emplace("B", "B");
    REQUIRE_THROWS_AS(tn.retag(retag), NameCollisionError);
    CHECK(tn.select_ids({"B"}).size() == 1);
    retag.clear();
    retag.emplace("A", "FIRST");
    tn.retag(retag);
    CHECK(tn["FIRST"].labels() == LabelList{"x", "i"});
    REQUIRE_NOTHROW(tn.check());
  }

  SECTION("contraction") {
    auto tn = make_chain();
    CHECK_THAT(tn.contract(), IsCloseTo(chain_value()));
    const auto yx = tn.contract(LabelList{"y", "x"});
    CHECK(yx.labels() == LabelList{"y", "x"});

    const auto dense = tn.to_dense({{"x", "y"}});
    CHECK(dense.shape() == Array::shape_type{4});

    const auto ab = tn.contract_tags({"A", "B"}, SelectMode::Any);
    CHECK(tn.num_tensors() == 2);
    CHECK(tn.tensor(ab).labels() == LabelList{"x", "j"});
    CHECK(tn.tensor(ab).has_tag("A"));
    CHECK(tn.tensor(ab).has_tag("B"));
    CHECK_THAT(tn.contract(), IsCloseTo(chain_value()));

    tn.contract_index("j");
    CHECK(tn.num_tensors() == 1);
    CHECK_THAT(tn.contract(), IsCloseTo(chain_value()));

    auto tn2 = make_chain();
    tn2.contract_between(tn2.id_of("B"), tn2.id_of("C"));
    CHECK(tn2.num_tensors() == 2);
    CHECK_THAT(tn2.contract(), IsCloseTo(chain_value()));

    const auto info = make_chain().contraction_info();
    CHECK(info.flops > 0);
    CHECK(info.width == Approx(std::log2(info.max_size)));
  }

  SECTION("hyperindices") {
    TensorNetwork tn({random_tensor({"h", "a"}, {2, 2}, 9),
                      random_tensor({"h", "b"}, {2, 3}, 10),
                      random_tensor({"h"}, {2}, 11)});
    CHECK(tn.hyper_indices() == LabelList{"h"});
    REQUIRE_THROWS_AS(tn.contract(), AmbiguousContractionError);

    const auto r = tn.contract(LabelList{"a", "b"});
    // explicit sum over h
    Tensor expected(Array(Array::shape_type{2, 3}),
                    {Index("a", 2), Index("b", 3)});
    for (std::size_t h = 0; h != 2; ++h) {
      auto term = contract(
          contract(tn.tensor(0).isel("h", h), tn.tensor(1).isel("h", h)),
          Tensor::scalar(tn.tensor(2).data()[h]));
      expected.data() += term.data();
    }
    CHECK_THAT(r, IsCloseTo(expected));

    const auto keep_h = tn.contract(LabelList{"h"});
    CHECK(keep_h.labels() == LabelList{"h"});
  }

  SECTION("fusing bonds") {
    TensorNetwork tn({random_tensor({"x", "p", "q"}, {2, 2, 3}, 12, {"A"}),
                      random_tensor({"p", "q", "y"}, {2, 3, 2}, 13, {"B"})});
    const auto value = tn.contract();
    tn.fuse_multibonds();
    CHECK(tn.num_indices() == 3);
    CHECK(tn.max_bond() == 6);
    CHECK_THAT(tn.contract(), IsCloseTo(value));

    // flatten contracts tensors sharing a site tag
    TensorNetwork layered({random_tensor({"x", "b1"}, {2, 2}, 14, {"S0"}),
                           random_tensor({"x", "b2"}, {2, 2}, 15, {"S0"}),
                           random_tensor({"b1", "y"}, {2, 2}, 16, {"S1"}),
                           random_tensor({"b2", "y"}, {2, 2}, 17, {"S1"})});
    const auto scalar = layered.contract_scalar();
    layered.flatten({"S0", "S1"});
    CHECK(layered.num_tensors() == 2);
    CHECK(layered.num_indices() == 1);
    CHECK(layered.max_bond() == 4);
    CHECK(layered.contract_scalar() == Approx(scalar));
  }

  SECTION("canonization and compression") {
    auto tn = make_chain();
    const auto a = tn.id_of("A");
    const auto b = tn.id_of("B");
    tn.canonize_between(a, b);
    CHECK(tn["A"].labels() == LabelList{"x", "i"});
    CHECK(tn["A"].has_tag("ODD"));
    CHECK_THAT(tn.contract(), IsCloseTo(chain_value()));
    // A is now an isometry from x to i
    const auto bond = tn.index_extent("i");
    const auto m = linalg::as_matrix(tn["A"].data(), 2, bond);
    CHECK((m.transpose() * m - linalg::Matrix::Identity(bond, bond)).norm() <
          1e-12);

    auto exact = make_chain();
    CHECK(exact.compress_between(exact.id_of("B"), exact.id_of("C"),
                                 TruncationOptions::exact()) == 0);
    CHECK_THAT(exact.contract(), IsCloseTo(chain_value()));

    auto capped = make_chain();
    const auto discarded = capped.compress_between(
        capped.id_of("B"), capped.id_of("C"), {.cutoff = 0, .max_bond = 1});
    CHECK(capped.index_extent("j") == 1);
    CHECK(discarded > 0);
    REQUIRE_NOTHROW(capped.check());

    REQUIRE_THROWS_AS(
        tn.compress_between(a, b, TruncationOptions{}.with(Absorb::None)),
        std::invalid_argument);
    REQUIRE_THROWS_AS(tn.canonize_between(a, tn.id_of("C")),
                      std::invalid_argument);
  }

  SECTION("norms") {
    auto tn = make_chain();
    tn.modify(tn.id_of("B"), [](Tensor& t) { t *= 1e3; });
    const auto value = tn.contract();
    tn.equalize_norms();
    CHECK(tn["A"].norm() == Approx(tn["B"].norm()));
    CHECK(tn["C"].norm() == Approx(tn["B"].norm()));
    CHECK_THAT(tn.contract(), IsCloseTo(value, 1e-10, 1e-8));
  }
}
