#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "catch2_qunet.hpp"

#include <QuNet/core/contract.hpp>
#include <QuNet/core/optimize.hpp>
#include <QuNet/core/optimize/greedy.hpp>
#include <QuNet/core/optimize/optimal.hpp>
#include <QuNet/core/optimize/slicing.hpp>
#include <QuNet/core/runtime.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace {

using namespace qunet;
using qunet::test::random_tensor;

/// A(x,i) B(i,j) C(j,y) with extents x=2, i=3, j=4, y=2
container::vector<Tensor> matrix_chain() {
  return {random_tensor({"x", "i"}, {2, 3}, 1),
          random_tensor({"i", "j"}, {3, 4}, 2),
          random_tensor({"j", "y"}, {4, 2}, 3)};
}

std::string h_bond(std::size_t i, std::size_t j) {
  return "h" + std::to_string(i) + "_" + std::to_string(j);
}

std::string v_bond(std::size_t i, std::size_t j) {
  return "v" + std::to_string(i) + "_" + std::to_string(j);
}

/// closed Lx x Ly grid of random tensors joined by bonds of extent D
container::vector<Tensor> grid(std::size_t Lx, std::size_t Ly, std::size_t D) {
  container::vector<Tensor> result;
  for (std::size_t i = 0; i != Lx; ++i) {
    for (std::size_t j = 0; j != Ly; ++j) {
      std::vector<std::string> labels;
      if (i > 0) labels.push_back(v_bond(i - 1, j));
      if (j > 0) labels.push_back(h_bond(i, j - 1));
      if (i + 1 < Lx) labels.push_back(v_bond(i, j));
      if (j + 1 < Ly) labels.push_back(h_bond(i, j));
      std::vector<std::size_t> extents(labels.size(), D);
      result.push_back(random_tensor(labels, extents, 100 + i * Ly + j));
    }
  }
  return result;
}

}  // namespace

TEST_CASE("contraction problem", "[optimize]") {
  using namespace qunet;
  using namespace qunet::opt;

  const auto tensors = matrix_chain();

  SECTION("default output") {
    CHECK(default_output(tensors) == LabelList{"x", "y"});

    auto hyper = tensors;
    hyper.push_back(random_tensor({"i"}, {3}, 4));
    REQUIRE_THROWS_AS(default_output(hyper), AmbiguousContractionError);
  }

  SECTION("problem") {
    const auto p = make_problem(tensors, std::nullopt);
    CHECK(p.num_inputs() == 3);
    CHECK(p.num_indices() == 4);
    CHECK(p.labels[0] == "x");
    CHECK(p.labels[1] == "y");
    CHECK(p.is_output(p.id_of("y")));
    CHECK_FALSE(p.is_output(p.id_of("i")));
    CHECK(p.extents[p.id_of("j")] == 4);
    REQUIRE_THROWS_AS(p.id_of("z"), std::out_of_range);

    // x is summed before contraction when it is not requested
    const auto q = make_problem(tensors, LabelList{"y"});
    CHECK(q.num_indices() == 3);
    CHECK(q.inputs[0].size() == 1);

    REQUIRE_THROWS_AS(make_problem(tensors, LabelList{"x", "x"}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(make_problem(tensors, LabelList{"z"}),
                      std::invalid_argument);
    auto bad = tensors;
    bad.push_back(random_tensor({"i", "j"}, {3, 5}, 5));
    REQUIRE_THROWS_AS(make_problem(bad, LabelList{"x", "y"}), ShapeError);
  }

  SECTION("evaluate") {
    const auto p = make_problem(tensors, std::nullopt);
    ContractionPath ab_first{{{0, 1}, {2, 3}}};
    ContractionPath bc_first{{{1, 2}, {0, 3}}};
    CHECK(evaluate(p, ab_first).flops == 24 + 16);
    const auto info = evaluate(p, bc_first);
    CHECK(info.flops == 24 + 12);
    CHECK(info.max_size == 6);
    CHECK(info.sizes == container::vector<double>{6, 4});
    CHECK(info.width == Catch::Approx(std::log2(6.)));

    ContractionPath reused{{{0, 1}, {0, 2}}};
    REQUIRE_THROWS_AS(evaluate(p, reused), std::invalid_argument);
    ContractionPath incomplete{{{0, 1}}};
    REQUIRE_THROWS_AS(evaluate(p, incomplete), std::invalid_argument);
  }
}

TEST_CASE("path search", "[optimize]") {
  using namespace qunet;
  using namespace qunet::opt;

  SECTION("matrix chain") {
    const auto p = make_problem(matrix_chain(), std::nullopt);
    CHECK(evaluate(p, optimal_path(p)).flops == 36);
    CHECK(evaluate(p, greedy_path(p)).flops == 36);
    CHECK(greedy_path(p).size() == 2);
  }

  SECTION("disconnected inputs") {
    const container::vector<Tensor> tensors{random_tensor({"a"}, {2}, 6),
                                            random_tensor({"b"}, {3}, 7),
                                            random_tensor({"c"}, {4}, 8)};
    const auto p = make_problem(tensors, std::nullopt);
    CHECK(greedy_path(p).size() == 2);
    CHECK(optimal_path(p).size() == 2);
    CHECK(evaluate(p, optimal_path(p)).max_size == 24);
  }

  SECTION("strategies on a grid") {
    const auto tensors = grid(3, 3, 3);
    const auto p = make_problem(tensors, std::nullopt);
    const auto greedy = evaluate(p, greedy_path(p)).flops;
    const auto optimal = evaluate(p, optimal_path(p)).flops;
    const auto random =
        evaluate(p, random_greedy_path(p, {.max_repeats = 16})).flops;
    CHECK(optimal <= greedy);
    CHECK(optimal <= random);
    CHECK(random <= greedy);

    // every strategy gives the same value
    const auto reference =
        contract_tensors(tensors, std::nullopt,
                         {.strategy = PathStrategy::Optimal})
            .value();
    for (auto strategy : {PathStrategy::Greedy, PathStrategy::RandomGreedy,
                          PathStrategy::Auto, PathStrategy::AutoHQ}) {
      const auto v =
          contract_tensors(tensors, std::nullopt, {.strategy = strategy})
              .value();
      CHECK(v == Catch::Approx(reference).epsilon(1e-10));
    }
  }

  SECTION("random greedy is reproducible") {
    const auto p = make_problem(grid(3, 4, 2), std::nullopt);
    const ContractOptions opts{.strategy = PathStrategy::RandomGreedy,
                               .max_repeats = 8,
                               .seed = 7};
    const auto nthreads = num_threads();
    set_num_threads(1);
    const auto serial = random_greedy_path(p, opts);
    set_num_threads(4);
    const auto parallel = random_greedy_path(p, opts);
    set_num_threads(nthreads);
    CHECK(serial.steps == parallel.steps);
    CHECK(find_path(p, opts).steps == serial.steps);
  }

  SECTION("limits") {
    const auto p = make_problem(grid(3, 6, 2), std::nullopt);
    REQUIRE(p.num_inputs() > max_optimal_inputs);
    REQUIRE_THROWS_AS(optimal_path(p), std::invalid_argument);
    // Auto falls back to greedy for many inputs
    CHECK(find_path(p, {}).steps == greedy_path(p).steps);
  }

  SECTION("strategy names") {
    for (auto strategy :
         {PathStrategy::Greedy, PathStrategy::RandomGreedy,
          PathStrategy::Optimal, PathStrategy::Auto, PathStrategy::AutoHQ})
      CHECK(to_path_strategy(to_string(strategy)) == strategy);
    REQUIRE_THROWS_AS(to_path_strategy("fastest"), std::invalid_argument);
  }
}

TEST_CASE("slicing", "[optimize][slicing]") {
  using namespace qunet;
  using namespace qunet::opt;

  const auto tensors = grid(3, 3, 4);
  const auto p = make_problem(tensors, std::nullopt);
  const auto path = greedy_path(p);
  const auto width = evaluate(p, path).width;
  REQUIRE(width > 4);

  SECTION("find slices") {
    const auto s = find_slices(p, path, width - 2);
    CHECK(!s.labels.empty());
    CHECK(s.labels.size() == s.ids.size());
    CHECK(s.info.width <= width - 2);
    std::size_t n = 1;
    for (auto id : s.ids) n *= p.extents[id];
    CHECK(s.num_slices == n);

    const auto none = find_slices(p, path, width);
    CHECK(none.labels.empty());
    CHECK(none.num_slices == 1);
  }

  SECTION("sliced contraction is exact") {
    const auto exact = contract_tensors(tensors, std::nullopt,
                                        {.strategy = PathStrategy::Greedy})
                           .value();
    const ContractOptions opts{.strategy = PathStrategy::Greedy,
                               .max_width = width - 2,
                               .slice = true};
    const auto plan = plan_contraction(tensors, std::nullopt, opts);
    CHECK(plan.num_slices > 1);
    CHECK(!plan.sliced.empty());
    CHECK(contract_tensors(tensors, std::nullopt, opts).value() ==
          Catch::Approx(exact).epsilon(1e-10));
  }

  SECTION("width budget") {
    const ContractOptions opts{.strategy = PathStrategy::Greedy,
                               .max_width = width - 2};
    try {
      contract_tensors(tensors, std::nullopt, opts);
      FAIL("expected ResourceExhaustion");
    } catch (const ResourceExhaustion& e) {
      CHECK(e.width() == Catch::Approx(width));
      CHECK(e.budget() == Catch::Approx(width - 2));
    }
  }

  SECTION("output indices are never sliced") {
    const container::vector<Tensor> wide{
        random_tensor({"x", "y", "i"}, {4, 4, 2}, 9),
        random_tensor({"i"}, {2}, 10)};
    const auto q = make_problem(wide, std::nullopt);
    REQUIRE_THROWS_AS(find_slices(q, greedy_path(q), 1.), ResourceExhaustion);
  }
}

TEST_CASE("contraction engine", "[contract]") {
  using namespace qunet;
  using qunet::test::IsCloseTo;

  const auto tensors = matrix_chain();
  const auto expected = contract(contract(tensors[0], tensors[1]), tensors[2]);

  SECTION("contract tensors") {
    CHECK_THAT(contract_tensors(tensors, std::nullopt, {}),
               IsCloseTo(expected));
    const auto yx = contract_tensors(tensors, LabelList{"y", "x"}, {});
    CHECK(yx.labels() == LabelList{"y", "x"});
    CHECK_THAT(yx, IsCloseTo(expected));

    CHECK(contract_tensors({}, std::nullopt, {}).value() == 1);
    CHECK_THAT(contract_tensors({tensors[0]}, std::nullopt, {}),
               IsCloseTo(tensors[0]));

    // a label held by one tensor and not requested is summed
    CHECK_THAT(contract_tensors(tensors, LabelList{"y"}, {}),
               IsCloseTo(expected.sum_over("x")));
  }

  SECTION("execute path") {
    const opt::ContractionPath path{{{1, 2}, {0, 3}}};
    CHECK_THAT(execute_path(tensors, path, LabelList{"x", "y"}),
               IsCloseTo(expected));
    const opt::ContractionPath bad{{{0, 0}}};
    REQUIRE_THROWS_AS(execute_path(tensors, bad, LabelList{"x", "y"}),
                      std::invalid_argument);
  }

  SECTION("hyperindices are kept until their last holder") {
    const container::vector<Tensor> hyper{
        random_tensor({"h", "a"}, {2, 3}, 11),
        random_tensor({"h", "b"}, {2, 3}, 12),
        random_tensor({"h", "c"}, {2, 3}, 13)};
    REQUIRE_THROWS_AS(contract_tensors(hyper, std::nullopt, {}),
                      AmbiguousContractionError);
    const auto r = contract_tensors(hyper, LabelList{"a", "b", "c"}, {});
    const auto kept =
        contract_tensors(hyper, LabelList{"h", "a", "b", "c"}, {});
    CHECK_THAT(r, IsCloseTo(kept.sum_over("h")));
  }
}
