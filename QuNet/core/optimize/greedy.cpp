#include <QuNet/core/logger.hpp>
#include <QuNet/core/optimize/greedy.hpp>
#include <QuNet/core/runtime.hpp>

#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <cmath>
#include <numeric>
#include <random>
#include <tuple>

namespace qunet::opt {

namespace {

struct Candidate {
  double cost;
  std::size_t nindices;
  std::size_t a;
  std::size_t b;

  friend bool operator<(const Candidate& x, const Candidate& y) {
    return std::tie(x.cost, x.nindices, x.a, x.b) <
           std::tie(y.cost, y.nindices, y.a, y.b);
  }
};

/// all pairs of live tensors that share an index
container::vector<Candidate> candidates(const detail::PathState& state) {
  container::set<std::pair<std::size_t, std::size_t>> seen;
  container::vector<Candidate> result;
  for (std::size_t i = 0; i != state.problem().num_indices(); ++i) {
    const auto& h = state.holders(i);
    if (h.size() < 2) continue;
    for (auto ia = h.begin(); ia != h.end(); ++ia) {
      for (auto ib = std::next(ia); ib != h.end(); ++ib) {
        const auto a = *ia;
        const auto b = *ib;
        if (!seen.emplace(a, b).second) continue;
        const auto out = state.result_indices(a, b);
        result.push_back(
            {state.size(out) - state.size(a) - state.size(b),
             state.indices(a).size() + state.indices(b).size(), a, b});
      }
    }
  }
  return result;
}

/// runs the greedy loop, @p choose picks a step among the candidates
template <typename Choose>
ContractionPath build_path(const ContractionProblem& problem,
                           Choose&& choose) {
  detail::PathState state(problem);
  ContractionPath path;
  while (state.num_alive() > 1) {
    auto cands = candidates(state);
    std::pair<std::size_t, std::size_t> step;
    if (cands.empty()) {
      // disconnected components: outer product of the two smallest
      auto live = state.live();
      std::stable_sort(live.begin(), live.end(),
                       [&state](std::size_t x, std::size_t y) {
                         return state.size(x) < state.size(y);
                       });
      step = std::minmax(live[0], live[1]);
    } else {
      step = choose(cands);
    }
    state.contract(step.first, step.second);
    path.steps.push_back(step);
  }
  return path;
}

}  // namespace

ContractionPath greedy_path(const ContractionProblem& problem) {
  return build_path(problem, [](const container::vector<Candidate>& cands) {
    const auto& best = *ranges::min_element(cands, std::less<>{});
    return std::make_pair(best.a, best.b);
  });
}

ContractionPath random_greedy_path(const ContractionProblem& problem,
                                   const ContractOptions& opts) {
  struct Trial {
    ContractionPath path;
    PathInfo info;
    bool done = false;
  };
  const auto ntrials = std::max<std::size_t>(opts.max_repeats, 1);
  container::vector<Trial> trials(ntrials);
  container::vector<std::size_t> trial_ids(ntrials);
  std::iota(trial_ids.begin(), trial_ids.end(), std::size_t{0});

  const auto start = std::chrono::steady_clock::now();
  auto run_trial = [&](std::size_t k) {
    if (k != 0 && opts.max_time > 0 &&
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
                .count() > opts.max_time)
      return;
    auto& trial = trials[k];
    if (k == 0 || opts.temperature <= 0) {
      trial.path = greedy_path(problem);
    } else {
      std::mt19937_64 rng(opts.seed + k);
      auto boltzmann = [&](container::vector<Candidate> cands) {
        ranges::sort(cands, std::less<>{});
        const auto c0 = cands.front().cost;
        const auto scale = opts.temperature * std::max(std::abs(c0), 1.0);
        container::vector<double> weights;
        for (auto&& c : cands)
          weights.push_back(std::exp(-(c.cost - c0) / scale));
        std::discrete_distribution<std::size_t> pick(weights.begin(),
                                                     weights.end());
        const auto& chosen = cands[pick(rng)];
        return std::make_pair(chosen.a, chosen.b);
      };
      trial.path = build_path(problem, boltzmann);
    }
    trial.info = evaluate(problem, trial.path);
    trial.done = true;
  };
  qunet::for_each(trial_ids, run_trial);

  std::size_t best = 0;
  std::size_t ndone = 0;
  for (std::size_t k = 0; k != ntrials; ++k) {
    if (!trials[k].done) continue;
    ++ndone;
    const auto& x = trials[k].info;
    const auto& y = trials[best].info;
    if (std::tie(x.flops, x.width) < std::tie(y.flops, y.width)) best = k;
  }

  auto& logger = Logger::instance();
  if (logger.path)
    write_log(logger, "random-greedy: best of ", ndone, " trials is trial ",
              best, ", flops=", trials[best].info.flops,
              ", width=", trials[best].info.width, "\n");
  return std::move(trials[best].path);
}

}  // namespace qunet::opt
