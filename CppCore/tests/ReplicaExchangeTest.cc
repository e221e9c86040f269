// MIT License
// Copyright 2024--present enhsamp developers
#include <catch2/catch_all.hpp>
#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

// The controller header comes first so that it compiles on its own
#include "enhsamp/sampling/ReplicaExchange.hpp"

#include "enhsamp/DoubleWell/DoubleWellPot.hpp"
#include "enhsamp/Harmonic/HarmonicPot.hpp"

using namespace Catch::Matchers;

namespace {

enhsamp::SimParams short_run(size_t steps, size_t output_frequency) {
  enhsamp::SimParams params;
  params.timestep = 1e-3;
  params.total_steps = steps;
  params.output_frequency = output_frequency;
  params.seed = 77;
  return params;
}

} // namespace

TEST_CASE("Exchange acceptance probability", "[ReplicaExchange]") {
  REQUIRE(enhsamp::exchange_acceptance_probability(1.0, 2.0, 3.0, 3.0) == 1.0);
  REQUIRE_THAT(enhsamp::exchange_acceptance_probability(1.0, 2.0, 1.0, 0.0),
               WithinAbs(std::exp(-1.0), 1e-15));
  // The cold replica holding the higher energy always swaps
  REQUIRE(enhsamp::exchange_acceptance_probability(1.0, 2.0, 0.0, 1.0) == 1.0);
  REQUIRE(enhsamp::exchange_acceptance_probability(2.0, 1.0, 0.0, 1.0) ==
          enhsamp::exchange_acceptance_probability(1.0, 2.0, 1.0, 0.0));
}

TEST_CASE("Exchange matrix bookkeeping", "[ReplicaExchange]") {
  enhsamp::ExchangeMatrix m(3);
  m.record(0, 1, true);
  m.record(1, 0, false);
  m.record(1, 2, true);

  REQUIRE(m.attempted(0, 1) == 2);
  REQUIRE(m.attempted(1, 0) == 2);
  REQUIRE(m.accepted(0, 1) == 1);
  REQUIRE_THAT(m.acceptance_rate(0, 1), WithinAbs(0.5, 1e-15));
  REQUIRE(std::isnan(m.acceptance_rate(0, 2)));
  REQUIRE(m.total_attempted() == 3);
  REQUIRE(m.total_accepted() == 2);
  REQUIRE_THROWS_AS(m.record(1, 1, true), std::runtime_error);
  REQUIRE_THROWS_AS(m.record(0, 3, true), std::runtime_error);

  m.reset();
  REQUIRE(m.total_attempted() == 0);
}

TEST_CASE("Replica exchange runs", "[ReplicaExchange]") {
  auto pot = std::make_shared<enhsamp::DoubleWellPot>();

  SECTION("Attempts follow the exchange frequency") {
    enhsamp::ReplicaExchangeOptions opts;
    opts.betas = {1.0, 2.0};
    opts.exchange_frequency = 100;
    enhsamp::ReplicaExchangeController rex(pot, {{-1.0}, {1.0}},
                                           short_run(1000, 10), opts);
    auto res = rex.run();
    REQUIRE(res.exchanges.total_attempted() == 10);
    REQUIRE(res.trajectories.size() == 2);
    REQUIRE(res.trajectories[0].frames() == 100);
    REQUIRE(res.energies[1].size() == 100);
  }

  SECTION("A single replica runs without exchanges") {
    enhsamp::ReplicaExchangeOptions opts;
    opts.betas = {1.0};
    opts.exchange_frequency = 10;
    enhsamp::ReplicaExchangeController rex(pot, {{0.5}}, short_run(200, 1),
                                           opts);
    auto res = rex.run();
    REQUIRE(res.exchanges.total_attempted() == 0);
    REQUIRE(res.trajectories[0].frames() == 200);
    REQUIRE_FALSE(rex.attempt_exchange());
  }

  SECTION("Flat surface accepts every swap") {
    auto flat = std::make_shared<enhsamp::HarmonicPot>(0.0, Configuration{0.0});
    enhsamp::ReplicaExchangeOptions opts;
    opts.betas = {0.5, 1.0, 2.0};
    opts.exchange_frequency = 5;
    enhsamp::ReplicaExchangeController rex(flat, {{0.0}}, short_run(500, 5),
                                           opts);
    auto res = rex.run();
    REQUIRE(res.exchanges.total_attempted() == 100);
    REQUIRE(res.exchanges.total_accepted() == 100);
  }

  SECTION("Configuration swap keeps betas on their slots") {
    enhsamp::ReplicaExchangeOptions opts;
    opts.betas = {1.0, 1.5, 3.0};
    opts.exchange_frequency = 20;
    enhsamp::ReplicaExchangeController rex(pot, {{-1.0}, {0.0}, {1.0}},
                                           short_run(2000, 20), opts);
    auto res = rex.run();
    for (size_t i = 0; i < 3; ++i) {
      for (double b : res.beta_history[i]) {
        REQUIRE(b == opts.betas[i]);
      }
    }
    for (size_t f = 0; f < res.id_history[0].size(); ++f) {
      std::vector<size_t> ids{res.id_history[0][f], res.id_history[1][f],
                              res.id_history[2][f]};
      std::sort(ids.begin(), ids.end());
      REQUIRE(ids == std::vector<size_t>{0, 1, 2});
    }
  }

  SECTION("Label swap keeps walkers on their slots") {
    enhsamp::ReplicaExchangeOptions opts;
    opts.betas = {1.0, 1.5, 3.0};
    opts.exchange_frequency = 20;
    opts.swap_policy = enhsamp::SwapPolicy::LabelSwap;
    enhsamp::ReplicaExchangeController rex(pot, {{-1.0}, {0.0}, {1.0}},
                                           short_run(2000, 20), opts);
    auto res = rex.run();
    for (size_t i = 0; i < 3; ++i) {
      for (size_t id : res.id_history[i]) {
        REQUIRE(id == i);
      }
    }
    for (size_t f = 0; f < res.beta_history[0].size(); ++f) {
      std::vector<double> betas{res.beta_history[0][f],
                                res.beta_history[1][f],
                                res.beta_history[2][f]};
      std::sort(betas.begin(), betas.end());
      REQUIRE(betas == opts.betas);
    }
  }

  SECTION("Neighbor selection only pairs adjacent temperatures") {
    enhsamp::ReplicaExchangeOptions opts;
    opts.betas = {1.0, 2.0, 4.0};
    opts.exchange_frequency = 10;
    opts.pair_selection = enhsamp::PairSelection::RandomNeighbor;
    enhsamp::ReplicaExchangeController rex(pot, {{-1.0}}, short_run(1000, 10),
                                           opts);
    auto res = rex.run();
    REQUIRE(res.exchanges.attempted(0, 2) == 0);
    REQUIRE(res.exchanges.attempted(0, 1) + res.exchanges.attempted(1, 2) ==
            100);
  }

  SECTION("Same seed, same run") {
    enhsamp::ReplicaExchangeOptions opts;
    opts.betas = {1.0, 2.0};
    opts.exchange_frequency = 10;
    enhsamp::ReplicaExchangeController a(pot, {{0.0}}, short_run(300, 3), opts);
    enhsamp::ReplicaExchangeController b(pot, {{0.0}}, short_run(300, 3), opts);
    auto ra = a.run();
    auto rb = b.run();
    REQUIRE(ra.trajectories[0] == rb.trajectories[0]);
    REQUIRE(ra.trajectories[1] == rb.trajectories[1]);
    REQUIRE(ra.exchanges.total_accepted() == rb.exchanges.total_accepted());
  }
}

TEST_CASE("Replica exchange preconditions", "[ReplicaExchange]") {
  auto pot = std::make_shared<enhsamp::DoubleWellPot>();
  enhsamp::ReplicaExchangeOptions opts;

  SECTION("Temperatures") {
    opts.betas = {};
    REQUIRE_THROWS_AS(enhsamp::validate(opts), std::runtime_error);
    opts.betas = {1.0, 1.0};
    REQUIRE_THROWS_AS(enhsamp::validate(opts), std::runtime_error);
    opts.betas = {1.0, -2.0};
    REQUIRE_THROWS_AS(enhsamp::validate(opts), std::runtime_error);
  }

  SECTION("Exchange frequency") {
    opts.betas = {1.0, 2.0};
    opts.exchange_frequency = 0;
    REQUIRE_THROWS_AS(enhsamp::validate(opts), std::runtime_error);
  }

  SECTION("Start configurations") {
    opts.betas = {1.0, 2.0, 3.0};
    REQUIRE_THROWS_AS(enhsamp::ReplicaExchangeController(
                          pot, {{0.0}, {1.0}}, short_run(100, 1), opts),
                      std::runtime_error);
  }
}
