// MIT License
// Copyright 2024--present enhsamp developers
#include <catch2/catch_all.hpp>
#include <memory>
#include <vector>

#include "enhsamp/Harmonic/HarmonicPot.hpp"
#include "enhsamp/sampling/TrajectoryGenerator.hpp"

using namespace Catch::Matchers;

TEST_CASE("Fixed-length generation", "[TrajectoryGenerator]") {
  enhsamp::HarmonicPot pot(1.0, {0.0, 0.0});
  enhsamp::OverdampedLangevin integrator(pot, 1.0, 1e-3, 1.0);
  enhsamp::RandomStream rng(42);
  const Configuration start{0.25, -0.25};

  SECTION("Every step recorded") {
    enhsamp::TrajectoryGenerator gen(integrator);
    auto res = gen.fixed(start, 10, rng);
    REQUIRE(res.trajectory.frames() == 11);
    REQUIRE(res.trajectory.dims() == 2);
    REQUIRE(res.trajectory.front() == start);
    REQUIRE(res.state == enhsamp::GeneratorState::MaxStepsReached);
    REQUIRE(res.steps_taken == 10);
  }

  SECTION("Strided recording") {
    enhsamp::TrajectoryGenerator gen(integrator, 3);
    auto res = gen.fixed(start, 10, rng);
    // Steps 0, 3, 6 and 9 are kept besides the start point
    REQUIRE(res.trajectory.frames() == 5);
    REQUIRE(res.steps_taken == 10);
  }

  SECTION("Zero steps keeps only the start point") {
    enhsamp::TrajectoryGenerator gen(integrator);
    auto res = gen.fixed(start, 0, rng);
    REQUIRE(res.trajectory.frames() == 1);
    REQUIRE(res.state == enhsamp::GeneratorState::MaxStepsReached);
  }

  SECTION("Zero stride is rejected") {
    REQUIRE_THROWS_AS(enhsamp::TrajectoryGenerator(integrator, 0),
                      std::runtime_error);
  }
}

TEST_CASE("State-bounded generation", "[TrajectoryGenerator]") {
  // A stiff well at x = 2 pulls every trajectory into B
  enhsamp::HarmonicPot pot(10.0, {2.0});
  enhsamp::OverdampedLangevin integrator(pot, 1.0, 1e-2, 1.0);
  enhsamp::TrajectoryGenerator gen(integrator);
  enhsamp::RandomStream rng(8);

  auto cv = std::make_shared<enhsamp::CoordinateCV>(0);
  enhsamp::StateIndicator state_a("A", cv, -3.0, -1.0);
  enhsamp::StateIndicator state_b("B", cv, 1.0, 3.0);
  const std::vector<enhsamp::StateIndicator> states{state_a, state_b};

  SECTION("Stops on entering a state") {
    auto res = gen.bounded({0.0}, 10000, states, rng);
    REQUIRE(res.state == enhsamp::GeneratorState::HitStateB);
    REQUIRE(state_b(res.trajectory.back()));
    REQUIRE(res.trajectory.frames() == res.steps_taken + 1);
    REQUIRE(res.steps_taken < 10000);
    auto xs = cv->values(res.trajectory);
    REQUIRE(xs.size() == res.trajectory.frames());
    REQUIRE(xs.back() > 1.0);
    for (size_t i = 0; i + 1 < res.trajectory.frames(); ++i) {
      REQUIRE_FALSE(state_b(res.trajectory.frame(i)));
    }
  }

  SECTION("A start point inside a state gives a single frame") {
    auto res = gen.bounded({-2.0}, 100, states, rng);
    REQUIRE(res.state == enhsamp::GeneratorState::HitStateA);
    REQUIRE(res.trajectory.frames() == 1);
    REQUIRE(res.steps_taken == 0);
  }

  SECTION("Step budget exhausted") {
    auto res = gen.bounded({0.0}, 1, {state_a}, rng);
    REQUIRE(res.state == enhsamp::GeneratorState::MaxStepsReached);
    REQUIRE(res.trajectory.frames() == 2);
  }

  SECTION("Predicate count") {
    REQUIRE_THROWS_AS(gen.bounded({0.0}, 10, {}, rng), std::runtime_error);
    REQUIRE_THROWS_AS(gen.bounded({0.0}, 10, {state_a, state_b, state_a}, rng),
                      std::runtime_error);
  }
}

TEST_CASE("State indicators", "[TrajectoryGenerator]") {
  auto cv = std::make_shared<enhsamp::LinearCV>(std::vector<double>{1.0, -1.0});
  enhsamp::StateIndicator ind("diag", cv, 0.0, 1.0);
  REQUIRE(ind({0.5, 0.0}));
  // Bounds are open
  REQUIRE_FALSE(ind({1.0, 0.0}));
  REQUIRE_FALSE(ind({0.0, 0.0}));
  REQUIRE(ind.name() == "diag");

  REQUIRE_THROWS_AS(enhsamp::StateIndicator("bad", cv, 1.0, 0.0),
                    std::runtime_error);
  REQUIRE_THROWS_AS(enhsamp::StateIndicator("bad", nullptr, 0.0, 1.0),
                    std::runtime_error);

  REQUIRE(enhsamp::classify({0.5, 0.0}, {ind}) ==
          enhsamp::GeneratorState::HitStateA);
  REQUIRE(enhsamp::to_string(enhsamp::GeneratorState::HitStateB) ==
          "HIT_STATE_B");
}
