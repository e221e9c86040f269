// MIT License
// Copyright 2024--present enhsamp developers
#include <catch2/catch_all.hpp>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>

#include "enhsamp/Alchemical/LambdaPotential.hpp"
#include "enhsamp/DoubleWell/DoubleWellPot.hpp"
#include "enhsamp/Harmonic/HarmonicPot.hpp"
#include "enhsamp/MullerBrown/MullerBrownPot.hpp"
#include "enhsamp/PotHelpers.hpp"
#include "enhsamp/Umbrella/HarmonicBias.hpp"

using namespace Catch::Matchers;

// Compares analytic forces against central differences of the energy
void require_consistent_forces(enhsamp::PotentialBase &pot,
                               const Configuration &conf, double tol) {
  auto [energy, analytic] = pot(conf);
  auto numeric = enhsamp::numerical_force(pot, conf);
  REQUIRE(analytic.size() == conf.size());
  for (size_t i = 0; i < conf.size(); ++i) {
    REQUIRE_THAT(analytic[i], WithinAbs(numeric[i], tol));
  }
}

TEST_CASE("Model potential energies", "[Potential]") {
  SECTION("Double well minima and barrier") {
    enhsamp::DoubleWellPot pot(1.0, 1.0);
    REQUIRE_THAT(pot.energy({-1.0}), WithinAbs(0.0, 1e-14));
    REQUIRE_THAT(pot.energy({1.0}), WithinAbs(0.0, 1e-14));
    REQUIRE_THAT(pot.energy({0.0}), WithinAbs(1.0, 1e-14));
    // Confinement in the transverse coordinates
    REQUIRE_THAT(pot.energy({1.0, 2.0}), WithinAbs(4.0, 1e-14));
  }

  SECTION("Harmonic well") {
    enhsamp::HarmonicPot pot(4.0, {1.0, -1.0});
    REQUIRE_THAT(pot.energy({1.0, -1.0}), WithinAbs(0.0, 1e-14));
    REQUIRE_THAT(pot.energy({2.0, -1.0}), WithinAbs(2.0, 1e-14));
    auto f = pot.force({2.0, 0.0});
    REQUIRE_THAT(f[0], WithinAbs(-4.0, 1e-14));
    REQUIRE_THAT(f[1], WithinAbs(-4.0, 1e-14));
    REQUIRE(pot.stiffness() == 4.0);
  }

  SECTION("Muller-Brown minimum") {
    enhsamp::MullerBrownPot pot;
    // Deepest minimum, approximately (-0.558, 1.442)
    double e_min = pot.energy({-0.558, 1.442});
    REQUIRE_THAT(e_min, WithinAbs(-146.7, 0.1));
    auto f = pot.force({-0.558, 1.442});
    REQUIRE(std::hypot(f[0], f[1]) < 5.0);
    REQUIRE(enhsamp::to_string(pot.get_type()) == "MullerBrown");
  }
}

TEST_CASE("Analytic forces match the energy gradient", "[Potential]") {
  SECTION("Double well") {
    enhsamp::DoubleWellPot pot(2.0, 0.5);
    require_consistent_forces(pot, {0.3, -0.7, 1.1}, 1e-6);
    require_consistent_forces(pot, {-1.4}, 1e-6);
  }

  SECTION("Muller-Brown") {
    enhsamp::MullerBrownPot pot(0.1);
    require_consistent_forces(pot, {-0.5, 1.5}, 1e-6);
    require_consistent_forces(pot, {0.6, 0.0}, 1e-6);
    require_consistent_forces(pot, {-0.8, 0.6}, 1e-6);
  }

  SECTION("Harmonic") {
    enhsamp::HarmonicPot pot(3.0, {0.5, 0.5, -0.5});
    require_consistent_forces(pot, {1.0, -2.0, 0.25}, 1e-6);
  }

  SECTION("Biased double well") {
    auto base = std::make_shared<enhsamp::DoubleWellPot>();
    auto cv = std::make_shared<enhsamp::CoordinateCV>(0);
    enhsamp::BiasedPotential pot(base, enhsamp::HarmonicBias(cv, 0.4, 50.0));
    require_consistent_forces(pot, {0.1, 0.2}, 1e-5);
  }

  SECTION("Mixed alchemical surface") {
    auto a = std::make_shared<enhsamp::HarmonicPot>(1.0, Configuration{0.0});
    auto b = std::make_shared<enhsamp::DoubleWellPot>();
    enhsamp::LambdaPotential pot(a, b, 0.3);
    require_consistent_forces(pot, {0.7}, 1e-6);
  }
}

TEST_CASE("Potential preconditions", "[Potential]") {
  SECTION("Muller-Brown is two dimensional") {
    enhsamp::MullerBrownPot pot;
    REQUIRE_THROWS_AS(pot.energy({0.0, 0.0, 0.0}), std::runtime_error);
  }

  SECTION("Harmonic checks its center dimension") {
    enhsamp::HarmonicPot pot(1.0, {0.0, 0.0});
    REQUIRE_THROWS_AS(pot.energy({0.0}), std::runtime_error);
  }

  SECTION("Empty configuration") {
    enhsamp::DoubleWellPot pot;
    REQUIRE_THROWS_AS(pot.energy({}), std::runtime_error);
  }

  SECTION("Lambda outside [0, 1]") {
    auto a = std::make_shared<enhsamp::DoubleWellPot>();
    REQUIRE_THROWS_AS(enhsamp::LambdaPotential(a, a, 1.5),
                      std::runtime_error);
    REQUIRE_THROWS_AS(enhsamp::LambdaPotential(a, nullptr, 0.5),
                      std::runtime_error);
  }

  SECTION("Bias needs a differentiable collective variable") {
    auto cv = std::make_shared<enhsamp::FunctionCV>(
        "norm", [](const Configuration &x) { return std::abs(x[0]); });
    REQUIRE_THROWS_AS(enhsamp::HarmonicBias(cv, 0.0, 1.0), std::runtime_error);
    auto coord = std::make_shared<enhsamp::CoordinateCV>(0);
    REQUIRE_THROWS_AS(enhsamp::HarmonicBias(coord, 0.0, -1.0),
                      std::runtime_error);
  }
}

TEST_CASE("Force call registry", "[Potential]") {
  using Reg = enhsamp::registry<enhsamp::DoubleWellPot>;
  enhsamp::DoubleWellPot pot;
  Reg::forceCalls = 0;
  pot({0.5});
  pot.energy({0.2});
  pot.force({0.1});
  REQUIRE(Reg::forceCalls.load() == 3);

  size_t before = Reg::count.load();
  {
    enhsamp::DoubleWellPot other;
    REQUIRE(Reg::count.load() == before + 1);
  }
  REQUIRE(Reg::count.load() == before);

  SECTION("Concurrent construction and evaluation") {
    const size_t n_threads = 8, per_thread = 200;
    Reg::forceCalls = 0;
    std::vector<std::thread> pool;
    for (size_t t = 0; t < n_threads; ++t) {
      pool.emplace_back([=]() {
        for (size_t i = 0; i < per_thread; ++i) {
          enhsamp::DoubleWellPot local;
          enhsamp::DoubleWellPot copy(local);
          copy.energy({0.1});
        }
      });
    }
    for (auto &th : pool) {
      th.join();
    }
    REQUIRE(Reg::count.load() == before);
    REQUIRE(Reg::forceCalls.load() == n_threads * per_thread);
  }
}

TEST_CASE("Alchemical end states", "[Potential]") {
  auto a = std::make_shared<enhsamp::HarmonicPot>(1.0, Configuration{0.0});
  auto b = std::make_shared<enhsamp::HarmonicPot>(4.0, Configuration{1.0});
  const Configuration x{0.3};

  enhsamp::LambdaPotential at_a(a, b, 0.0);
  enhsamp::LambdaPotential at_b(a, b, 1.0);
  enhsamp::LambdaPotential half(a, b, 0.5);

  REQUIRE(at_a.energy(x) == a->energy(x));
  REQUIRE(at_b.energy(x) == b->energy(x));
  REQUIRE_THAT(half.energy(x),
               WithinAbs(0.5 * (a->energy(x) + b->energy(x)), 1e-14));
  REQUIRE_THAT(half.dudl(x), WithinAbs(b->energy(x) - a->energy(x), 1e-14));
}

TEST_CASE("Harmonic bias energy and force", "[Potential]") {
  auto cv = std::make_shared<enhsamp::LinearCV>(std::vector<double>{1.0, 1.0});
  enhsamp::HarmonicBias bias(cv, 1.0, 10.0);
  const Configuration x{1.0, 0.5};
  // zeta = 1.5
  REQUIRE_THAT(bias.energy(x), WithinAbs(1.25, 1e-14));
  auto f = bias.force(x);
  REQUIRE_THAT(f[0], WithinAbs(-5.0, 1e-14));
  REQUIRE_THAT(f[1], WithinAbs(-5.0, 1e-14));
  REQUIRE(bias.energy_at(1.0) == 0.0);
}
