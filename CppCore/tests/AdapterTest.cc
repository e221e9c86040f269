// MIT License
// Copyright 2024--present enhsamp developers
#include <catch2/catch_all.hpp>
#include <cmath>
#include <vector>

#include "enhsamp/types/Trajectory.hpp"
#include "enhsamp/types/adapters/eigen.hpp"

#ifdef WITH_XTENSOR
#include "enhsamp/types/adapters/xtensor.hpp"
#endif

using namespace Catch::Matchers;

TEST_CASE("Trajectory container", "[Trajectory]") {
  Trajectory traj(2);
  traj.append({0.0, 1.0});
  traj.append({2.0, 3.0});
  traj.append({4.0, 5.0});

  REQUIRE(traj.frames() == 3);
  REQUIRE(traj.size() == 6);
  REQUIRE(traj(1, 1) == 3.0);
  REQUIRE(traj.back() == Configuration{4.0, 5.0});
  REQUIRE_THROWS_AS(traj.append({1.0}), std::runtime_error);

  SECTION("Reversal") {
    auto rev = traj.reversed();
    REQUIRE(rev.front() == traj.back());
    REQUIRE(rev.back() == traj.front());
  }

  SECTION("Joining skips the shared frame") {
    Trajectory tail{{4.0, 5.0}, {6.0, 7.0}};
    traj.extend(tail, 1);
    REQUIRE(traj.frames() == 4);
    REQUIRE(traj.back() == Configuration{6.0, 7.0});
  }
}

TEST_CASE("Eigen adapter", "[Adapters]") {
  Trajectory traj{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}};

  auto mat = enhsamp::types::adapt::eigen::convertToEigen(traj);
  REQUIRE(mat.rows() == 2);
  REQUIRE(mat.cols() == 3);
  REQUIRE(mat(1, 0) == 4.0);

  auto back = enhsamp::types::adapt::eigen::convertToTrajectory(mat);
  REQUIRE(back == traj);

  Configuration conf{0.5, -0.5};
  Eigen::VectorXd vec = enhsamp::types::adapt::eigen::convertToEigen(conf);
  REQUIRE(vec.size() == 2);
  REQUIRE_THAT(vec.norm(), WithinAbs(std::sqrt(0.5), 1e-15));
  REQUIRE(enhsamp::types::adapt::eigen::convertToVector(vec) == conf);
}

TEST_CASE("xtensor adapter", "[Adapters]") {
#ifdef WITH_XTENSOR
  Trajectory traj{{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
  auto arr = enhsamp::types::adapt::xtensor::convertToXtensor(traj);
  REQUIRE(arr.shape(0) == 3);
  REQUIRE(arr.shape(1) == 2);
  REQUIRE(arr(2, 1) == 6.0);
  REQUIRE(enhsamp::types::adapt::xtensor::convertToTrajectory(arr) == traj);

  std::vector<double> density{0.1, 0.2, 0.7};
  auto xdens = enhsamp::types::adapt::xtensor::convertToXtensor(density);
  REQUIRE(enhsamp::types::adapt::xtensor::convertToVector(xdens) == density);
#else
  SKIP("xtensor support disabled (WITH_XTENSOR not defined)");
#endif
}
