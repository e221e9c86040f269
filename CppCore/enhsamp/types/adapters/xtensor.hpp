#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Conversion utilities between xtensor and native types.
 *
 * This file provides adapters for the @c xtensor library, enabling
 * interoperability between multidimensional arrays and the trajectory and
 * free-energy arrays produced by the samplers.
 */

#include <vector>
#include <xtensor/xtensor.hpp>

#include "enhsamp/types/Trajectory.hpp"

using enhsamp::types::Trajectory;

namespace enhsamp {
namespace types {
namespace adapt {
namespace xtensor {

/**
 * @brief Converts an xtensor array (one frame per row) to a Trajectory.
 * @param matrix  The source 2D xtensor array.
 * @return A @c Trajectory containing the copied data.
 */
inline Trajectory convertToTrajectory(const xt::xtensor<double, 2> &matrix) {
  Trajectory result(matrix.shape(0), matrix.shape(1));
  for (size_t i = 0; i < matrix.shape(0); ++i) {
    for (size_t j = 0; j < matrix.shape(1); ++j) {
      result(i, j) = matrix(i, j);
    }
  }
  return result;
}

/**
 * @brief Converts a native Trajectory to an xtensor array.
 * @param traj  The source trajectory.
 * @return A 2D @c xt::xtensor containing the data.
 */
inline xt::xtensor<double, 2> convertToXtensor(const Trajectory &traj) {
  xt::xtensor<double, 2> result =
      xt::zeros<double>({traj.frames(), traj.dims()});
  for (size_t i = 0; i < traj.frames(); ++i) {
    for (size_t j = 0; j < traj.dims(); ++j) {
      result(i, j) = traj(i, j);
    }
  }
  return result;
}

/**
 * @brief Converts a standard vector (density, free energy) to a 1D xtensor.
 * @param vector  The source vector.
 * @return A 1D @c xt::xtensor containing the data.
 */
template <typename T>
xt::xtensor<T, 1> convertToXtensor(const std::vector<T> &vector) {
  xt::xtensor<T, 1> result = xt::zeros<T>({vector.size()});
  std::copy(vector.begin(), vector.end(), result.begin());
  return result;
}

/**
 * @brief Converts a 1D xtensor to a standard vector.
 * @param vector  The source 1D xtensor.
 * @return A @c std::vector containing the data.
 */
template <typename T>
std::vector<T> convertToVector(const xt::xtensor<T, 1> &vector) {
  return std::vector<T>(vector.begin(), vector.end());
}

} // namespace xtensor
} // namespace adapt
} // namespace types
} // namespace enhsamp
