#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Conversion utilities between Eigen and native types.
 *
 * This file contains inline adapter functions for integrating the Eigen
 * linear algebra library with the native @c Trajectory and
 * @c Configuration types used in the enhsamp library.
 */

// clang-format off
#include <Eigen/Dense>
// clang-format on
#include <vector>

#include "enhsamp/types/Trajectory.hpp"

using enhsamp::types::Configuration;
using enhsamp::types::Trajectory;

namespace enhsamp {
namespace types {
namespace adapt {
namespace eigen {

/**
 * @brief Converts an Eigen matrix (one frame per row) to a Trajectory.
 * @param matrix  The source Eigen matrix.
 * @return A @c Trajectory instance with copied data.
 */
inline Trajectory convertToTrajectory(const Eigen::MatrixXd &matrix) {
  Trajectory result(matrix.rows(), matrix.cols());
  for (int i = 0; i < matrix.rows(); ++i) {
    for (int j = 0; j < matrix.cols(); ++j) {
      result(i, j) = matrix(i, j);
    }
  }
  return result;
}

/**
 * @brief Converts a native Trajectory to an Eigen matrix.
 * @param traj  The source trajectory.
 * @return An @c Eigen::MatrixXd with one frame per row.
 * @note This reads through an @c Eigen::Map over the row-major storage.
 */
inline Eigen::MatrixXd convertToEigen(const Trajectory &traj) {
  return Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic,
                                        Eigen::RowMajor>>(
      traj.data(), traj.frames(), traj.dims());
}

/**
 * @brief Converts a Configuration to an Eigen vector.
 * @param conf  The source configuration.
 * @return An @c Eigen::VectorXd holding a copy of the coordinates.
 */
inline Eigen::VectorXd convertToEigen(const Configuration &conf) {
  return Eigen::Map<const Eigen::VectorXd>(conf.data(), conf.size());
}

/**
 * @brief Converts an Eigen vector to a standard vector.
 * @param vector  The source Eigen vector.
 * @return A @c std::vector containing the data.
 */
template <typename T>
std::vector<T> convertToVector(const Eigen::VectorX<T> &vector) {
  return std::vector<T>(vector.data(), vector.data() + vector.size());
}

} // namespace eigen
} // namespace adapt
} // namespace types
} // namespace enhsamp
