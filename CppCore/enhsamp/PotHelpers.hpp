#pragma once
// MIT License
// Copyright 2024--present enhsamp developers
#include "ForceStructs.hpp"
#include "enhsamp/types/Trajectory.hpp"
#include <atomic>
#include <cstddef>
#include <string>

/**
 * @brief Utility templates and functions for potential management.
 *
 * Defines a static registry for tracking potential instances and global force
 * call counters. It also provides utility functions for structure
 * initialization and validation, and a finite-difference force used to check
 * the force contract of a surface.
 */

namespace enhsamp {

class PotentialBase;

/**
 * @class registry
 * @brief Static registry for instance counting and statistics.
 *
 * Both counters are atomic since surfaces are constructed, destroyed and
 * evaluated on umbrella worker threads.
 */
template <typename T> class registry {
public:
  static std::atomic<size_t> count;      //!< Total number of active instances.
  static std::atomic<size_t> forceCalls; //!< Global counter for force evaluations.

protected:
  /**
   * @brief Default constructor.
   */
  registry() { ++count; }

  /**
   * @brief Copy constructor.
   */
  registry(const registry &) { ++count; }

  /**
   * @brief Destructor.
   */
  ~registry() { --count; }

public:
  /**
   * @brief Increments the force call counter.
   * @return Void.
   */
  static void incrementForceCalls() { ++forceCalls; }
};

template <typename T> std::atomic<size_t> registry<T>::count{0};
template <typename T> std::atomic<size_t> registry<T>::forceCalls{0};

/**
 * @brief Zeroes the members of a ForceOut structure.
 * @param nDims The number of coordinates.
 * @param efvd The results structure to reset.
 * @return Void.
 */
void zeroForceOut(const size_t &nDims, ForceOut *efvd);

/**
 * @brief Validates the input parameters for a potential calculation.
 * @param params The configuration structure to check.
 * @return Void.
 */
void checkParams(const ForceInput &params);

/**
 * @brief Validates that a force call matches the dimension of a surface.
 * @param params   The configuration structure to check.
 * @param expected Required number of coordinates.
 * @param name     Surface name used in the error message.
 * @return Void.
 */
void checkDims(const ForceInput &params, size_t expected,
               const std::string &name);

/**
 * @brief Central finite-difference estimate of the force.
 * @param pot  The potential to differentiate.
 * @param conf The configuration at which to evaluate.
 * @param h    Displacement used for each coordinate.
 * @return The vector @c -(U(x+h e_i) - U(x-h e_i)) / 2h.
 */
types::Configuration numerical_force(PotentialBase &pot,
                                     const types::Configuration &conf,
                                     double h = 1e-5);

} // namespace enhsamp
