// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of utility functions for potential management.
 *
 * Contains the implementations for global helper functions used to manage and
 * validate the core force and energy data structures.
 */

#include "PotHelpers.hpp"
#include "enhsamp/Potential.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace enhsamp {

/**
 * @details
 * This function performs a manual reset of the @c ForceOut structure.
 * It ensures the energy and variance are set to zero and clears every
 * force component.
 */
void zeroForceOut(const size_t &nDims, ForceOut *efvd) {
  efvd->energy = 0;
  efvd->variance = 0;
  for (size_t idx{0}; idx < nDims; idx++) {
    efvd->F[idx] = 0;
  }
}

/**
 * @details
 * Verifies that the input parameters describe a usable configuration.
 * Currently, it strictly checks that there is at least one coordinate.
 *
 * @warning Throws a @c std::runtime_error if @a nDims is zero.
 */
void checkParams(const ForceInput &params) {
  if (params.nDims == 0) {
    throw std::runtime_error("Can't work with zero coordinates in force call");
  }
}

void checkDims(const ForceInput &params, size_t expected,
               const std::string &name) {
  checkParams(params);
  if (params.nDims != expected) {
    throw std::runtime_error(
        fmt::format("{} potential expects {} coordinates, got {}", name,
                    expected, params.nDims));
  }
}

/**
 * @details
 * Each coordinate is displaced by @a h in both directions and only the
 * energies are used, so the result is independent of the analytic force
 * implementation under test.
 */
types::Configuration numerical_force(PotentialBase &pot,
                                     const types::Configuration &conf,
                                     double h) {
  types::Configuration force(conf.size(), 0.0);
  types::Configuration shifted = conf;
  for (size_t i = 0; i < conf.size(); ++i) {
    shifted[i] = conf[i] + h;
    double e_plus = pot.energy(shifted);
    shifted[i] = conf[i] - h;
    double e_minus = pot.energy(shifted);
    shifted[i] = conf[i];
    force[i] = -(e_plus - e_minus) / (2.0 * h);
  }
  return force;
}

} // namespace enhsamp
