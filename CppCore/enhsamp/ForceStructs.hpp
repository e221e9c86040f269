#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief POD structures for force and energy calculation interfaces.
 *
 * Defines the flat data exchange structures passed from the high-level
 * potential wrapper to each concrete surface implementation.
 */

#include <cstddef>

namespace enhsamp {

/**
 * @brief Data structure containing the configuration for force calls.
 * @ingroup enhsamp
 */
typedef struct {
  const size_t nDims; //!< Number of coordinates in the configuration.
  const double *pos;  //!< Pointer to the flat coordinate array.
} ForceInput;

/**
 * @brief Data structure to store results from force calculations.
 * @ingroup enhsamp
 */
typedef struct {
  double *F;       //!< Pointer to the array where forces will be stored.
  double energy;   //!< Calculated potential energy of the configuration.
  double variance; //!< Variance or uncertainty of the calculation.
  // Analytic surfaces leave the variance at zero
} ForceOut;

} // namespace enhsamp
