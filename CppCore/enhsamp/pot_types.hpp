/**
 * @brief Definitions for supported potential energy surface types.
 *
 * This file defines the central @c PotType enumeration used to tag model
 * surfaces and composite potentials. The tag also enters the evaluation cache
 * key, so two potentials of different type never share cached results.
 */

#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/base_types.hpp"

namespace enhsamp {

/**
 * @brief Supported potential energy surface types.
 */
enum class PotType {
  UNKNOWN = 0, //!<  The type is not defined or is invalid.
  DoubleWell,  //!<  Quartic double well along the first coordinate.
  MullerBrown, //!<  Four-Gaussian Muller-Brown surface in two dimensions.
  Harmonic,    //!<  Isotropic harmonic well.
  Umbrella,    //!<  Wrapped potential plus a harmonic CV restraint.
  Alchemical   //!<  Linear interpolation between two end-state potentials.
};

/**
 * @brief Human-readable name of a potential type.
 * @param ptype The type tag.
 * @return The name used in log messages.
 */
inline std::string to_string(PotType ptype) {
  switch (ptype) {
  case PotType::DoubleWell:
    return "DoubleWell";
  case PotType::MullerBrown:
    return "MullerBrown";
  case PotType::Harmonic:
    return "Harmonic";
  case PotType::Umbrella:
    return "Umbrella";
  case PotType::Alchemical:
    return "Alchemical";
  default:
    return "UNKNOWN";
  }
}

} // namespace enhsamp
