#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Header file for the quartic double-well potential class.
 *
 * This file defines the @c DoubleWellPot class, a two-state model surface
 * with minima at @f$ x_0 = \pm 1 @f$ separated by a barrier at the origin,
 * and harmonic confinement along every other coordinate.
 */

// clang-format off
#include <utility>
#include <vector>
// clang-format on
#include "enhsamp/Potential.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @class DoubleWellPot
 * @brief @f$ U = a (x_0^2 - 1)^2 + b \sum_{i \geq 1} x_i^2 @f$.
 * @ingroup enhsamp_potentials
 */
class DoubleWellPot : public Potential<DoubleWellPot> {
public:
  /**
   * @brief Constructor for DoubleWellPot.
   * @param barrier    Barrier height @a a at the origin.
   * @param confinement Harmonic coefficient @a b of the other coordinates.
   */
  explicit DoubleWellPot(double barrier = 1.0, double confinement = 1.0)
      : Potential(PotType::DoubleWell), m_a{barrier}, m_b{confinement} {}

  /**
   * @brief Computes the forces and energy for a given configuration.
   * @param in Structure containing the coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  void forceImpl(const ForceInput &in, ForceOut *out) const override;

  std::vector<double> parameters() const override { return {m_a, m_b}; }

private:
  double m_a; //!< Barrier height.
  double m_b; //!< Confinement of the transverse coordinates.
};

} // namespace enhsamp
