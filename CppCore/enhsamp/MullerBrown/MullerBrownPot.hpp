#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Header file for the Muller-Brown potential class.
 *
 * This file defines the @c MullerBrownPot class, the standard two-dimensional
 * benchmark surface built from four anisotropic Gaussians, with three minima
 * connected by a curved minimum energy path.
 */

// clang-format off
#include <array>
#include <vector>
// clang-format on
#include "enhsamp/Potential.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @class MullerBrownPot
 * @brief Implementation of the Muller-Brown surface.
 * @ingroup enhsamp_potentials
 *
 * # References
 * K. Muller and L. D. Brown, Theor. Chim. Acta 53, 75 (1979).
 */
class MullerBrownPot : public Potential<MullerBrownPot> {
public:
  /**
   * @brief Constructor for MullerBrownPot.
   * @param scale Multiplier applied to the whole surface.
   */
  explicit MullerBrownPot(double scale = 1.0)
      : Potential(PotType::MullerBrown), m_scale{scale} {}

  /**
   * @brief Computes the forces and energy for a given configuration.
   * @param in Structure containing the coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  void forceImpl(const ForceInput &in, ForceOut *out) const override;

  std::vector<double> parameters() const override { return {m_scale}; }

private:
  double m_scale; //!< Overall energy scale.

  static constexpr std::array<double, 4> A{-200.0, -100.0, -170.0, 15.0};
  static constexpr std::array<double, 4> a{-1.0, -1.0, -6.5, 0.7};
  static constexpr std::array<double, 4> b{0.0, 0.0, 11.0, 0.6};
  static constexpr std::array<double, 4> c{-10.0, -10.0, -6.5, 0.7};
  static constexpr std::array<double, 4> x0{1.0, 0.0, -0.5, -1.0};
  static constexpr std::array<double, 4> y0{0.0, 0.5, 1.5, 1.0};
};

} // namespace enhsamp
