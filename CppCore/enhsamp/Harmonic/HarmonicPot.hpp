#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Header file for the isotropic harmonic well.
 *
 * The harmonic well has an analytic partition function, which makes it the
 * reference system for checking free-energy estimators.
 */

// clang-format off
#include <utility>
#include <vector>
// clang-format on
#include "enhsamp/Potential.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @class HarmonicPot
 * @brief @f$ U = \frac{k}{2} |x - x_c|^2 @f$.
 * @ingroup enhsamp_potentials
 */
class HarmonicPot : public Potential<HarmonicPot> {
public:
  /**
   * @brief Constructor for HarmonicPot.
   * @param stiffness Spring constant @a k.
   * @param center    Position of the minimum; fixes the dimension.
   */
  HarmonicPot(double stiffness, Configuration center)
      : Potential(PotType::Harmonic), m_k{stiffness},
        m_center(std::move(center)) {}

  /**
   * @brief Computes the forces and energy for a given configuration.
   * @param in Structure containing the coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  void forceImpl(const ForceInput &in, ForceOut *out) const override;

  std::vector<double> parameters() const override;

  /**
   * @brief Fetches the spring constant.
   * @return The stiffness @a k.
   */
  double stiffness() const { return m_k; }

private:
  double m_k;             //!< Spring constant.
  Configuration m_center; //!< Location of the minimum.
};

} // namespace enhsamp
