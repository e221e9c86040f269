#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Overdamped Langevin (Brownian) dynamics.
 *
 * @f[
 *   x' = x + D \beta F(x) \Delta t + \sqrt{2 D \Delta t}\, \xi,
 *   \qquad \xi \sim \mathcal{N}(0, 1)
 * @f]
 * per coordinate. The step carries no state apart from the random stream
 * supplied by the caller.
 */

#include "enhsamp/Potential.hpp"
#include "enhsamp/Random.hpp"
#include "enhsamp/SimParams.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @brief Advances a configuration by one overdamped Langevin step.
 * @param x         Current configuration.
 * @param force     Force at @a x; must match its dimension.
 * @param beta      Inverse temperature, positive.
 * @param dt        Time step, positive.
 * @param diffusion Diffusion coefficient, positive.
 * @param rng       Random stream of the calling unit of work.
 * @return The propagated configuration.
 *
 * @warning Throws @c std::runtime_error on any violated precondition.
 */
Configuration langevin_step(const Configuration &x, const Configuration &force,
                            double beta, double dt, double diffusion,
                            RandomStream &rng);

/**
 * @class OverdampedLangevin
 * @brief Binds a potential and the dynamics parameters to the step.
 */
class OverdampedLangevin {
public:
  /**
   * @brief Constructor for OverdampedLangevin.
   * @param pot       Surface providing the force; must outlive the integrator.
   * @param beta      Inverse temperature.
   * @param dt        Time step.
   * @param diffusion Diffusion coefficient.
   */
  OverdampedLangevin(PotentialBase &pot, double beta, double dt,
                     double diffusion);

  /**
   * @brief Constructor reading the dynamics from a parameter bundle.
   * @param pot    Surface providing the force.
   * @param params Parameter bundle; only the dynamics fields are read.
   */
  OverdampedLangevin(PotentialBase &pot, const SimParams &params)
      : OverdampedLangevin(pot, params.beta, params.timestep,
                           params.diffusion) {}

  /**
   * @brief Evaluates the force at @a x and takes one step.
   * @param x   Current configuration.
   * @param rng Random stream of the calling unit of work.
   * @return The propagated configuration.
   */
  Configuration step(const Configuration &x, RandomStream &rng) const;

  double beta() const { return m_beta; }
  double timestep() const { return m_dt; }
  double diffusion() const { return m_diffusion; }
  PotentialBase &potential() const { return m_pot; }

private:
  PotentialBase &m_pot;
  double m_beta;
  double m_dt;
  double m_diffusion;
};

} // namespace enhsamp
