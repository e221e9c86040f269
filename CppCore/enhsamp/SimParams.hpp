#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Immutable parameter bundle threaded through every sampling call.
 */

#include <cstddef>
#include <cstdint>

namespace enhsamp {

/**
 * @brief Dynamics and recording parameters of one sampling run.
 * @ingroup enhsamp
 */
struct SimParams {
  double beta{1.0};               //!< Inverse temperature 1/kT.
  double timestep{1e-3};          //!< Integrator time step.
  double diffusion{1.0};          //!< Diffusion coefficient.
  size_t total_steps{10000};      //!< Number of integrator steps.
  size_t equilibration_steps{0};  //!< Steps discarded before recording.
  size_t output_frequency{1};     //!< Record every n-th step.
  uint64_t seed{2024};            //!< Seed of the run's random stream.
};

/**
 * @brief Checks the parameter bundle.
 * @param params The bundle to check.
 * @return Void.
 *
 * @warning Throws @c std::runtime_error unless @c beta, @c timestep and
 * @c diffusion are positive, @c equilibration_steps < @c total_steps and
 * 0 < @c output_frequency < @c total_steps.
 */
void validate(const SimParams &params);

/**
 * @brief Checks the three dynamics parameters used by a single step.
 * @param beta      Inverse temperature.
 * @param timestep  Time step.
 * @param diffusion Diffusion coefficient.
 * @return Void.
 */
void validateDynamics(double beta, double timestep, double diffusion);

} // namespace enhsamp
