// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/SimParams.hpp"

#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

namespace enhsamp {

void validateDynamics(double beta, double timestep, double diffusion) {
  if (!(beta > 0.0) || !std::isfinite(beta)) {
    throw std::runtime_error(
        fmt::format("Inverse temperature must be positive, got {}", beta));
  }
  if (!(timestep > 0.0) || !std::isfinite(timestep)) {
    throw std::runtime_error(
        fmt::format("Time step must be positive, got {}", timestep));
  }
  if (!(diffusion > 0.0) || !std::isfinite(diffusion)) {
    throw std::runtime_error(fmt::format(
        "Diffusion coefficient must be positive, got {}", diffusion));
  }
}

void validate(const SimParams &params) {
  validateDynamics(params.beta, params.timestep, params.diffusion);
  if (params.equilibration_steps >= params.total_steps) {
    throw std::runtime_error(
        fmt::format("Equilibration ({} steps) must be shorter than the run "
                    "({} steps)",
                    params.equilibration_steps, params.total_steps));
  }
  if (params.output_frequency == 0 ||
      params.output_frequency >= params.total_steps) {
    throw std::runtime_error(
        fmt::format("Output frequency must lie in (0, {}), got {}",
                    params.total_steps, params.output_frequency));
  }
}

} // namespace enhsamp
