// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/Integrator.hpp"

#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

namespace enhsamp {

Configuration langevin_step(const Configuration &x, const Configuration &force,
                            double beta, double dt, double diffusion,
                            RandomStream &rng) {
  validateDynamics(beta, dt, diffusion);
  if (force.size() != x.size()) {
    throw std::runtime_error(
        fmt::format("Force has dimension {} but configuration has {}",
                    force.size(), x.size()));
  }
  const double drift = diffusion * beta * dt;
  const double noise = std::sqrt(2.0 * diffusion * dt);
  Configuration result(x.size());
  for (size_t i = 0; i < x.size(); ++i) {
    result[i] = x[i] + drift * force[i] + noise * rng.normal();
  }
  return result;
}

OverdampedLangevin::OverdampedLangevin(PotentialBase &pot, double beta,
                                       double dt, double diffusion)
    : m_pot(pot), m_beta(beta), m_dt(dt), m_diffusion(diffusion) {
  validateDynamics(beta, dt, diffusion);
}

Configuration OverdampedLangevin::step(const Configuration &x,
                                       RandomStream &rng) const {
  return langevin_step(x, m_pot.force(x), m_beta, m_dt, m_diffusion, rng);
}

} // namespace enhsamp
