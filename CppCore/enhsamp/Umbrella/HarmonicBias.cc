// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of the harmonic restraint and the biased potential.
 */

#include "enhsamp/Umbrella/HarmonicBias.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace enhsamp {

HarmonicBias::HarmonicBias(std::shared_ptr<const CollectiveVariable> cv,
                           double center, double constant)
    : m_cv(std::move(cv)), m_center(center), m_k(constant) {
  if (!m_cv) {
    throw std::runtime_error("Harmonic bias needs a collective variable");
  }
  if (!m_cv->has_gradient()) {
    throw std::runtime_error(fmt::format(
        "Collective variable '{}' has no gradient and cannot be biased",
        m_cv->name()));
  }
  if (m_k < 0.0) {
    throw std::runtime_error(
        fmt::format("Bias force constant must be non-negative, got {}", m_k));
  }
}

/**
 * @details
 * Chain rule through the collective variable. The gradient dimension is
 * checked against the configuration.
 */
Configuration HarmonicBias::force(const Configuration &conf) const {
  Configuration grad = m_cv->gradient(conf);
  if (grad.size() != conf.size()) {
    throw std::runtime_error("CV gradient does not match configuration");
  }
  const double prefactor = -m_k * (m_cv->value(conf) - m_center);
  for (auto &g : grad) {
    g *= prefactor;
  }
  return grad;
}

BiasedPotential::BiasedPotential(std::shared_ptr<PotentialBase> base,
                                 HarmonicBias bias)
    : Potential(PotType::Umbrella), m_base(std::move(base)),
      m_bias(std::move(bias)) {
  if (!m_base) {
    throw std::runtime_error("Biased potential needs a base potential");
  }
}

void BiasedPotential::forceImpl(const ForceInput &in, ForceOut *out) const {
  checkParams(in);
  Configuration conf(in.pos, in.pos + in.nDims);
  auto [energy, forces] = (*m_base)(conf);
  Configuration bias_force = m_bias.force(conf);

  out->energy = energy + m_bias.energy(conf);
  for (size_t i = 0; i < in.nDims; ++i) {
    out->F[i] = forces[i] + bias_force[i];
  }
}

std::vector<double> BiasedPotential::parameters() const {
  std::vector<double> params{m_bias.center(), m_bias.constant(),
                             static_cast<double>(m_base->get_type())};
  auto base_params = m_base->parameters();
  params.insert(params.end(), base_params.begin(), base_params.end());
  return params;
}

} // namespace enhsamp
