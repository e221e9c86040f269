// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/Alchemical/LambdaPotential.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace enhsamp {

LambdaPotential::LambdaPotential(std::shared_ptr<PotentialBase> source,
                                 std::shared_ptr<PotentialBase> target,
                                 double lambda)
    : Potential(PotType::Alchemical), m_source(std::move(source)),
      m_target(std::move(target)), m_lambda(lambda) {
  if (!m_source || !m_target) {
    throw std::runtime_error("Alchemical potential needs both end states");
  }
  if (!(lambda >= 0.0 && lambda <= 1.0)) {
    throw std::runtime_error(
        fmt::format("Lambda must lie in [0, 1], got {}", lambda));
  }
}

/**
 * @details
 * The end points skip the unused surface entirely, so that the coupled
 * surface reproduces the source or target bit for bit.
 */
void LambdaPotential::forceImpl(const ForceInput &in, ForceOut *out) const {
  checkParams(in);
  Configuration conf(in.pos, in.pos + in.nDims);
  if (m_lambda == 0.0 || m_lambda == 1.0) {
    auto &surface = (m_lambda == 0.0) ? m_source : m_target;
    auto [energy, forces] = (*surface)(conf);
    out->energy = energy;
    std::copy(forces.begin(), forces.end(), out->F);
    return;
  }
  auto [e_a, f_a] = (*m_source)(conf);
  auto [e_b, f_b] = (*m_target)(conf);
  out->energy = (1.0 - m_lambda) * e_a + m_lambda * e_b;
  for (size_t i = 0; i < in.nDims; ++i) {
    out->F[i] = (1.0 - m_lambda) * f_a[i] + m_lambda * f_b[i];
  }
}

double LambdaPotential::dudl(const Configuration &conf) const {
  return m_target->energy(conf) - m_source->energy(conf);
}

std::vector<double> LambdaPotential::parameters() const {
  std::vector<double> params{m_lambda,
                             static_cast<double>(m_source->get_type()),
                             static_cast<double>(m_target->get_type())};
  auto pa = m_source->parameters();
  auto pb = m_target->parameters();
  params.insert(params.end(), pa.begin(), pa.end());
  params.insert(params.end(), pb.begin(), pb.end());
  return params;
}

} // namespace enhsamp
