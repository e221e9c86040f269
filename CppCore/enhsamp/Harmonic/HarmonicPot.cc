// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/Harmonic/HarmonicPot.hpp"

namespace enhsamp {

void HarmonicPot::forceImpl(const ForceInput &in, ForceOut *out) const {
  checkDims(in, m_center.size(), "Harmonic");
  zeroForceOut(in.nDims, out);
  for (size_t i = 0; i < in.nDims; ++i) {
    const double d = in.pos[i] - m_center[i];
    out->energy += 0.5 * m_k * d * d;
    out->F[i] = -m_k * d;
  }
}

std::vector<double> HarmonicPot::parameters() const {
  std::vector<double> params{m_k};
  params.insert(params.end(), m_center.begin(), m_center.end());
  return params;
}

} // namespace enhsamp
