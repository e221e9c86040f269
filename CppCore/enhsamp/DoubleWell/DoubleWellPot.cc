// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of the double-well potential methods.
 */

#include "enhsamp/DoubleWell/DoubleWellPot.hpp"

namespace enhsamp {

void DoubleWellPot::forceImpl(const ForceInput &in, ForceOut *out) const {
  checkParams(in);
  const double *R = in.pos;
  double *F = out->F;

  const double x = R[0];
  const double s = x * x - 1.0;
  out->energy = m_a * s * s;
  F[0] = -4.0 * m_a * x * s;

  for (size_t i = 1; i < in.nDims; ++i) {
    out->energy += m_b * R[i] * R[i];
    F[i] = -2.0 * m_b * R[i];
  }
}

} // namespace enhsamp
