// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of the Muller-Brown potential methods.
 */

// clang-format off
#include <cmath>
// clang-format on
#include "enhsamp/MullerBrown/MullerBrownPot.hpp"

namespace enhsamp {

/**
 * @details
 * Sums the four Gaussian terms
 * @f$ A_k \exp(a_k dx^2 + b_k dx\,dy + c_k dy^2) @f$ and their analytic
 * derivatives in one pass.
 *
 * @warning Throws @c std::runtime_error unless the configuration has exactly
 * two coordinates.
 */
void MullerBrownPot::forceImpl(const ForceInput &in, ForceOut *out) const {
  checkDims(in, 2, "Muller-Brown");
  const double x = in.pos[0];
  const double y = in.pos[1];
  double U{0}, dUdx{0}, dUdy{0};

  for (size_t k = 0; k < A.size(); ++k) {
    const double dx = x - x0[k];
    const double dy = y - y0[k];
    const double term =
        A[k] * std::exp(a[k] * dx * dx + b[k] * dx * dy + c[k] * dy * dy);
    U += term;
    dUdx += term * (2.0 * a[k] * dx + b[k] * dy);
    dUdy += term * (b[k] * dx + 2.0 * c[k] * dy);
  }

  out->energy = m_scale * U;
  out->F[0] = -m_scale * dUdx;
  out->F[1] = -m_scale * dUdy;
}

} // namespace enhsamp
