#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Linear alchemical coupling between two end-state potentials.
 *
 * @f$ U(x; \lambda) = (1 - \lambda) U_A(x) + \lambda U_B(x) @f$, so that
 * @f$ \partial U / \partial \lambda = U_B - U_A @f$. At @f$ \lambda = 0 @f$
 * the surface is exactly @f$ U_A @f$ and at @f$ \lambda = 1 @f$ exactly
 * @f$ U_B @f$.
 */

// clang-format off
#include <memory>
#include <vector>
// clang-format on
#include "enhsamp/Potential.hpp"

namespace enhsamp {

/**
 * @class LambdaPotential
 * @brief Mixture of a source and a target surface at fixed @f$ \lambda @f$.
 * @ingroup enhsamp_potentials
 */
class LambdaPotential : public Potential<LambdaPotential> {
public:
  /**
   * @brief Constructor for LambdaPotential.
   * @param source Surface at @f$ \lambda = 0 @f$.
   * @param target Surface at @f$ \lambda = 1 @f$.
   * @param lambda Coupling parameter in [0, 1].
   *
   * @warning Throws @c std::runtime_error for null surfaces or a
   * @a lambda outside [0, 1].
   */
  LambdaPotential(std::shared_ptr<PotentialBase> source,
                  std::shared_ptr<PotentialBase> target, double lambda);

  void forceImpl(const ForceInput &in, ForceOut *out) const override;

  std::vector<double> parameters() const override;

  /**
   * @brief Derivative of the coupled energy with respect to lambda.
   * @param conf The configuration.
   * @return @f$ U_B(x) - U_A(x) @f$.
   */
  double dudl(const Configuration &conf) const;

  double lambda() const { return m_lambda; }

private:
  std::shared_ptr<PotentialBase> m_source;
  std::shared_ptr<PotentialBase> m_target;
  double m_lambda;
};

} // namespace enhsamp
