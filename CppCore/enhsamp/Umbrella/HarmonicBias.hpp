#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Harmonic restraint on a collective variable and the potential that
 * applies it.
 *
 * @c HarmonicBias binds the restraint parameters explicitly, and
 * @c BiasedPotential adds it to any wrapped surface, forming the sampling
 * potential of one umbrella window.
 */

// clang-format off
#include <memory>
#include <utility>
#include <vector>
// clang-format on
#include "enhsamp/CollectiveVariable.hpp"
#include "enhsamp/Potential.hpp"

namespace enhsamp {

/**
 * @class HarmonicBias
 * @brief @f$ w(x) = \frac{k}{2} (\zeta(x) - c)^2 @f$.
 */
class HarmonicBias {
public:
  /**
   * @brief Constructor for HarmonicBias.
   * @param cv       Differentiable collective variable @f$ \zeta @f$.
   * @param center   Restraint center @a c.
   * @param constant Force constant @a k.
   *
   * @warning Throws @c std::runtime_error when @a cv is null, has no
   * gradient, or @a constant is negative.
   */
  HarmonicBias(std::shared_ptr<const CollectiveVariable> cv, double center,
               double constant);

  /**
   * @brief Bias energy at a known CV value.
   * @param cv_value The collective variable value.
   * @return @f$ \frac{k}{2} (\zeta - c)^2 @f$.
   */
  double energy_at(double cv_value) const {
    const double d = cv_value - m_center;
    return 0.5 * m_k * d * d;
  }

  /**
   * @brief Bias energy of a configuration.
   * @param conf The configuration.
   * @return The restraint energy.
   */
  double energy(const Configuration &conf) const {
    return energy_at(m_cv->value(conf));
  }

  /**
   * @brief Bias force, @f$ -k (\zeta(x) - c) \nabla\zeta(x) @f$.
   * @param conf The configuration.
   * @return Force vector of the same dimension as @a conf.
   */
  Configuration force(const Configuration &conf) const;

  double center() const { return m_center; }
  double constant() const { return m_k; }
  const CollectiveVariable &cv() const { return *m_cv; }

private:
  std::shared_ptr<const CollectiveVariable> m_cv;
  double m_center;
  double m_k;
};

/**
 * @class BiasedPotential
 * @brief A wrapped potential plus one @c HarmonicBias.
 * @ingroup enhsamp_potentials
 */
class BiasedPotential : public Potential<BiasedPotential> {
public:
  /**
   * @brief Constructor for BiasedPotential.
   * @param base The unbiased surface, shared with the caller.
   * @param bias The restraint to add.
   */
  BiasedPotential(std::shared_ptr<PotentialBase> base, HarmonicBias bias);

  /**
   * @brief Computes the biased forces and energy.
   * @param in Structure containing the coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  void forceImpl(const ForceInput &in, ForceOut *out) const override;

  std::vector<double> parameters() const override;

  const HarmonicBias &bias() const { return m_bias; }

private:
  std::shared_ptr<PotentialBase> m_base;
  HarmonicBias m_bias;
};

} // namespace enhsamp
