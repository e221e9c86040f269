#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Collective variables (scalar reaction coordinates).
 *
 * A collective variable maps a configuration to one scalar. It classifies
 * configurations into stable states and carries the harmonic restraint of
 * umbrella sampling, which additionally requires its gradient.
 */

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "enhsamp/types/Trajectory.hpp"

using enhsamp::types::Configuration;
using enhsamp::types::Trajectory;

namespace enhsamp {

/**
 * @class CollectiveVariable
 * @brief Abstract capability @c config -> scalar, optionally differentiable.
 */
class CollectiveVariable {
public:
  virtual ~CollectiveVariable() = default;

  /**
   * @brief Evaluates the collective variable.
   * @param conf The configuration.
   * @return The scalar value.
   */
  virtual double value(const Configuration &conf) const = 0;

  /**
   * @brief Gradient with respect to the configuration.
   * @param conf The configuration.
   * @return Vector of the same dimension as @a conf.
   *
   * @warning The default throws @c std::runtime_error; only variables that
   * report @c has_gradient() may be used under a bias.
   */
  virtual Configuration gradient(const Configuration &conf) const;

  /**
   * @brief Whether @c gradient is implemented.
   * @return True for differentiable variables.
   */
  virtual bool has_gradient() const { return false; }

  /**
   * @brief Label used in log messages.
   * @return The name.
   */
  virtual std::string name() const = 0;

  /**
   * @brief Evaluates the variable on every frame of a trajectory.
   * @param traj The trajectory.
   * @return One value per frame.
   */
  std::vector<double> values(const Trajectory &traj) const;
};

/**
 * @class CoordinateCV
 * @brief Projection on one Cartesian coordinate.
 */
class CoordinateCV : public CollectiveVariable {
public:
  explicit CoordinateCV(size_t index) : m_index(index) {}

  double value(const Configuration &conf) const override;
  Configuration gradient(const Configuration &conf) const override;
  bool has_gradient() const override { return true; }
  std::string name() const override;

private:
  size_t m_index; //!< Index of the projected coordinate.
};

/**
 * @class LinearCV
 * @brief @f$ \zeta(x) = w \cdot x + c @f$.
 */
class LinearCV : public CollectiveVariable {
public:
  /**
   * @brief Constructor for LinearCV.
   * @param weights Direction @a w; fixes the dimension.
   * @param offset  Constant shift @a c.
   */
  explicit LinearCV(std::vector<double> weights, double offset = 0.0)
      : m_weights(std::move(weights)), m_offset(offset) {}

  double value(const Configuration &conf) const override;
  Configuration gradient(const Configuration &conf) const override;
  bool has_gradient() const override { return true; }
  std::string name() const override;

private:
  std::vector<double> m_weights; //!< Projection direction.
  double m_offset;               //!< Additive constant.
};

/**
 * @class FunctionCV
 * @brief Wraps user supplied callables as a collective variable.
 *
 * The gradient callable may be empty, in which case the variable is usable
 * for state classification only.
 */
class FunctionCV : public CollectiveVariable {
public:
  using ValueFn = std::function<double(const Configuration &)>;
  using GradientFn = std::function<Configuration(const Configuration &)>;

  FunctionCV(std::string label, ValueFn value_fn, GradientFn gradient_fn = {})
      : m_label(std::move(label)), m_value(std::move(value_fn)),
        m_gradient(std::move(gradient_fn)) {}

  double value(const Configuration &conf) const override {
    return m_value(conf);
  }
  Configuration gradient(const Configuration &conf) const override;
  bool has_gradient() const override { return static_cast<bool>(m_gradient); }
  std::string name() const override { return m_label; }

private:
  std::string m_label;
  ValueFn m_value;
  GradientFn m_gradient;
};

} // namespace enhsamp
