#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Classification of configurations into named stable states.
 */

#include <memory>
#include <string>

#include "enhsamp/CollectiveVariable.hpp"

namespace enhsamp {

/**
 * @class StateIndicator
 * @brief True iff the collective variable lies strictly inside
 * @f$ (lower, upper) @f$.
 *
 * Two indicators need not cover the whole CV range; a configuration may
 * belong to neither.
 */
class StateIndicator {
public:
  /**
   * @brief Constructor for StateIndicator.
   * @param label Name of the state, e.g. "A".
   * @param cv    The collective variable, shared with other consumers.
   * @param lower Exclusive lower bound.
   * @param upper Exclusive upper bound.
   *
   * @warning Throws @c std::runtime_error when @a cv is null or the bounds
   * do not satisfy @a lower < @a upper.
   */
  StateIndicator(std::string label,
                 std::shared_ptr<const CollectiveVariable> cv, double lower,
                 double upper);

  /**
   * @brief Tests membership of a configuration.
   * @param conf The configuration.
   * @return True when the CV value is strictly within the bounds.
   */
  bool operator()(const Configuration &conf) const {
    return contains_value(m_cv->value(conf));
  }

  /**
   * @brief Tests membership of an already computed CV value.
   * @param cv_value The collective variable value.
   * @return True when the value is strictly within the bounds.
   */
  bool contains_value(double cv_value) const {
    return cv_value > m_lower && cv_value < m_upper;
  }

  const std::string &name() const { return m_label; }
  double lower() const { return m_lower; }
  double upper() const { return m_upper; }

private:
  std::string m_label;
  std::shared_ptr<const CollectiveVariable> m_cv;
  double m_lower;
  double m_upper;
};

} // namespace enhsamp
