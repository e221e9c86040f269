// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/CollectiveVariable.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>

namespace enhsamp {

Configuration CollectiveVariable::gradient(const Configuration & /*conf*/) const {
  throw std::runtime_error(
      fmt::format("Collective variable '{}' has no gradient", name()));
}

std::vector<double> CollectiveVariable::values(const Trajectory &traj) const {
  std::vector<double> result;
  result.reserve(traj.frames());
  for (size_t i = 0; i < traj.frames(); ++i) {
    result.push_back(value(traj.frame(i)));
  }
  return result;
}

double CoordinateCV::value(const Configuration &conf) const {
  if (m_index >= conf.size()) {
    throw std::runtime_error(fmt::format(
        "Coordinate {} out of range for dimension {}", m_index, conf.size()));
  }
  return conf[m_index];
}

Configuration CoordinateCV::gradient(const Configuration &conf) const {
  if (m_index >= conf.size()) {
    throw std::runtime_error(fmt::format(
        "Coordinate {} out of range for dimension {}", m_index, conf.size()));
  }
  Configuration grad(conf.size(), 0.0);
  grad[m_index] = 1.0;
  return grad;
}

std::string CoordinateCV::name() const { return fmt::format("x{}", m_index); }

double LinearCV::value(const Configuration &conf) const {
  if (conf.size() != m_weights.size()) {
    throw std::runtime_error(
        fmt::format("Linear CV of dimension {} applied to dimension {}",
                    m_weights.size(), conf.size()));
  }
  double result = m_offset;
  for (size_t i = 0; i < conf.size(); ++i) {
    result += m_weights[i] * conf[i];
  }
  return result;
}

Configuration LinearCV::gradient(const Configuration &conf) const {
  if (conf.size() != m_weights.size()) {
    throw std::runtime_error(
        fmt::format("Linear CV of dimension {} applied to dimension {}",
                    m_weights.size(), conf.size()));
  }
  return m_weights;
}

std::string LinearCV::name() const {
  return fmt::format("linear[{}]", fmt::join(m_weights, ","));
}

Configuration FunctionCV::gradient(const Configuration &conf) const {
  if (!m_gradient) {
    return CollectiveVariable::gradient(conf);
  }
  Configuration grad = m_gradient(conf);
  if (grad.size() != conf.size()) {
    throw std::runtime_error(
        fmt::format("Gradient of '{}' has dimension {}, expected {}", m_label,
                    grad.size(), conf.size()));
  }
  return grad;
}

} // namespace enhsamp
