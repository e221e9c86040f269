// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/StateIndicator.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace enhsamp {

StateIndicator::StateIndicator(std::string label,
                               std::shared_ptr<const CollectiveVariable> cv,
                               double lower, double upper)
    : m_label(std::move(label)), m_cv(std::move(cv)), m_lower(lower),
      m_upper(upper) {
  if (!m_cv) {
    throw std::runtime_error(
        fmt::format("State '{}' needs a collective variable", m_label));
  }
  if (!(lower < upper)) {
    throw std::runtime_error(fmt::format(
        "State '{}' has empty interval ({}, {})", m_label, lower, upper));
  }
}

} // namespace enhsamp
