// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/analysis/Histogram.hpp"

#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace enhsamp {
namespace analysis {

Histogram::Histogram(double lo, double hi, size_t n_bins)
    : m_lo(lo), m_hi(hi), m_width(0.0), m_counts(n_bins, 0) {
  if (n_bins == 0) {
    throw std::runtime_error("Histogram needs at least one bin");
  }
  if (!(lo < hi) || !std::isfinite(lo) || !std::isfinite(hi)) {
    throw std::runtime_error(
        fmt::format("Histogram range [{}, {}) is empty", lo, hi));
  }
  m_width = (hi - lo) / static_cast<double>(n_bins);
}

void Histogram::add(double sample) {
  if (!(sample >= m_lo && sample < m_hi)) {
    ++m_out_of_range;
    return;
  }
  auto idx = static_cast<size_t>((sample - m_lo) / m_width);
  // Rounding can push samples just below hi into a non-existent bin
  if (idx >= m_counts.size()) {
    idx = m_counts.size() - 1;
  }
  ++m_counts[idx];
  ++m_in_range;
}

void Histogram::add(const std::vector<double> &samples) {
  for (double s : samples) {
    add(s);
  }
}

std::vector<double> Histogram::density() const {
  if (m_in_range == 0) {
    return std::vector<double>(m_counts.size(),
                               std::numeric_limits<double>::quiet_NaN());
  }
  const double norm = static_cast<double>(m_in_range) * m_width;
  std::vector<double> result(m_counts.size());
  for (size_t i = 0; i < m_counts.size(); ++i) {
    result[i] = static_cast<double>(m_counts[i]) / norm;
  }
  return result;
}

std::vector<double> Histogram::centers() const {
  std::vector<double> result(m_counts.size());
  for (size_t i = 0; i < m_counts.size(); ++i) {
    result[i] = m_lo + (static_cast<double>(i) + 0.5) * m_width;
  }
  return result;
}

} // namespace analysis
} // namespace enhsamp
