// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of the free-energy estimators.
 */

#include "enhsamp/analysis/FreeEnergy.hpp"
#include "enhsamp/logging.hpp"

#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace enhsamp {
namespace analysis {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

double RunningAverage::value() const {
  if (m_count == 0) {
    return kNaN;
  }
  return m_mean;
}

double thermodynamic_integration(const std::vector<double> &lambdas,
                                 const std::vector<double> &dudl) {
  if (lambdas.size() != dudl.size()) {
    throw std::runtime_error(
        fmt::format("Got {} lambda values but {} dU/dlambda averages",
                    lambdas.size(), dudl.size()));
  }
  if (lambdas.size() < 2) {
    throw std::runtime_error("Thermodynamic integration needs two points");
  }
  if (lambdas.front() != 0.0 || lambdas.back() != 1.0) {
    throw std::runtime_error(
        fmt::format("Lambda grid must run from 0 to 1, got [{}, {}]",
                    lambdas.front(), lambdas.back()));
  }
  double delta_f = 0.0;
  for (size_t i = 1; i < lambdas.size(); ++i) {
    const double dl = lambdas[i] - lambdas[i - 1];
    if (!(dl > 0.0)) {
      throw std::runtime_error("Lambda grid must be strictly ascending");
    }
    delta_f += 0.5 * dl * (dudl[i] + dudl[i - 1]);
  }
  return delta_f;
}

ZwanzigEstimator::ZwanzigEstimator(double beta) : m_beta(beta) {
  if (!(beta > 0.0) || !std::isfinite(beta)) {
    throw std::runtime_error(
        fmt::format("Inverse temperature must be positive, got {}", beta));
  }
}

void ZwanzigEstimator::add(double delta_u) {
  m_avg.add(std::exp(-m_beta * delta_u));
}

double ZwanzigEstimator::free_energy() const {
  const double avg = m_avg.value();
  if (std::isnan(avg) || !(avg > 0.0)) {
    log::get()->warn("Zwanzig average {} over {} samples is not positive; "
                     "free energy undefined",
                     avg, m_avg.count());
    return kNaN;
  }
  return -std::log(avg) / m_beta;
}

double staged_free_energy(const std::vector<ZwanzigEstimator> &stages) {
  double total = 0.0;
  for (const auto &stage : stages) {
    const double df = stage.free_energy();
    if (std::isnan(df)) {
      return kNaN;
    }
    total += df;
  }
  return total;
}

std::vector<double> boltzmann_inversion(const std::vector<double> &density,
                                        double beta) {
  if (!(beta > 0.0) || !std::isfinite(beta)) {
    throw std::runtime_error(
        fmt::format("Inverse temperature must be positive, got {}", beta));
  }
  std::vector<double> result(density.size());
  for (size_t i = 0; i < density.size(); ++i) {
    result[i] = (density[i] > 0.0) ? -std::log(density[i]) / beta : kNaN;
  }
  return result;
}

std::vector<std::pair<double, double>>
finite_bins(const std::vector<double> &x, const std::vector<double> &f) {
  if (x.size() != f.size()) {
    throw std::runtime_error("Bin coordinates and values differ in size");
  }
  std::vector<std::pair<double, double>> result;
  for (size_t i = 0; i < x.size(); ++i) {
    if (std::isfinite(f[i])) {
      result.emplace_back(x[i], f[i]);
    }
  }
  return result;
}

std::vector<double> shift_to_minimum(const std::vector<double> &f) {
  double fmin = std::numeric_limits<double>::infinity();
  for (double v : f) {
    if (std::isfinite(v) && v < fmin) {
      fmin = v;
    }
  }
  std::vector<double> result(f);
  if (!std::isfinite(fmin)) {
    return result;
  }
  for (auto &v : result) {
    v -= fmin;
  }
  return result;
}

} // namespace analysis
} // namespace enhsamp
